#include "ConfigLoader.h"
#include "JsonUtils.h"
#include <raylib.h>
#include <fstream>
#include <filesystem>
#include <algorithm>

namespace ConfigLoader {

    static std::string readFileText(const std::string& path, bool& ok) {
        ok = false;
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) return {};
        std::ifstream f(path, std::ios::binary);
        ok = (bool)f;
        if (!f) return {};
        std::string s;
        f.seekg(0, std::ios::end);
        std::streamoff size = f.tellg();
        if (size < 0) { ok = false; return {}; }
        s.resize((size_t)size);
        f.seekg(0, std::ios::beg);
        f.read(&s[0], (std::streamsize)s.size());
        ok = (bool)f || f.eof();
        return s;
    }

    template <typename T>
    static int clampField(const char* name, T& v, T lo, T hi) {
        T c = std::clamp(v, lo, hi);
        if (c == v) return 0;
        TraceLog(LOG_WARNING, "CONFIG: %s = %g out of range [%g, %g], using %g", name, (double)v, (double)lo, (double)hi, (double)c);
        v = c;
        return 1;
    }

    int sanitize(SimConfig& cfg) {
        int n = 0;
        n += clampField("stageScale", cfg.stageScale, 0.001f, 1000.0f);
        n += clampField("friction", cfg.friction, 0.0f, 2.0f);
        n += clampField("restitution", cfg.restitution, 0.0f, 1.0f);
        n += clampField("contactStiffness", cfg.contactStiffness, 1.0f, 1e12f);
        n += clampField("contactRelaxation", cfg.contactRelaxation, 0.0f, 100.0f);
        n += clampField("solverIterations", cfg.solverIterations, 1, 500);
        n += clampField("solverTolerance", cfg.solverTolerance, 0.0f, 1.0f);
        n += clampField("fixedTimeStep", cfg.fixedTimeStep, 1.0f / 1000.0f, 0.1f);
        n += clampField("maxSubSteps", cfg.maxSubSteps, 1, 100);
        n += clampField("maxFrameDelta", cfg.maxFrameDelta, 0.001f, 1.0f);
        n += clampField("dieMass", cfg.dieMass, 0.001f, 1000.0f);
        n += clampField("linearDamping", cfg.linearDamping, 0.0f, 1.0f);
        n += clampField("angularDamping", cfg.angularDamping, 0.0f, 1.0f);
        n += clampField("spinRange", cfg.spinRange, 0.0f, 1000.0f);
        n += clampField("launchJitter", cfg.launchJitter, 0.0f, 100.0f);
        n += clampField("sleepSpeedLimit", cfg.sleepSpeedLimit, 0.0f, 100.0f);
        n += clampField("sleepTimeLimit", cfg.sleepTimeLimit, 0.0f, 3600.0f);
        n += clampField("dieLifetime", cfg.dieLifetime, 0.1f, 86400.0f);
        n += clampField("clearance", cfg.clearance, 0.0f, 10.0f);
        n += clampField("exclusionFactor", cfg.exclusionFactor, 0.0f, 100.0f);
        n += clampField("dropMarginMin", cfg.dropMarginMin, 0.0f, 1000.0f);
        n += clampField("dropMarginScale", cfg.dropMarginScale, 0.0f, 1000.0f);
        n += clampField("aimFallbackDistance", cfg.aimFallbackDistance, 0.1f, 10000.0f);
        n += clampField("preRollSteps", cfg.preRollSteps, 0, 240);
        n += clampField("preRollStep", cfg.preRollStep, 1.0f / 1000.0f, 0.1f);
        n += clampField("windowWidth", cfg.windowWidth, 320, 8192);
        n += clampField("windowHeight", cfg.windowHeight, 240, 8192);
        return n;
    }

    int parseSimConfig(const std::string& text, SimConfig& cfg) {
        int applied = 0;
        auto str = [&](const char* key, std::string& out) { if (JsonUtils::findString(text, key, out)) ++applied; };
        auto num = [&](const char* key, float& out) { if (JsonUtils::findNumber(text, key, out)) ++applied; };
        auto integer = [&](const char* key, int& out) { if (JsonUtils::findInt(text, key, out)) ++applied; };
        auto flag = [&](const char* key, bool& out) { if (JsonUtils::findBool(text, key, out)) ++applied; };

        str("stageAsset", cfg.stageAsset);
        str("dieAsset", cfg.dieAsset);
        num("stageScale", cfg.stageScale);

        if (JsonUtils::findVec3(text, "gravity", cfg.gravity)) ++applied;
        else if (JsonUtils::hasKey(text, "gravity")) TraceLog(LOG_WARNING, "CONFIG: gravity must be an [x, y, z] array, keeping default");

        num("friction", cfg.friction);
        num("restitution", cfg.restitution);
        num("contactStiffness", cfg.contactStiffness);
        num("contactRelaxation", cfg.contactRelaxation);
        integer("solverIterations", cfg.solverIterations);
        num("solverTolerance", cfg.solverTolerance);

        num("fixedTimeStep", cfg.fixedTimeStep);
        integer("maxSubSteps", cfg.maxSubSteps);
        num("maxFrameDelta", cfg.maxFrameDelta);

        num("dieMass", cfg.dieMass);
        num("linearDamping", cfg.linearDamping);
        num("angularDamping", cfg.angularDamping);
        num("spinRange", cfg.spinRange);
        num("launchJitter", cfg.launchJitter);
        num("sleepSpeedLimit", cfg.sleepSpeedLimit);
        num("sleepTimeLimit", cfg.sleepTimeLimit);

        num("dieLifetime", cfg.dieLifetime);
        num("clearance", cfg.clearance);
        num("exclusionFactor", cfg.exclusionFactor);
        num("dropMarginMin", cfg.dropMarginMin);
        num("dropMarginScale", cfg.dropMarginScale);
        num("aimFallbackDistance", cfg.aimFallbackDistance);

        integer("preRollSteps", cfg.preRollSteps);
        num("preRollStep", cfg.preRollStep);

        flag("singleDiePolicy", cfg.singleDiePolicy);

        integer("windowWidth", cfg.windowWidth);
        integer("windowHeight", cfg.windowHeight);

        sanitize(cfg);
        return applied;
    }

    bool loadSimConfig(const std::string& path, SimConfig& cfg) {
        bool ok = false;
        std::string text = readFileText(path, ok);
        if (!ok) {
            TraceLog(LOG_ERROR, "CONFIG: Could not read '%s', using defaults", path.c_str());
            return false;
        }
        int applied = parseSimConfig(text, cfg);
        TraceLog(LOG_INFO, "CONFIG: Loaded '%s' (%d keys)", path.c_str(), applied);
        return true;
    }
}

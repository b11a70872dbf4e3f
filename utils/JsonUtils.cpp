#include "JsonUtils.h"
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace JsonUtils {

    static size_t findValueStart(const std::string& json, const char* key) {
        std::string k = std::string("\"") + key + "\"";
        size_t p = json.find(k);
        if (p == std::string::npos) return std::string::npos;
        p = json.find(':', p + k.size());
        if (p == std::string::npos) return std::string::npos;
        ++p;
        while (p < json.size() && std::isspace((unsigned char)json[p])) ++p;
        return p;
    }

    static bool parseFloatAt(const std::string& json, size_t& p, float& out) {
        size_t e = p;
        while (e < json.size()) {
            char c = json[e];
            if (!(std::isdigit((unsigned char)c) || c == '-' || c == '+' || c == '.' || c == 'e' || c == 'E')) break;
            ++e;
        }
        if (e == p) return false;
        std::string token = json.substr(p, e - p);
        char* end = nullptr;
        errno = 0;
        float v = std::strtof(token.c_str(), &end);
        if (end != token.c_str() + token.size() || errno == ERANGE || !std::isfinite(v)) return false;
        out = v;
        p = e;
        return true;
    }

    bool hasKey(const std::string& json, const char* key) {
        return findValueStart(json, key) != std::string::npos;
    }

    bool findBool(const std::string& json, const char* key, bool& out) {
        size_t p = findValueStart(json, key);
        if (p == std::string::npos) return false;
        if (json.compare(p, 4, "true") == 0) { out = true; return true; }
        if (json.compare(p, 5, "false") == 0) { out = false; return true; }
        return false;
    }

    bool findString(const std::string& json, const char* key, std::string& out) {
        size_t p = findValueStart(json, key);
        if (p == std::string::npos) return false;
        if (p >= json.size() || json[p] != '"') return false;
        ++p;
        size_t e = p;
        while (e < json.size() && json[e] != '"') ++e;
        if (e >= json.size()) return false;
        out = json.substr(p, e - p);
        return true;
    }

    bool findNumber(const std::string& json, const char* key, float& out) {
        size_t p = findValueStart(json, key);
        if (p == std::string::npos) return false;
        return parseFloatAt(json, p, out);
    }

    bool findInt(const std::string& json, const char* key, int& out) {
        float v = 0.0f;
        if (!findNumber(json, key, v)) return false;
        if (std::fabs(v) > 1e9f) return false;
        out = (int)std::lround(v);
        return true;
    }

    bool findVec3(const std::string& json, const char* key, Vec3& out) {
        size_t p = findValueStart(json, key);
        if (p == std::string::npos) return false;
        if (p >= json.size() || json[p] != '[') return false;
        ++p;

        float c[3] = {0.0f, 0.0f, 0.0f};
        for (int i = 0; i < 3; ++i) {
            while (p < json.size() && std::isspace((unsigned char)json[p])) ++p;
            if (!parseFloatAt(json, p, c[i])) return false;
            while (p < json.size() && std::isspace((unsigned char)json[p])) ++p;
            if (i < 2) {
                if (p >= json.size() || json[p] != ',') return false;
                ++p;
            }
        }
        if (p >= json.size() || json[p] != ']') return false;

        out = {c[0], c[1], c[2]};
        return true;
    }
}

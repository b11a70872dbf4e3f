#include "render/ModelLoader.h"
#include "render/Renderer.h"
#include "sim/DiceSession.h"
#include "sim/SimConfig.h"
#include "ui/UI.h"
#include "utils/ConfigLoader.h"

#include <chrono>
#include <raylib.h>
#include <cstdio>
#include <deque>
#include <random>
#include <string>
#include <unordered_map>
#include <utility>

static float getDeltaTime() {
    using clock = std::chrono::high_resolution_clock;
    static auto last = clock::now();
    auto now = clock::now();
    std::chrono::duration<float> dt = now - last;
    last = now;
    return dt.count();
}

enum class AssetRole {
    Stage,
    Die,
};

struct PendingLoad {
    std::string path;
    int modelId = -1;
    AssetRole role = AssetRole::Stage;
};

static Color stateColor(AssetState s) {
    switch (s) {
        case AssetState::Ready: return Color{120, 220, 120, 255};
        case AssetState::Failed: return Color{235, 90, 90, 255};
        case AssetState::Loading: return Color{235, 200, 90, 255};
        default: return Color{170, 170, 170, 255};
    }
}

int main(int argc, char** argv) {
    const std::string configPath = (argc > 1) ? argv[1] : "config/dice.json";

    SimConfig config;
    if (!ConfigLoader::loadSimConfig(configPath, config)) {
        TraceLog(LOG_WARNING, "CONFIG: Using built-in defaults");
    }

    std::random_device rd;
    std::mt19937 rng(rd());

    Renderer renderer;
    if (!renderer.init(config.windowWidth, config.windowHeight, "Dice Stage")) return -1;

    DiceSession session(config);

    constexpr int kStageModelId = 0;
    constexpr int kDieModelId = 1;
    std::unordered_map<int, Model> models;

    std::deque<PendingLoad> loads;
    loads.push_back({config.stageAsset, kStageModelId, AssetRole::Stage});
    loads.push_back({config.dieAsset, kDieModelId, AssetRole::Die});
    session.markStageLoading();
    session.markDieLoading();

    bool pendingRoll = false;

    SetExitKey(0);

    while (!WindowShouldClose()) {
        // One asset per frame keeps the first frames responsive.
        if (!loads.empty()) {
            PendingLoad job = loads.front();
            loads.pop_front();

            Model model = { 0 };
            SceneAsset asset;
            std::string error;
            const bool ok = ModelLoader::load(job.path, job.modelId, model, asset, error);
            if (ok) models[job.modelId] = model;

            if (job.role == AssetRole::Stage) {
                if (ok && session.stageLoaded(std::move(asset))) {
                    renderer.frameBounds(session.stageMetrics().bounds);
                } else if (!ok) {
                    session.stageFailed(error);
                }
            } else {
                if (ok) session.dieTemplateLoaded(asset);
                else session.dieTemplateFailed(error);
            }
        }

        if (IsKeyPressed(KEY_R)) {
            session.clear();
        }

        const bool keyRoll = IsKeyPressed(KEY_SPACE);
        if (keyRoll || pendingRoll) {
            Vector2 center = {GetScreenWidth() * 0.5f, GetScreenHeight() * 0.5f};
            Renderer::AimRay ray = renderer.getAimRay(center);
            session.roll(ray.origin, ray.direction, rng);
            pendingRoll = false;
        } else if (IsMouseButtonPressed(MOUSE_BUTTON_LEFT) && !UI::isBlocked()) {
            Renderer::AimRay ray = renderer.getAimRay(GetMousePosition());
            session.roll(ray.origin, ray.direction, rng);
        }

        float frameTime = getDeltaTime();
        FrameReport report = session.frame(frameTime);

        renderer.beginFrame();
        {
            auto stageIt = models.find(kStageModelId);
            if (stageIt != models.end() && session.stageSlot().isReady()) {
                renderer.drawStage(stageIt->second, config.stageScale);
            }
            for (const VisualNode& node : session.scene().all()) {
                auto it = models.find(node.modelId);
                if (it != models.end()) renderer.drawDie(it->second, node);
            }
        }
        renderer.end3D();

        UI::beginFrame();
        {
            Rectangle panel = {10.0f, 10.0f, 300.0f, 176.0f};
            UI::Panel(panel);
            renderer.setUiBlockRect(panel);

            float x = panel.x + 12.0f;
            float y = panel.y + 10.0f;
            char buf[128];

            snprintf(buf, sizeof(buf), "Stage: %s", assetStateName(session.stageSlot().state()));
            UI::Label(x, y, buf, 18, stateColor(session.stageSlot().state()));
            y += 22.0f;
            snprintf(buf, sizeof(buf), "Die:   %s", assetStateName(session.dieSlot().state()));
            UI::Label(x, y, buf, 18, stateColor(session.dieSlot().state()));
            y += 22.0f;
            snprintf(buf, sizeof(buf), "Dice: %d   Steps: %d", report.liveDice, report.substeps);
            UI::Label(x, y, buf, 18, RAYWHITE);
            y += 22.0f;
            const PhysicsWorld& world = session.world();
            snprintf(buf, sizeof(buf), "Step %.2f ms  iters %d  contacts %d",
                     world.perf.stepMs, world.perf.solverIterationsUsed, world.perf.manifolds);
            UI::Label(x, y, buf, 14, Color{170, 170, 170, 255});
            y += 22.0f;

            if (UI::Button({x, y, panel.width - 24.0f, 28.0f}, "Roll")) {
                pendingRoll = true;
            }
            y += 36.0f;
            UI::Label(x, y, "Click/Space roll, R clear, RMB orbit", 14, Color{170, 170, 170, 255});
        }

        renderer.endFrame();
    }

    session.clear();
    for (auto& kv : models) UnloadModel(kv.second);
    models.clear();
    renderer.shutdown();
    return 0;
}

#pragma once

#include "../physics/PhysicsWorld.h"
#include "../physics/PhysicsFactory.h"
#include "../scene/AssetSlot.h"
#include "../scene/SceneAsset.h"
#include "../scene/VisualNode.h"
#include "DiceLifecycle.h"
#include "DieInstance.h"
#include "SimConfig.h"
#include "StageCollider.h"

#include <list>
#include <random>
#include <string>

// What one call to DiceSession::frame did.
struct FrameReport {
    float clampedDt = 0.0f;
    int substeps = 0;
    int expired = 0;
    int liveDice = 0;
    double now = 0.0;
};

// Owns every piece of mutable simulation state for one run of the app:
// physics world, body storage, stage and die readiness, live dice and the
// session clock. Everything runs on the caller's thread.
class DiceSession {
public:
    explicit DiceSession(const SimConfig& config);
    DiceSession(const DiceSession&) = delete;
    DiceSession& operator=(const DiceSession&) = delete;

    void markStageLoading();
    void markDieLoading();

    // Scales the stage, builds its colliders and records its metrics.
    bool stageLoaded(SceneAsset stage);
    void stageFailed(const std::string& error);

    // Measures the die model and caches its size for every later spawn.
    bool dieTemplateLoaded(const SceneAsset& die);
    void dieTemplateFailed(const std::string& error);

    // Spawns one die where the ray meets the stage-top plane, dropped from
    // above. Clears existing dice first under the single-die policy.
    DieInstance* roll(const Vec3& rayOrigin, const Vec3& rayDir, std::mt19937& rng);

    // Places a die near the requested position without intersecting the
    // stage or other dice, then lets it settle for a few small steps.
    DieInstance* spawnAt(const Vec3& requested, const Quat& orientation, const Vec3& velocity, std::mt19937& rng);

    int clear();

    // Per-frame driver: clamp, step, expire, sync visuals.
    FrameReport frame(float elapsedWall);

    const SimConfig& config() const { return cfg; }
    PhysicsWorld& world() { return physics; }
    const PhysicsWorld& world() const { return physics; }
    const SceneGraph& scene() const { return visuals; }
    const std::list<DieInstance>& dice() const { return lifecycle.instances(); }
    const StageMetrics& stageMetrics() const { return metrics; }
    const StageBuildReport& stageReport() const { return report; }
    const AssetSlot<SceneAsset>& stageSlot() const { return stage; }
    const AssetSlot<DieTemplate>& dieSlot() const { return dieTemplate; }
    float stageTop() const { return metrics.top; }
    double now() const { return clock; }

private:
    SimConfig cfg;
    PhysicsWorld physics;
    std::list<RigidBody> bodyStorage;
    PhysicsFactory factory;
    SceneGraph visuals;
    DiceLifecycle lifecycle;

    AssetSlot<SceneAsset> stage;
    AssetSlot<DieTemplate> dieTemplate;
    StageMetrics metrics;
    StageBuildReport report;

    double clock = 0.0;
};

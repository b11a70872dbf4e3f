#include "DiceSession.h"
#include "Placement.h"

#include <raylib.h>

#include <algorithm>
#include <cmath>
#include <utility>

DiceSession::DiceSession(const SimConfig& config)
    : cfg(config), factory(physics, bodyStorage), lifecycle(factory, visuals, cfg) {
    physics.gravity = cfg.gravity;
    physics.contactMaterial.friction = cfg.friction;
    physics.contactMaterial.restitution = cfg.restitution;
    physics.contactMaterial.stiffness = cfg.contactStiffness;
    physics.contactMaterial.relaxation = cfg.contactRelaxation;
    physics.solverIterations = cfg.solverIterations;
    physics.solverTolerance = cfg.solverTolerance;
}

void DiceSession::markStageLoading() {
    stage.markLoading();
}

void DiceSession::markDieLoading() {
    dieTemplate.markLoading();
}

bool DiceSession::stageLoaded(SceneAsset asset) {
    if (stage.isFinal()) {
        TraceLog(LOG_WARNING, "STAGE: Ignoring second stage delivery '%s'", asset.source.c_str());
        return false;
    }

    asset.applyRootScale(cfg.stageScale);
    report = StageCollider::build(asset, factory, metrics);
    TraceLog(LOG_INFO, "STAGE: Loaded '%s' (%d meshes), bounds (%.2f, %.2f, %.2f) - (%.2f, %.2f, %.2f)",
             asset.source.c_str(), (int)asset.meshes.size(),
             metrics.bounds.min.x, metrics.bounds.min.y, metrics.bounds.min.z,
             metrics.bounds.max.x, metrics.bounds.max.y, metrics.bounds.max.z);
    return stage.resolve(std::move(asset));
}

void DiceSession::stageFailed(const std::string& error) {
    TraceLog(LOG_ERROR, "STAGE: Failed to load stage: %s", error.c_str());
    stage.fail(error);
}

bool DiceSession::dieTemplateLoaded(const SceneAsset& die) {
    if (dieTemplate.isFinal()) {
        TraceLog(LOG_WARNING, "DICE: Ignoring second die model delivery '%s'", die.source.c_str());
        return false;
    }

    DieTemplate tmpl;
    tmpl.modelId = die.modelId;

    Aabb bounds = die.worldBounds();
    Vec3 size = bounds.size();
    if (bounds.isEmpty() || !size.isFinite() || size.x <= 0.0f || size.y <= 0.0f || size.z <= 0.0f) {
        TraceLog(LOG_WARNING, "DICE: Die model '%s' has no usable bounds, using a unit cube", die.source.c_str());
        tmpl.size = {1.0f, 1.0f, 1.0f};
        tmpl.halfHeight = 0.5f;
        tmpl.centerOffset = {0.0f, 0.0f, 0.0f};
        tmpl.usedFallback = true;
    } else {
        tmpl.size = size;
        tmpl.halfHeight = size.y * 0.5f;
        tmpl.centerOffset = bounds.center();
    }

    TraceLog(LOG_INFO, "DICE: Die model ready, size (%.3f, %.3f, %.3f)", tmpl.size.x, tmpl.size.y, tmpl.size.z);
    return dieTemplate.resolve(tmpl);
}

void DiceSession::dieTemplateFailed(const std::string& error) {
    TraceLog(LOG_ERROR, "DICE: Failed to load die model: %s", error.c_str());
    dieTemplate.fail(error);
}

DieInstance* DiceSession::roll(const Vec3& rayOrigin, const Vec3& rayDir, std::mt19937& rng) {
    const DieTemplate* tmpl = dieTemplate.get();
    if (!tmpl) {
        TraceLog(LOG_WARNING, "DICE: Roll ignored, die model is %s", assetStateName(dieTemplate.state()));
        return nullptr;
    }

    if (cfg.singleDiePolicy) lifecycle.clearAll();

    const float planeY = metrics.top;
    const Vec3 target = Placement::aimTarget(rayOrigin, rayDir, planeY, cfg.aimFallbackDistance);
    const Vec3 pos = {target.x, Placement::dropHeight(planeY, tmpl->halfHeight, cfg.dropMarginMin, cfg.dropMarginScale), target.z};

    std::uniform_real_distribution<float> unit(0.0f, 1.0f);
    const Vec3 vel = {(unit(rng) - 0.5f) * cfg.launchJitter, 0.0f, (unit(rng) - 0.5f) * cfg.launchJitter};

    return spawnAt(pos, Quat::identity(), vel, rng);
}

DieInstance* DiceSession::spawnAt(const Vec3& requested, const Quat& orientation, const Vec3& velocity, std::mt19937& rng) {
    const DieTemplate* tmpl = dieTemplate.get();
    if (!tmpl) return lifecycle.spawn(nullptr, requested, orientation, velocity, clock, rng);

    const float radius = Placement::exclusionRadius(tmpl->size, cfg.exclusionFactor);
    const float floorY = Placement::effectiveFloor(requested, radius, metrics.top, lifecycle.instances());
    const Vec3 pos = Placement::resolveSpawn(requested, floorY, tmpl->halfHeight, cfg.clearance);

    DieInstance* die = lifecycle.spawn(tmpl, pos, orientation, velocity, clock, rng);
    if (!die) return nullptr;

    for (int i = 0; i < cfg.preRollSteps; ++i) {
        physics.step(cfg.preRollStep, cfg.preRollStep, 1);
    }
    if (Placement::clampAboveFloor(*die->body, floorY, tmpl->halfHeight, cfg.clearance)) {
        TraceLog(LOG_WARNING, "DICE: Die #%u sank below the floor while settling, lifted back", die->id);
    }
    lifecycle.syncVisuals();
    return die;
}

int DiceSession::clear() {
    return lifecycle.clearAll();
}

FrameReport DiceSession::frame(float elapsedWall) {
    FrameReport r;
    if (!std::isfinite(elapsedWall) || elapsedWall < 0.0f) elapsedWall = 0.0f;

    clock += elapsedWall;
    r.clampedDt = std::min(cfg.maxFrameDelta, elapsedWall);
    r.substeps = physics.step(cfg.fixedTimeStep, r.clampedDt, cfg.maxSubSteps);
    r.expired = lifecycle.expire(clock);
    lifecycle.syncVisuals();

    r.liveDice = (int)lifecycle.count();
    r.now = clock;
    return r;
}

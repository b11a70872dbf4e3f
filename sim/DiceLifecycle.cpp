#include "DiceLifecycle.h"
#include "../physics/PhysicsFactory.h"
#include "../scene/VisualNode.h"

#include <raylib.h>

DiceLifecycle::DiceLifecycle(PhysicsFactory& factory, SceneGraph& scene, const SimConfig& config)
    : factory(factory), scene(scene), config(config) {}

DieInstance* DiceLifecycle::spawn(const DieTemplate* tmpl, const Vec3& position, const Quat& orientation, const Vec3& velocity,
                                  double now, std::mt19937& rng) {
    if (!tmpl) {
        TraceLog(LOG_WARNING, "DICE: Die model not loaded yet, spawn ignored");
        return nullptr;
    }
    if (!position.isFinite()) {
        TraceLog(LOG_WARNING, "DICE: Non-finite spawn position, spawn ignored");
        return nullptr;
    }

    const Vec3 halfExtents = tmpl->size * 0.5f;

    BodySettings settings;
    settings.linearDamping = config.linearDamping;
    settings.angularDamping = config.angularDamping;
    settings.allowSleep = true;
    settings.sleepSpeedLimit = config.sleepSpeedLimit;
    settings.sleepTimeLimit = config.sleepTimeLimit;

    RigidBody* body = factory.CreateBox(position, halfExtents, settings, config.dieMass, false, velocity);
    body->orientation = orientation.normalized();

    std::uniform_real_distribution<float> unit(0.0f, 1.0f);
    body->angularVelocity = {
        (unit(rng) - 0.5f) * config.spinRange,
        (unit(rng) - 0.5f) * config.spinRange,
        (unit(rng) - 0.5f) * config.spinRange,
    };

    VisualNode node;
    node.modelId = tmpl->modelId;
    node.position = body->position;
    node.orientation = body->orientation;
    node.pivotOffset = -tmpl->centerOffset;
    VisualNode* visual = scene.add(node);

    DieInstance die;
    die.id = nextId++;
    die.body = body;
    die.visual = visual;
    die.bornAt = now;
    die.expiresAt = now + (double)config.dieLifetime;
    die.halfHeight = halfExtents.y;
    die.size = tmpl->size;
    die.spawnPosition = position;
    dice.push_back(die);

    TraceLog(LOG_INFO, "DICE: Spawned die #%u at (%.2f, %.2f, %.2f) vel (%.2f, %.2f, %.2f)", die.id,
             position.x, position.y, position.z, velocity.x, velocity.y, velocity.z);
    return &dice.back();
}

void DiceLifecycle::release(DieInstance& die, const char* reason) {
    if (die.body) factory.Destroy(die.body);
    if (die.visual) scene.remove(die.visual);
    TraceLog(LOG_INFO, "DICE: Removed die #%u (%s)", die.id, reason);
    die.body = nullptr;
    die.visual = nullptr;
}

int DiceLifecycle::clearAll() {
    int removed = 0;
    while (!dice.empty()) {
        release(dice.back(), "cleared");
        dice.pop_back();
        ++removed;
    }
    return removed;
}

int DiceLifecycle::expire(double now) {
    int removed = 0;
    for (auto it = dice.begin(); it != dice.end();) {
        if (now >= it->expiresAt) {
            release(*it, "expired");
            it = dice.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void DiceLifecycle::syncVisuals() {
    for (DieInstance& die : dice) {
        if (!die.body || !die.visual) continue;
        die.visual->position = die.body->position;
        die.visual->orientation = die.body->orientation;
    }
}

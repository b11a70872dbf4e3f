#pragma once

#include "../math/Vec3.h"
#include "../math/Quat.h"
#include "DieInstance.h"
#include "SimConfig.h"

#include <cstdint>
#include <list>
#include <random>

class PhysicsFactory;
class SceneGraph;

// Creates, ages out and removes dice. A die's body and visual always enter
// and leave together.
class DiceLifecycle {
public:
    DiceLifecycle(PhysicsFactory& factory, SceneGraph& scene, const SimConfig& config);

    // Returns nullptr (and logs) when tmpl is null, i.e. the die model is not ready.
    DieInstance* spawn(const DieTemplate* tmpl, const Vec3& position, const Quat& orientation, const Vec3& velocity,
                       double now, std::mt19937& rng);

    // Returns the number of dice removed.
    int clearAll();

    // Removes every die with now >= expiresAt. Returns the number removed.
    int expire(double now);

    // Copies each body transform onto its visual.
    void syncVisuals();

    const std::list<DieInstance>& instances() const { return dice; }
    std::list<DieInstance>& instances() { return dice; }
    size_t count() const { return dice.size(); }

private:
    PhysicsFactory& factory;
    SceneGraph& scene;
    const SimConfig& config;

    std::list<DieInstance> dice;
    uint32_t nextId = 1;

    void release(DieInstance& die, const char* reason);
};

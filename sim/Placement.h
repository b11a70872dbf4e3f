#pragma once

#include "../math/Vec3.h"
#include "DieInstance.h"

#include <list>

struct RigidBody;

namespace Placement {
    // Horizontal radius around a spawn target inside which other dice raise the floor.
    float exclusionRadius(const Vec3& dieSize, float factor);

    // Highest of the stage top and the tops of live dice closer than radius
    // (horizontally) to target.
    float effectiveFloor(const Vec3& target, float radius, float stageTop, const std::list<DieInstance>& dice);

    // Lowest centre height that keeps a die of this half-height clear of floorY.
    inline float minSafeY(float floorY, float halfHeight, float clearance) { return floorY + halfHeight + clearance; }

    // Keeps X/Z and lifts Y to the safe height when the request is lower.
    Vec3 resolveSpawn(const Vec3& requested, float floorY, float halfHeight, float clearance);

    // Aim point for a roll: ray against the plane y = planeY, with a fixed
    // standoff along the ray when it is parallel to or points away from it.
    Vec3 aimTarget(const Vec3& rayOrigin, const Vec3& rayDir, float planeY, float fallbackDistance);

    float dropHeight(float planeY, float halfHeight, float marginMin, float marginScale);

    // Puts a body that sank below floorY + halfHeight back at the safe
    // height and removes any downward velocity. Returns true if it moved.
    bool clampAboveFloor(RigidBody& body, float floorY, float halfHeight, float clearance);
}

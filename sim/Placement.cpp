#include "Placement.h"
#include "../physics/RigidBody.h"
#include "../physics/Raycast.h"

#include <algorithm>
#include <cmath>

namespace Placement {

    float exclusionRadius(const Vec3& dieSize, float factor) {
        return std::max(dieSize.x, dieSize.z) * factor;
    }

    float effectiveFloor(const Vec3& target, float radius, float stageTop, const std::list<DieInstance>& dice) {
        float highest = stageTop;
        for (const DieInstance& d : dice) {
            if (!d.body) continue;
            if (Vec3::horizontalDistance(d.body->position, target) >= radius) continue;
            float top = d.body->position.y + d.halfHeight;
            if (std::isfinite(top) && top > highest) highest = top;
        }
        return highest;
    }

    Vec3 resolveSpawn(const Vec3& requested, float floorY, float halfHeight, float clearance) {
        Vec3 out = requested;
        float safe = minSafeY(floorY, halfHeight, clearance);
        if (!std::isfinite(out.y) || out.y < safe) out.y = safe;
        return out;
    }

    Vec3 aimTarget(const Vec3& rayOrigin, const Vec3& rayDir, float planeY, float fallbackDistance) {
        return Raycast::pointOnPlaneOrAhead(rayOrigin, rayDir, planeY, fallbackDistance);
    }

    float dropHeight(float planeY, float halfHeight, float marginMin, float marginScale) {
        return planeY + halfHeight + std::max(marginMin, halfHeight * marginScale);
    }

    bool clampAboveFloor(RigidBody& body, float floorY, float halfHeight, float clearance) {
        if (body.position.y >= floorY + halfHeight) return false;
        body.position.y = minSafeY(floorY, halfHeight, clearance);
        if (body.velocity.y < 0.0f) body.velocity.y = 0.0f;
        return true;
    }
}

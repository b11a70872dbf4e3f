#pragma once
#include "../math/Vec3.h"

struct RayHit {
    bool hit = false;
    float t = 0.0f;
    Vec3 point = {0, 0, 0};
    Vec3 normal = {0, 1, 0};
};

namespace Raycast {
    // Rays with |dir.y| below this are treated as parallel to a horizontal plane.
    constexpr float parallelEpsilon = 1e-4f;

    RayHit rayHorizontalPlane(const Vec3& ro, const Vec3& rd, float planeY);

    // Point where the ray meets the plane y = planeY. A parallel ray, or one
    // pointing away from the plane, yields the point fallbackDistance along it.
    Vec3 pointOnPlaneOrAhead(const Vec3& ro, const Vec3& rd, float planeY, float fallbackDistance);
}

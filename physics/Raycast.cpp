#include "Raycast.h"
#include <cmath>

namespace Raycast {

    RayHit rayHorizontalPlane(const Vec3& ro, const Vec3& rd, float planeY) {
        RayHit out;
        if (!ro.isFinite() || !rd.isFinite()) return out;
        if (std::fabs(rd.y) < parallelEpsilon) return out;

        float t = (planeY - ro.y) / rd.y;
        if (!(t > 0.0f)) return out;

        out.hit = true;
        out.t = t;
        out.point = ro + rd * t;
        out.point.y = planeY;
        out.normal = (rd.y < 0.0f) ? Vec3{0.0f, 1.0f, 0.0f} : Vec3{0.0f, -1.0f, 0.0f};
        return out;
    }

    Vec3 pointOnPlaneOrAhead(const Vec3& ro, const Vec3& rd, float planeY, float fallbackDistance) {
        RayHit hit = rayHorizontalPlane(ro, rd, planeY);
        if (hit.hit) return hit.point;

        Vec3 dir = rd.normalized();
        if (dir.lengthSq() < 0.5f) return ro;
        return ro + dir * fallbackDistance;
    }
}

#pragma once

#include "Vec3.h"

#include <algorithm>

struct Aabb {
    Vec3 min;
    Vec3 max;

    bool isEmpty() const { return min.x > max.x || min.y > max.y || min.z > max.z; }
    Vec3 center() const { return (min + max) * 0.5f; }
    Vec3 size() const { return isEmpty() ? Vec3{0.0f, 0.0f, 0.0f} : (max - min); }
};

inline Aabb aabbEmpty() {
    Aabb a;
    a.min = {+1e30f, +1e30f, +1e30f};
    a.max = {-1e30f, -1e30f, -1e30f};
    return a;
}

inline void aabbExpand(Aabb& a, const Vec3& p) {
    a.min.x = std::min(a.min.x, p.x);
    a.min.y = std::min(a.min.y, p.y);
    a.min.z = std::min(a.min.z, p.z);
    a.max.x = std::max(a.max.x, p.x);
    a.max.y = std::max(a.max.y, p.y);
    a.max.z = std::max(a.max.z, p.z);
}

inline void aabbMerge(Aabb& a, const Aabb& b) {
    if (b.isEmpty()) return;
    aabbExpand(a, b.min);
    aabbExpand(a, b.max);
}

inline bool aabbOverlaps(const Aabb& a, const Aabb& b) {
    if (a.max.x < b.min.x || a.min.x > b.max.x) return false;
    if (a.max.y < b.min.y || a.min.y > b.max.y) return false;
    if (a.max.z < b.min.z || a.min.z > b.max.z) return false;
    return true;
}

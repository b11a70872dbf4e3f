#include "BroadPhase.h"
#include "collision/TriangleMesh.h"
#include <cmath>
#include <algorithm>

void BroadPhase::computeAabb(const RigidBody* b, Vec3& outMin, Vec3& outMax) {
    constexpr float inf = 1e30f;

    switch (b->collider.type) {
        case ColliderType::Box: {
            Vec3 he = b->collider.box.halfExtents;
            Vec3 ax = Vec3::abs(b->orientation.rotate({1.0f, 0.0f, 0.0f}));
            Vec3 ay = Vec3::abs(b->orientation.rotate({0.0f, 1.0f, 0.0f}));
            Vec3 az = Vec3::abs(b->orientation.rotate({0.0f, 0.0f, 1.0f}));
            Vec3 e{
                ax.x * he.x + ay.x * he.y + az.x * he.z,
                ax.y * he.x + ay.y * he.y + az.y * he.z,
                ax.z * he.x + ay.z * he.y + az.z * he.z,
            };
            outMin = b->position - e;
            outMax = b->position + e;
            break;
        }
        case ColliderType::Plane: {
            outMin = {-inf, -inf, -inf};
            outMax = {inf, inf, inf};
            // An upward-facing plane occupies everything below its surface.
            Vec3 n = b->orientation.rotate(b->collider.plane.normal);
            if (n.y > 0.999f) outMax.y = b->position.y;
            break;
        }
        case ColliderType::Mesh: {
            if (b->collider.mesh) {
                const TriangleMesh& mesh = *b->collider.mesh;
                Vec3 centerL = mesh.localCenter();
                Vec3 heL = mesh.localHalfExtents();

                Vec3 ax = Vec3::abs(b->orientation.rotate({1.0f, 0.0f, 0.0f}));
                Vec3 ay = Vec3::abs(b->orientation.rotate({0.0f, 1.0f, 0.0f}));
                Vec3 az = Vec3::abs(b->orientation.rotate({0.0f, 0.0f, 1.0f}));

                Vec3 e{
                    ax.x * heL.x + ay.x * heL.y + az.x * heL.z,
                    ax.y * heL.x + ay.y * heL.y + az.y * heL.z,
                    ax.z * heL.x + ay.z * heL.y + az.z * heL.z,
                };
                Vec3 centerW = b->orientation.rotate(centerL) + b->position;
                outMin = centerW - e;
                outMax = centerW + e;
            } else {
                outMin = b->position;
                outMax = b->position;
            }
            break;
        }
    }
}

void BroadPhase::build(const std::vector<RigidBody*>& bodies) {
    constexpr float broadphaseMargin = 0.01f;

    entries.clear();
    entries.reserve(bodies.size());
    for (RigidBody* body : bodies) {
        if (!body) continue;
        Vec3 mn, mx;
        computeAabb(body, mn, mx);
        Entry e;
        e.minX = mn.x - broadphaseMargin;
        e.maxX = mx.x + broadphaseMargin;
        e.minY = mn.y - broadphaseMargin;
        e.maxY = mx.y + broadphaseMargin;
        e.minZ = mn.z - broadphaseMargin;
        e.maxZ = mx.z + broadphaseMargin;
        e.body = body;
        entries.push_back(e);
    }

    std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) { return a.minX < b.minX; });

    pairs.clear();
    pairs.reserve(entries.size() * 2);

    activeList.clear();
    if (activeList.capacity() < 64) activeList.reserve(64);

    for (int i = 0; i < (int)entries.size(); ++i) {
        const Entry& cur = entries[i];
        RigidBody* bi = cur.body;
        int write = 0;
        for (int k = 0; k < (int)activeList.size(); ++k) {
            if (entries[activeList[k]].maxX >= cur.minX) { activeList[write++] = activeList[k]; }
        }
        activeList.resize(write);

        for (int idx : activeList) {
            const Entry& other = entries[idx];
            RigidBody* bj = other.body;
            if (bi == bj) continue;
            if (bi->isStatic && bj->isStatic) continue;
            if ((bi->sleeping || bi->isStatic) && (bj->sleeping || bj->isStatic)) continue;

            if (cur.maxY < other.minY || cur.minY > other.maxY) continue;
            if (cur.maxZ < other.minZ || cur.minZ > other.maxZ) continue;

            pairs.push_back({bi, bj});
        }

        activeList.push_back(i);
    }
}

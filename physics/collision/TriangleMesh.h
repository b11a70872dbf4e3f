#pragma once

#include "../../math/Vec3.h"
#include "../../math/Aabb.h"

#include <cstdint>
#include <vector>
#include <algorithm>
#include <cmath>

struct TriangleMeshTri {
    uint32_t a = 0;
    uint32_t b = 0;
    uint32_t c = 0;
};

struct TriangleMeshBvhNode {
    Aabb bounds;
    int left = -1;
    int right = -1;
    uint32_t start = 0;
    uint32_t count = 0;

    bool isLeaf() const { return left < 0 && right < 0; }
};

// Static triangle soup with a BVH over its triangles. Vertices are stored in the
// owning body's local space; stage meshes are baked to world space so their
// body transform is identity.
struct TriangleMesh {
    enum class BuildResult {
        Ok,
        Empty,
        BadIndexCount,
        IndexOutOfRange,
        NonFinite,
        Degenerate,
    };

    std::vector<Vec3> vertices;
    std::vector<TriangleMeshTri> tris;

    Aabb localBounds = aabbEmpty();
    float boundRadius = 0.0f;
    uint32_t skippedDegenerate = 0;

    std::vector<uint32_t> triOrder;
    std::vector<TriangleMeshBvhNode> nodes;

    // Triangles with (near) zero area are dropped; the build fails only when none survive.
    BuildResult build(const std::vector<Vec3>& verts, const std::vector<uint32_t>& indices, int leafTriCount = 4);
    void queryAabb(const Vec3& qMin, const Vec3& qMax, std::vector<uint32_t>& outTriIds, uint32_t maxOut = 4096) const;

    Vec3 localCenter() const { return (localBounds.min + localBounds.max) * 0.5f; }
    Vec3 localHalfExtents() const { return (localBounds.max - localBounds.min) * 0.5f; }

    static const char* describe(BuildResult r);

private:
    int buildNode(std::vector<uint32_t>& triIds, uint32_t begin, uint32_t end, int leafTriCount,
                  const std::vector<Aabb>& triAabbs, const std::vector<Vec3>& triCentroids);
};

#include "TriangleMesh.h"

static Aabb triAabb(const Vec3& a, const Vec3& b, const Vec3& c) {
    Aabb out = aabbEmpty();
    aabbExpand(out, a);
    aabbExpand(out, b);
    aabbExpand(out, c);
    return out;
}

static Vec3 triCentroid(const Vec3& a, const Vec3& b, const Vec3& c) { return (a + b + c) * (1.0f / 3.0f); }

static int longestAxis(const Aabb& b) {
    Vec3 e = b.max - b.min;
    if (e.x >= e.y && e.x >= e.z) return 0;
    if (e.y >= e.x && e.y >= e.z) return 1;
    return 2;
}

static float axisValue(const Vec3& v, int axis) {
    return (axis == 0) ? v.x : (axis == 1 ? v.y : v.z);
}

const char* TriangleMesh::describe(BuildResult r) {
    switch (r) {
        case BuildResult::Ok: return "ok";
        case BuildResult::Empty: return "no vertices or triangles";
        case BuildResult::BadIndexCount: return "index count is not a multiple of 3";
        case BuildResult::IndexOutOfRange: return "triangle index out of range";
        case BuildResult::NonFinite: return "non-finite vertex position";
        case BuildResult::Degenerate: return "all triangles are degenerate";
    }
    return "unknown";
}

int TriangleMesh::buildNode(std::vector<uint32_t>& triIds, uint32_t begin, uint32_t end, int leafTriCount,
                            const std::vector<Aabb>& triAabbs, const std::vector<Vec3>& triCentroids) {
    TriangleMeshBvhNode node;
    node.bounds = aabbEmpty();
    for (uint32_t i = begin; i < end; ++i) aabbMerge(node.bounds, triAabbs[triIds[i]]);

    const uint32_t count = end - begin;
    if (count <= (uint32_t)std::max(1, leafTriCount)) {
        node.start = (uint32_t)triOrder.size();
        node.count = count;
        for (uint32_t i = begin; i < end; ++i) triOrder.push_back(triIds[i]);
        nodes.push_back(node);
        return (int)nodes.size() - 1;
    }

    Aabb centroidBounds = aabbEmpty();
    for (uint32_t i = begin; i < end; ++i) aabbExpand(centroidBounds, triCentroids[triIds[i]]);

    const int axis = longestAxis(centroidBounds);
    const float split = 0.5f * (axisValue(centroidBounds.min, axis) + axisValue(centroidBounds.max, axis));

    uint32_t mid = begin;
    for (uint32_t i = begin; i < end; ++i) {
        if (axisValue(triCentroids[triIds[i]], axis) < split) {
            std::swap(triIds[i], triIds[mid]);
            ++mid;
        }
    }

    // All centroids on one side of the midpoint: fall back to a median split.
    if (mid == begin || mid == end) {
        mid = begin + count / 2;
        std::nth_element(triIds.begin() + begin, triIds.begin() + mid, triIds.begin() + end,
                         [&](uint32_t a, uint32_t b) { return axisValue(triCentroids[a], axis) < axisValue(triCentroids[b], axis); });
    }

    const int idx = (int)nodes.size();
    nodes.push_back(node);

    const int left = buildNode(triIds, begin, mid, leafTriCount, triAabbs, triCentroids);
    const int right = buildNode(triIds, mid, end, leafTriCount, triAabbs, triCentroids);
    nodes[idx].left = left;
    nodes[idx].right = right;
    return idx;
}

TriangleMesh::BuildResult TriangleMesh::build(const std::vector<Vec3>& verts, const std::vector<uint32_t>& indices, int leafTriCount) {
    vertices.clear();
    tris.clear();
    triOrder.clear();
    nodes.clear();
    localBounds = aabbEmpty();
    boundRadius = 0.0f;
    skippedDegenerate = 0;

    if (verts.empty() || indices.empty()) return BuildResult::Empty;
    if (indices.size() % 3 != 0) return BuildResult::BadIndexCount;
    for (const Vec3& v : verts) {
        if (!v.isFinite()) return BuildResult::NonFinite;
    }
    for (uint32_t i : indices) {
        if (i >= verts.size()) return BuildResult::IndexOutOfRange;
    }

    vertices = verts;

    const uint32_t triCount = (uint32_t)(indices.size() / 3);
    tris.reserve(triCount);

    std::vector<Aabb> triAabbs;
    std::vector<Vec3> triCentroids;
    triAabbs.reserve(triCount);
    triCentroids.reserve(triCount);

    for (uint32_t i = 0; i < triCount; ++i) {
        TriangleMeshTri t;
        t.a = indices[i * 3 + 0];
        t.b = indices[i * 3 + 1];
        t.c = indices[i * 3 + 2];
        const Vec3& A = vertices[t.a];
        const Vec3& B = vertices[t.b];
        const Vec3& C = vertices[t.c];
        if (Vec3::cross(B - A, C - A).lengthSq() < 1e-14f) {
            ++skippedDegenerate;
            continue;
        }
        tris.push_back(t);
        triAabbs.push_back(triAabb(A, B, C));
        triCentroids.push_back(triCentroid(A, B, C));
    }

    if (tris.empty()) {
        vertices.clear();
        return BuildResult::Degenerate;
    }

    for (const TriangleMeshTri& t : tris) {
        aabbExpand(localBounds, vertices[t.a]);
        aabbExpand(localBounds, vertices[t.b]);
        aabbExpand(localBounds, vertices[t.c]);
    }

    const Vec3 c = localCenter();
    float r2 = 0.0f;
    for (const Vec3& v : vertices) r2 = std::max(r2, (v - c).lengthSq());
    boundRadius = std::sqrt(r2);

    std::vector<uint32_t> triIds(tris.size());
    for (uint32_t i = 0; i < (uint32_t)triIds.size(); ++i) triIds[i] = i;

    triOrder.reserve(tris.size());
    nodes.reserve(tris.size() * 2);
    buildNode(triIds, 0, (uint32_t)triIds.size(), leafTriCount, triAabbs, triCentroids);
    return BuildResult::Ok;
}

void TriangleMesh::queryAabb(const Vec3& qMin, const Vec3& qMax, std::vector<uint32_t>& outTriIds, uint32_t maxOut) const {
    outTriIds.clear();
    if (nodes.empty() || tris.empty()) return;

    Aabb q;
    q.min = qMin;
    q.max = qMax;

    std::vector<int> stack;
    stack.reserve(64);
    stack.push_back(0);

    while (!stack.empty() && outTriIds.size() < maxOut) {
        const int ni = stack.back();
        stack.pop_back();
        if (ni < 0 || ni >= (int)nodes.size()) continue;

        const TriangleMeshBvhNode& n = nodes[ni];
        if (!aabbOverlaps(n.bounds, q)) continue;

        if (n.isLeaf()) {
            for (uint32_t i = 0; i < n.count && outTriIds.size() < maxOut; ++i) {
                outTriIds.push_back(triOrder[n.start + i]);
            }
        } else {
            if (n.left >= 0) stack.push_back(n.left);
            if (n.right >= 0) stack.push_back(n.right);
        }
    }
}

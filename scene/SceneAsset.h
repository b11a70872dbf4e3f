#pragma once

#include "../math/Vec3.h"
#include "../math/Mat4.h"
#include "../math/Aabb.h"

#include <cstdint>
#include <string>
#include <vector>

// One triangle-list mesh with its accumulated world matrix. Positions are in
// mesh-local space; indices may be empty for a non-indexed list.
struct MeshNode {
    std::string name;
    std::vector<Vec3> positions;
    std::vector<uint32_t> indices;
    Mat4 world;

    bool isIndexed() const { return !indices.empty(); }
    size_t triangleCount() const { return isIndexed() ? indices.size() / 3 : positions.size() / 3; }
};

// A loaded model as a flat list of mesh nodes. modelId lets the renderer find
// its own GPU copy; the simulation never interprets it.
struct SceneAsset {
    std::string source;
    int modelId = -1;
    std::vector<MeshNode> meshes;

    // Bounds of every mesh vertex after its world matrix.
    Aabb worldBounds() const {
        Aabb out = aabbEmpty();
        for (const MeshNode& node : meshes) {
            for (const Vec3& p : node.positions) {
                Vec3 w = node.world.transformPoint(p);
                if (w.isFinite()) aabbExpand(out, w);
            }
        }
        return out;
    }

    // Applies a uniform scale about the origin on top of every mesh's world matrix.
    void applyRootScale(float s) {
        const Mat4 scale = Mat4::scale(s);
        for (MeshNode& node : meshes) node.world = scale * node.world;
    }
};

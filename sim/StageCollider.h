#pragma once

#include "../math/Aabb.h"
#include "../physics/collision/TriangleMesh.h"
#include "../scene/SceneAsset.h"

#include <string>
#include <vector>

class PhysicsFactory;
struct RigidBody;

// Derived once after the stage loads; read-only afterwards.
struct StageMetrics {
    bool valid = false;
    float top = 0.0f;
    Aabb bounds = aabbEmpty();
};

struct StageBuildReport {
    int meshesTotal = 0;
    int meshesBuilt = 0;
    int meshesSkipped = 0;
    int trianglesBuilt = 0;
    std::vector<RigidBody*> meshBodies;
    RigidBody* fallbackPlane = nullptr;
    // One entry per skipped mesh: "<name>: <reason>".
    std::vector<std::string> skipped;
};

namespace StageCollider {
    // Expands the node into an unshared world-space triangle list, three
    // vertices per triangle, in index order.
    TriangleMesh::BuildResult flattenToWorld(const MeshNode& node, std::vector<Vec3>& outVerts);

    StageMetrics measure(const SceneAsset& stage);

    // Adds one static mesh body per buildable mesh and always one upward
    // plane at the stage top. A mesh that fails to build is logged and skipped.
    StageBuildReport build(const SceneAsset& stage, PhysicsFactory& factory, StageMetrics& outMetrics);
}

#include "StageCollider.h"
#include "../physics/PhysicsFactory.h"

#include <raylib.h>
#include <memory>

namespace StageCollider {

    TriangleMesh::BuildResult flattenToWorld(const MeshNode& node, std::vector<Vec3>& outVerts) {
        outVerts.clear();
        if (node.positions.empty()) return TriangleMesh::BuildResult::Empty;

        if (node.isIndexed()) {
            if (node.indices.size() % 3 != 0) return TriangleMesh::BuildResult::BadIndexCount;
            outVerts.reserve(node.indices.size());
            for (uint32_t idx : node.indices) {
                if (idx >= node.positions.size()) {
                    outVerts.clear();
                    return TriangleMesh::BuildResult::IndexOutOfRange;
                }
                outVerts.push_back(node.world.transformPoint(node.positions[idx]));
            }
        } else {
            if (node.positions.size() % 3 != 0) return TriangleMesh::BuildResult::BadIndexCount;
            outVerts.reserve(node.positions.size());
            for (const Vec3& p : node.positions) outVerts.push_back(node.world.transformPoint(p));
        }
        return TriangleMesh::BuildResult::Ok;
    }

    StageMetrics measure(const SceneAsset& stage) {
        StageMetrics m;
        m.bounds = stage.worldBounds();
        m.valid = !m.bounds.isEmpty();
        m.top = m.valid ? m.bounds.max.y : 0.0f;
        return m;
    }

    StageBuildReport build(const SceneAsset& stage, PhysicsFactory& factory, StageMetrics& outMetrics) {
        StageBuildReport report;
        outMetrics = measure(stage);
        if (!outMetrics.valid) {
            TraceLog(LOG_WARNING, "STAGE: '%s' has no measurable geometry, floor placed at y=0", stage.source.c_str());
        }

        std::vector<Vec3> flat;
        std::vector<uint32_t> seq;
        for (const MeshNode& node : stage.meshes) {
            ++report.meshesTotal;

            TriangleMesh::BuildResult result = flattenToWorld(node, flat);
            auto mesh = std::make_shared<TriangleMesh>();
            if (result == TriangleMesh::BuildResult::Ok) {
                seq.resize(flat.size());
                for (uint32_t i = 0; i < (uint32_t)seq.size(); ++i) seq[i] = i;
                result = mesh->build(flat, seq);
            }

            if (result != TriangleMesh::BuildResult::Ok) {
                ++report.meshesSkipped;
                report.skipped.push_back(node.name + ": " + TriangleMesh::describe(result));
                TraceLog(LOG_WARNING, "STAGE: Skipping collider for mesh '%s': %s", node.name.c_str(), TriangleMesh::describe(result));
                continue;
            }

            RigidBody* body = factory.CreateMesh({0.0f, 0.0f, 0.0f}, mesh);
            if (!body) {
                ++report.meshesSkipped;
                report.skipped.push_back(node.name + ": body creation failed");
                TraceLog(LOG_WARNING, "STAGE: Skipping collider for mesh '%s': body creation failed", node.name.c_str());
                continue;
            }
            ++report.meshesBuilt;
            report.trianglesBuilt += (int)mesh->tris.size();
            report.meshBodies.push_back(body);
        }

        report.fallbackPlane = factory.CreatePlane({0.0f, outMetrics.top, 0.0f}, {0.0f, 1.0f, 0.0f});

        TraceLog(LOG_INFO, "STAGE: Built %d/%d mesh colliders (%d triangles), top at y=%.3f",
                 report.meshesBuilt, report.meshesTotal, report.trianglesBuilt, outMetrics.top);
        return report;
    }
}

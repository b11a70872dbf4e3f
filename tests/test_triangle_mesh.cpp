// Unit tests for TriangleMesh build validation and BVH queries
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <algorithm>
#include <cmath>
#include <string>
#include <limits>
#include <vector>

#include "physics/collision/TriangleMesh.h"

using Catch::Approx;

static std::vector<Vec3> quadVerts() {
    return {{-1, 0, -1}, {1, 0, -1}, {1, 0, 1}, {-1, 0, 1}};
}

TEST_CASE("Quad builds with bounds and a BVH", "[mesh]") {
    TriangleMesh mesh;
    REQUIRE(mesh.build(quadVerts(), {0, 2, 1, 0, 3, 2}) == TriangleMesh::BuildResult::Ok);

    CHECK(mesh.tris.size() == 2);
    CHECK(mesh.skippedDegenerate == 0);
    CHECK_FALSE(mesh.nodes.empty());
    CHECK(mesh.localBounds.min.x == Approx(-1.0f));
    CHECK(mesh.localBounds.max.z == Approx(1.0f));
    CHECK(mesh.localBounds.max.y == Approx(0.0f));
    CHECK(mesh.boundRadius > 0.0f);
}

TEST_CASE("Invalid input is reported, not built", "[mesh]") {
    TriangleMesh mesh;

    CHECK(mesh.build({}, {}) == TriangleMesh::BuildResult::Empty);
    CHECK(mesh.build(quadVerts(), {0, 1}) == TriangleMesh::BuildResult::BadIndexCount);
    CHECK(mesh.build(quadVerts(), {0, 1, 7}) == TriangleMesh::BuildResult::IndexOutOfRange);

    std::vector<Vec3> bad = quadVerts();
    bad[2].y = std::numeric_limits<float>::quiet_NaN();
    CHECK(mesh.build(bad, {0, 1, 2}) == TriangleMesh::BuildResult::NonFinite);

    // Three collinear points have no area.
    std::vector<Vec3> line = {{0, 0, 0}, {1, 0, 0}, {2, 0, 0}};
    CHECK(mesh.build(line, {0, 1, 2}) == TriangleMesh::BuildResult::Degenerate);
    CHECK(mesh.tris.empty());
}

TEST_CASE("Degenerate triangles are dropped from an otherwise valid mesh", "[mesh]") {
    std::vector<Vec3> verts = quadVerts();
    verts.push_back({5, 0, 5});

    TriangleMesh mesh;
    REQUIRE(mesh.build(verts, {0, 2, 1, 4, 4, 4, 0, 3, 2}) == TriangleMesh::BuildResult::Ok);
    CHECK(mesh.tris.size() == 2);
    CHECK(mesh.skippedDegenerate == 1);
}

TEST_CASE("AABB query finds only nearby triangles", "[mesh][bvh]") {
    // A row of 16 separate unit quads along X.
    std::vector<Vec3> verts;
    std::vector<uint32_t> idx;
    for (int i = 0; i < 16; ++i) {
        uint32_t base = (uint32_t)verts.size();
        float x = (float)i * 3.0f;
        verts.push_back({x, 0, 0});
        verts.push_back({x + 1, 0, 0});
        verts.push_back({x + 1, 0, 1});
        verts.push_back({x, 0, 1});
        idx.insert(idx.end(), {base, base + 2, base + 1, base, base + 3, base + 2});
    }

    TriangleMesh mesh;
    REQUIRE(mesh.build(verts, idx, 2) == TriangleMesh::BuildResult::Ok);
    CHECK(mesh.nodes.size() > 1);

    std::vector<uint32_t> hits;
    mesh.queryAabb({9.2f, -0.5f, 0.2f}, {9.8f, 0.5f, 0.8f}, hits);
    // Leaves may carry a neighbour along, but never the far end of the row.
    CHECK(std::find(hits.begin(), hits.end(), 6u) != hits.end());
    CHECK(std::find(hits.begin(), hits.end(), 7u) != hits.end());
    CHECK(hits.size() < 8);
    for (uint32_t t : hits) {
        const Vec3& a = mesh.vertices[mesh.tris[t].a];
        CHECK(std::fabs(a.x - 9.0f) <= 6.0f);
    }

    hits.clear();
    mesh.queryAabb({100, -1, -1}, {101, 1, 1}, hits);
    CHECK(hits.empty());
}

TEST_CASE("BuildResult has a readable description", "[mesh]") {
    CHECK(std::string(TriangleMesh::describe(TriangleMesh::BuildResult::IndexOutOfRange)) == "triangle index out of range");
    CHECK(std::string(TriangleMesh::describe(TriangleMesh::BuildResult::Ok)) == "ok");
}

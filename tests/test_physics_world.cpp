// Unit tests for PhysicsWorld stepping, contacts and sleep
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cmath>
#include <list>
#include <memory>

#include "TestScenes.h"
#include "physics/BroadPhase.h"
#include "physics/PhysicsFactory.h"
#include "physics/PhysicsWorld.h"

using Catch::Approx;

namespace {

struct WorldFixture {
    PhysicsWorld world;
    std::list<RigidBody> storage;
    PhysicsFactory factory{world, storage};

    BodySettings dieSettings() const {
        BodySettings s;
        s.linearDamping = 0.08f;
        s.angularDamping = 0.07f;
        s.allowSleep = true;
        s.sleepSpeedLimit = 0.2f;
        s.sleepTimeLimit = 1.0f;
        return s;
    }

    void run(float seconds, float dt = 1.0f / 60.0f) {
        int n = (int)std::lround(seconds / dt);
        for (int i = 0; i < n; ++i) world.stepFixed(dt);
    }
};

}

TEST_CASE("Accumulator steps in fixed increments and caps substeps", "[world][step]") {
    PhysicsWorld world;
    const float h = 1.0f / 60.0f;

    SECTION("less than one interval takes no step") {
        CHECK(world.step(h, 0.005f, 10) == 0);
        CHECK(world.accumulator == Approx(0.005f));
        CHECK(world.stepCount == 0);
    }

    SECTION("exactly one interval takes one step") {
        CHECK(world.step(h, h, 10) == 1);
        CHECK(world.stepCount == 1);
        CHECK(world.time == Approx(h));
    }

    SECTION("a long hitch is capped and the excess dropped") {
        CHECK(world.step(h, 1.0f, 10) == 10);
        CHECK(world.stepCount == 10);
        CHECK(world.accumulator < h);
        CHECK(world.accumulator >= 0.0f);
        // The dropped time does not come back on the next frame.
        CHECK(world.step(h, 0.0f, 10) == 0);
    }

    SECTION("bad input does nothing") {
        CHECK(world.step(0.0f, 1.0f, 10) == 0);
        CHECK(world.step(h, std::nanf(""), 10) == 0);
        CHECK(world.step(h, -1.0f, 10) == 0);
        CHECK(world.stepCount == 0);
    }
}

TEST_CASE("Pre-roll style stepping advances exactly one small step", "[world][step]") {
    PhysicsWorld world;
    const float h = 1.0f / 120.0f;
    for (int i = 0; i < 6; ++i) CHECK(world.step(h, h, 1) == 1);
    CHECK(world.stepCount == 6);
    CHECK(world.time == Approx(6.0 * h));
}

TEST_CASE("Bodies are registered once and removed idempotently", "[world]") {
    PhysicsWorld world;
    RigidBody body;
    body.mass = 1.0f;
    body.collider = Collider::createBox({0.5f, 0.5f, 0.5f});

    CHECK(world.addRigidBody(&body));
    CHECK_FALSE(world.addRigidBody(&body));
    CHECK_FALSE(world.addRigidBody(nullptr));
    CHECK(world.bodies.size() == 1);
    CHECK(body.id != 0);

    CHECK(world.removeRigidBody(&body));
    CHECK_FALSE(world.removeRigidBody(&body));
    CHECK_FALSE(world.contains(&body));
    CHECK(world.bodies.empty());
}

TEST_CASE("Free fall follows gravity", "[world]") {
    WorldFixture f;
    BodySettings s;
    s.linearDamping = 0.0f;
    RigidBody* box = f.factory.CreateBox({0.0f, 10.0f, 0.0f}, {0.5f, 0.5f, 0.5f}, s, 1.0f);

    f.run(0.5f);
    // Semi-implicit Euler lands slightly below the analytic 10 - g t^2 / 2.
    CHECK(box->velocity.y == Approx(-9.82f * 0.5f).epsilon(0.01));
    CHECK(box->position.y == Approx(10.0f - 0.5f * 9.82f * 0.25f).margin(0.05));
}

TEST_CASE("A dropped box settles on a plane and falls asleep", "[world][contact]") {
    WorldFixture f;
    f.factory.CreatePlane({0.0f, 0.0f, 0.0f});
    RigidBody* box = f.factory.CreateBox({0.0f, 1.5f, 0.0f}, {0.5f, 0.5f, 0.5f}, f.dieSettings(), 0.3f);

    f.run(6.0f);

    CHECK(box->position.y == Approx(0.5f).margin(0.02));
    CHECK(std::fabs(box->position.x) < 0.05f);
    CHECK(box->sleeping);
    CHECK(box->velocity.lengthSq() == Approx(0.0f).margin(1e-6));
}

TEST_CASE("A box resting on a static triangle mesh does not tunnel", "[world][contact][mesh]") {
    WorldFixture f;
    SceneAsset floor = makeStage(1.0f, 5.0f);
    std::vector<Vec3> flat;
    std::vector<uint32_t> seq;
    const MeshNode& node = floor.meshes[0];
    for (uint32_t idx : node.indices) flat.push_back(node.positions[idx]);
    for (uint32_t i = 0; i < (uint32_t)flat.size(); ++i) seq.push_back(i);

    auto mesh = std::make_shared<TriangleMesh>();
    REQUIRE(mesh->build(flat, seq) == TriangleMesh::BuildResult::Ok);
    f.factory.CreateMesh({0.0f, 0.0f, 0.0f}, mesh);

    RigidBody* box = f.factory.CreateBox({0.5f, 3.0f, -0.5f}, {0.5f, 0.5f, 0.5f}, f.dieSettings(), 0.3f);

    f.run(4.0f);

    CHECK(box->position.y == Approx(1.5f).margin(0.03));
    CHECK(box->position.y > 1.45f);
}

TEST_CASE("A stacked box rests on the one below", "[world][contact]") {
    WorldFixture f;
    f.factory.CreatePlane({0.0f, 0.0f, 0.0f});
    RigidBody* lower = f.factory.CreateBox({0.0f, 0.5f, 0.0f}, {0.5f, 0.5f, 0.5f}, f.dieSettings(), 0.3f);
    RigidBody* upper = f.factory.CreateBox({0.0f, 1.7f, 0.0f}, {0.5f, 0.5f, 0.5f}, f.dieSettings(), 0.3f);

    f.run(4.0f);

    CHECK(lower->position.y == Approx(0.5f).margin(0.03));
    CHECK(upper->position.y == Approx(1.5f).margin(0.06));
}

TEST_CASE("Sleeping bodies wake on velocity assignment", "[world][sleep]") {
    RigidBody body;
    body.mass = 1.0f;
    body.allowSleep = true;
    body.sleep();
    CHECK(body.sleeping);

    body.setVelocity({0.0f, 1.0f, 0.0f});
    CHECK_FALSE(body.sleeping);
    CHECK(body.sleepTimer == 0.0f);
}

TEST_CASE("Broadphase skips static pairs and sleeping pairs", "[world][broadphase]") {
    WorldFixture f;
    RigidBody* plane = f.factory.CreatePlane({0.0f, 0.0f, 0.0f});
    RigidBody* wall = f.factory.CreateBox({0.0f, 0.0f, 0.0f}, {1.0f, 1.0f, 1.0f}, BodySettings{}, 0.0f, true);
    RigidBody* a = f.factory.CreateBox({5.0f, 0.4f, 0.0f}, {0.5f, 0.5f, 0.5f}, f.dieSettings(), 1.0f);
    RigidBody* b = f.factory.CreateBox({5.5f, 0.4f, 0.0f}, {0.5f, 0.5f, 0.5f}, f.dieSettings(), 1.0f);
    (void)wall;

    BroadPhase bp;
    bp.build(f.world.bodies);
    auto hasPair = [&](const RigidBody* x, const RigidBody* y) {
        for (const BroadPhasePair& p : bp.pairs) {
            if ((p.a == x && p.b == y) || (p.a == y && p.b == x)) return true;
        }
        return false;
    };
    CHECK_FALSE(hasPair(plane, wall));
    CHECK(hasPair(a, b));
    CHECK(hasPair(plane, a));

    a->sleep();
    b->sleep();
    bp.build(f.world.bodies);
    CHECK_FALSE(hasPair(a, b));
    CHECK_FALSE(hasPair(plane, a));
}

TEST_CASE("Solver stops early once impulses converge", "[world][solver]") {
    WorldFixture f;
    f.factory.CreatePlane({0.0f, 0.0f, 0.0f});
    f.factory.CreateBox({0.0f, 0.5f, 0.0f}, {0.5f, 0.5f, 0.5f}, f.dieSettings(), 0.3f);
    f.world.solverIterations = 50;

    f.run(0.5f);
    CHECK(f.world.perf.manifolds == 1);
    CHECK(f.world.perf.solverIterationsUsed < 50);
}

TEST_CASE("Linear and angular speed are each held to the sleep limit", "[world][sleep]") {
    WorldFixture f;
    f.world.gravity = {0.0f, 0.0f, 0.0f};

    BodySettings s = f.dieSettings();
    s.linearDamping = 0.0f;
    s.angularDamping = 0.0f;
    RigidBody* box = f.factory.CreateBox({0.0f, 5.0f, 0.0f}, {0.5f, 0.5f, 0.5f}, s, 0.3f);
    REQUIRE(box);

    SECTION("both components under the limit sleeps") {
        // Together they exceed the limit, but neither does on its own.
        box->velocity = {0.15f, 0.0f, 0.0f};
        box->angularVelocity = {0.0f, 0.15f, 0.0f};
        f.run(1.5f);
        CHECK(box->sleeping);
    }

    SECTION("a fast spin keeps the body awake") {
        box->velocity = {0.0f, 0.0f, 0.0f};
        box->angularVelocity = {0.0f, 0.5f, 0.0f};
        f.run(1.5f);
        CHECK_FALSE(box->sleeping);
    }
}

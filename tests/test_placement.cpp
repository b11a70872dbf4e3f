// Unit tests for spawn placement: floor, safe height, aim and clamping
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <list>

#include "physics/RigidBody.h"
#include "physics/Raycast.h"
#include "sim/Placement.h"

using Catch::Approx;

// A live die standing at (x, y, z) with the given half-height.
static DieInstance standingDie(RigidBody& body, const Vec3& pos, float halfHeight) {
    body.position = pos;
    DieInstance d;
    d.body = &body;
    d.halfHeight = halfHeight;
    d.size = {halfHeight * 2.0f, halfHeight * 2.0f, halfHeight * 2.0f};
    return d;
}

TEST_CASE("Spawn below the stage is lifted to the safe height", "[placement]") {
    const float hh = 0.5f;
    const float clearance = 0.02f;
    const float floorY = Placement::effectiveFloor({0.0f, 0.0f, 0.0f}, 0.9f, 2.0f, {});
    CHECK(floorY == 2.0f);

    Vec3 p = Placement::resolveSpawn({0.0f, 0.0f, 0.0f}, floorY, hh, clearance);
    CHECK(p.x == 0.0f);
    CHECK(p.z == 0.0f);
    CHECK(p.y == Approx(2.0f + hh + clearance));
}

TEST_CASE("Spawn above the safe height is left alone", "[placement]") {
    Vec3 p = Placement::resolveSpawn({1.0f, 6.0f, -2.0f}, 2.0f, 0.5f, 0.02f);
    CHECK(p.x == 1.0f);
    CHECK(p.y == 6.0f);
    CHECK(p.z == -2.0f);
}

TEST_CASE("A nearby die raises the floor to its top", "[placement]") {
    RigidBody body;
    std::list<DieInstance> dice;
    dice.push_back(standingDie(body, {0.3f, 2.1f, 0.0f}, 0.5f));

    const float radius = Placement::exclusionRadius({1.0f, 1.0f, 1.0f}, 0.9f);
    CHECK(radius == Approx(0.9f));

    float floorY = Placement::effectiveFloor({0.0f, 0.0f, 0.0f}, radius, 2.0f, dice);
    CHECK(floorY == Approx(2.6f));

    Vec3 p = Placement::resolveSpawn({0.0f, 0.0f, 0.0f}, floorY, 0.5f, 0.02f);
    CHECK(p.y == Approx(2.6f + 0.5f + 0.02f));
}

TEST_CASE("Dice outside the exclusion radius are ignored", "[placement]") {
    RigidBody nearBody, farBody;
    std::list<DieInstance> dice;
    dice.push_back(standingDie(farBody, {0.9f, 5.0f, 0.0f}, 0.5f));
    dice.push_back(standingDie(nearBody, {0.0f, 2.2f, 0.5f}, 0.5f));

    // Exactly at the radius does not count.
    CHECK(Placement::effectiveFloor({0.0f, 0.0f, 0.0f}, 0.9f, 2.0f, dice) == Approx(2.7f));
}

TEST_CASE("Exclusion radius uses the wider horizontal extent", "[placement]") {
    CHECK(Placement::exclusionRadius({0.4f, 3.0f, 1.0f}, 0.9f) == Approx(0.9f));
    CHECK(Placement::exclusionRadius({2.0f, 0.1f, 1.0f}, 0.5f) == Approx(1.0f));
}

TEST_CASE("Aim hits the stage-top plane or falls back along the ray", "[placement][aim]") {
    SECTION("downward ray meets the plane") {
        Vec3 t = Placement::aimTarget({0.0f, 10.0f, 0.0f}, {0.6f, -0.8f, 0.0f}, 2.0f, 3.0f);
        CHECK(t.y == Approx(2.0f));
        CHECK(t.x == Approx(6.0f));
        CHECK(t.z == Approx(0.0f));
    }

    SECTION("horizontal ray uses the fallback distance") {
        Vec3 t = Placement::aimTarget({1.0f, 5.0f, 1.0f}, {0.0f, 0.0f, 1.0f}, 2.0f, 3.0f);
        CHECK(t.x == Approx(1.0f));
        CHECK(t.y == Approx(5.0f));
        CHECK(t.z == Approx(4.0f));
    }

    SECTION("nearly horizontal counts as parallel") {
        Vec3 t = Placement::aimTarget({0.0f, 5.0f, 0.0f}, {1.0f, -Raycast::parallelEpsilon * 0.5f, 0.0f}, 2.0f, 3.0f);
        CHECK(t.x == Approx(3.0f).margin(1e-4));
        CHECK(t.y == Approx(5.0f).margin(1e-3));
    }

    SECTION("ray pointing away from the plane uses the fallback") {
        Vec3 t = Placement::aimTarget({0.0f, 5.0f, 0.0f}, {0.0f, 1.0f, 0.0f}, 2.0f, 3.0f);
        CHECK(t.y == Approx(8.0f));
    }

    SECTION("zero direction returns the origin") {
        Vec3 t = Placement::aimTarget({1.0f, 2.0f, 3.0f}, {0.0f, 0.0f, 0.0f}, 0.0f, 3.0f);
        CHECK(t == Vec3{1.0f, 2.0f, 3.0f});
    }
}

TEST_CASE("Drop height keeps a minimum margin above the stage", "[placement]") {
    CHECK(Placement::dropHeight(2.0f, 0.5f, 1.5f, 2.0f) == Approx(2.0f + 0.5f + 1.5f));
    CHECK(Placement::dropHeight(2.0f, 1.0f, 1.5f, 2.0f) == Approx(2.0f + 1.0f + 2.0f));
}

TEST_CASE("A body that sank is clamped back above the floor", "[placement]") {
    RigidBody body;
    body.position = {0.5f, 2.3f, -0.5f};
    body.velocity = {1.0f, -3.0f, 0.0f};

    CHECK(Placement::clampAboveFloor(body, 2.0f, 0.5f, 0.02f));
    CHECK(body.position.y == Approx(2.52f));
    CHECK(body.position.x == 0.5f);
    CHECK(body.velocity.y == 0.0f);
    CHECK(body.velocity.x == 1.0f);

    CHECK_FALSE(Placement::clampAboveFloor(body, 2.0f, 0.5f, 0.02f));
}

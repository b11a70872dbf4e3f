// Scenario tests for DiceSession: loading, rolling, the frame loop and expiry
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cmath>
#include <random>

#include "TestScenes.h"
#include "sim/DiceSession.h"

using Catch::Approx;

static SimConfig testConfig() {
    SimConfig cfg;
    cfg.stageScale = 1.0f;
    return cfg;
}

TEST_CASE("Asset slots refuse to leave a final state", "[session][assets]") {
    AssetSlot<int> slot;
    CHECK(slot.state() == AssetState::Unloaded);
    CHECK(slot.get() == nullptr);
    CHECK(slot.markLoading());
    CHECK_FALSE(slot.markLoading());
    CHECK(slot.resolve(4));
    REQUIRE(slot.get() != nullptr);
    CHECK(*slot.get() == 4);
    CHECK_FALSE(slot.resolve(5));
    CHECK_FALSE(slot.fail("late"));
    CHECK(*slot.get() == 4);

    AssetSlot<int> failed;
    CHECK(failed.fail("missing"));
    CHECK(failed.state() == AssetState::Failed);
    CHECK(failed.error() == "missing");
    CHECK_FALSE(failed.resolve(1));
    CHECK(failed.get() == nullptr);
}

TEST_CASE("Rolling before the die model is ready does nothing", "[session][spawn]") {
    DiceSession session(testConfig());
    std::mt19937 rng(7u);
    session.markDieLoading();
    REQUIRE(session.stageLoaded(makeStage(2.0f)));
    const size_t bodiesBefore = session.world().bodies.size();

    CHECK(session.roll({0, 10, 0}, {0, -1, 0}, rng) == nullptr);
    CHECK(session.spawnAt({0, 0, 0}, Quat::identity(), {0, 0, 0}, rng) == nullptr);
    CHECK(session.dice().empty());
    CHECK(session.scene().size() == 0);
    CHECK(session.world().bodies.size() == bodiesBefore);

    session.dieTemplateFailed("no such file");
    CHECK(session.dieSlot().state() == AssetState::Failed);
    CHECK(session.roll({0, 10, 0}, {0, -1, 0}, rng) == nullptr);
    CHECK_FALSE(session.dieTemplateLoaded(makeDie()));
}

TEST_CASE("Die template measures the model and falls back to a unit cube", "[session][assets]") {
    SECTION("offset model") {
        DiceSession session(testConfig());
        REQUIRE(session.dieTemplateLoaded(makeDie(0.6f, {0.0f, 0.3f, 0.0f})));
        const DieTemplate* t = session.dieSlot().get();
        REQUIRE(t != nullptr);
        CHECK(t->size.y == Approx(0.6f));
        CHECK(t->halfHeight == Approx(0.3f));
        CHECK(t->centerOffset.y == Approx(0.3f));
        CHECK_FALSE(t->usedFallback);
    }

    SECTION("model without geometry") {
        DiceSession session(testConfig());
        SceneAsset empty;
        empty.source = "empty";
        REQUIRE(session.dieTemplateLoaded(empty));
        const DieTemplate* t = session.dieSlot().get();
        REQUIRE(t != nullptr);
        CHECK(t->usedFallback);
        CHECK(t->halfHeight == Approx(0.5f));
        CHECK(t->size.x == Approx(1.0f));
    }
}

TEST_CASE("Stage is scaled before its colliders are built", "[session][stage]") {
    SimConfig cfg = testConfig();
    cfg.stageScale = 4.0f;
    DiceSession session(cfg);
    REQUIRE(session.stageLoaded(makeStage(0.5f)));

    CHECK(session.stageTop() == Approx(2.0f));
    CHECK(session.stageReport().meshesBuilt == 1);
    REQUIRE(session.stageReport().fallbackPlane != nullptr);
    CHECK(session.stageReport().fallbackPlane->position.y == Approx(2.0f));
    CHECK(session.stageSlot().isReady());

    CHECK_FALSE(session.stageLoaded(makeStage(9.0f)));
    CHECK(session.stageTop() == Approx(2.0f));
}

TEST_CASE("Spawn below the stage lands just above its top", "[session][spawn]") {
    DiceSession session(testConfig());
    std::mt19937 rng(7u);
    REQUIRE(session.stageLoaded(makeStage(2.0f)));
    REQUIRE(session.dieTemplateLoaded(makeDie(1.0f)));

    DieInstance* d = session.spawnAt({0.0f, 0.0f, 0.0f}, Quat::identity(), {0, 0, 0}, rng);
    REQUIRE(d != nullptr);
    CHECK(d->spawnPosition.x == 0.0f);
    CHECK(d->spawnPosition.z == 0.0f);
    CHECK(d->spawnPosition.y == Approx(2.0f + 0.5f + session.config().clearance));

    // Pre-roll has run; the die never starts below the stage.
    CHECK(d->body->position.y >= 2.5f);
    CHECK(d->visual->position == d->body->position);
}

TEST_CASE("A second die spawns on top of a nearby one", "[session][spawn]") {
    SimConfig cfg = testConfig();
    cfg.singleDiePolicy = false;
    DiceSession session(cfg);
    std::mt19937 rng(7u);
    REQUIRE(session.stageLoaded(makeStage(2.0f)));
    REQUIRE(session.dieTemplateLoaded(makeDie(1.0f)));

    DieInstance* first = session.spawnAt({0.0f, 0.0f, 0.0f}, Quat::identity(), {0, 0, 0}, rng);
    REQUIRE(first != nullptr);
    const float firstTop = first->body->position.y + first->halfHeight;

    DieInstance* second = session.spawnAt({0.3f, 0.0f, 0.0f}, Quat::identity(), {0, 0, 0}, rng);
    REQUIRE(second != nullptr);
    CHECK(second->spawnPosition.y == Approx(firstTop + 0.5f + cfg.clearance));
    CHECK(second->spawnPosition.x == Approx(0.3f));
    CHECK(session.dice().size() == 2);
}

TEST_CASE("Roll drops a die above the aimed point", "[session][roll]") {
    DiceSession session(testConfig());
    std::mt19937 rng(99u);
    REQUIRE(session.stageLoaded(makeStage(2.0f)));
    REQUIRE(session.dieTemplateLoaded(makeDie(1.0f)));

    DieInstance* d = session.roll({1.0f, 10.0f, -1.0f}, {0.0f, -1.0f, 0.0f}, rng);
    REQUIRE(d != nullptr);
    // stage top + half height + max(dropMarginMin, half height * dropMarginScale)
    CHECK(d->spawnPosition.x == Approx(1.0f));
    CHECK(d->spawnPosition.z == Approx(-1.0f));
    CHECK(d->spawnPosition.y == Approx(2.0f + 0.5f + 1.5f));

    const float jitter = session.config().launchJitter * 0.5f;
    CHECK(std::fabs(d->body->velocity.x) <= jitter);
    CHECK(std::fabs(d->body->velocity.z) <= jitter);
}

TEST_CASE("Single-die policy replaces the previous die", "[session][roll]") {
    DiceSession session(testConfig());
    std::mt19937 rng(3u);
    REQUIRE(session.stageLoaded(makeStage(2.0f)));
    REQUIRE(session.dieTemplateLoaded(makeDie(1.0f)));
    const size_t stageBodies = session.world().bodies.size();

    DieInstance* a = session.roll({0, 10, 0}, {0, -1, 0}, rng);
    REQUIRE(a != nullptr);
    DieInstance* b = session.roll({2, 10, 0}, {0, -1, 0}, rng);
    REQUIRE(b != nullptr);

    CHECK(session.dice().size() == 1);
    CHECK(session.scene().size() == 1);
    CHECK(session.world().bodies.size() == stageBodies + 1);
}

TEST_CASE("Clear removes every die body and visual, twice over", "[session][clear]") {
    SimConfig cfg = testConfig();
    cfg.singleDiePolicy = false;
    DiceSession session(cfg);
    std::mt19937 rng(3u);
    REQUIRE(session.stageLoaded(makeStage(2.0f)));
    REQUIRE(session.dieTemplateLoaded(makeDie(1.0f)));
    const size_t stageBodies = session.world().bodies.size();

    REQUIRE(session.roll({0, 10, 0}, {0, -1, 0}, rng) != nullptr);
    REQUIRE(session.roll({3, 10, 0}, {0, -1, 0}, rng) != nullptr);
    REQUIRE(session.roll({-3, 10, 0}, {0, -1, 0}, rng) != nullptr);
    CHECK(session.world().bodies.size() == stageBodies + 3);

    CHECK(session.clear() == 3);
    CHECK(session.dice().empty());
    CHECK(session.scene().size() == 0);
    CHECK(session.world().bodies.size() == stageBodies);

    CHECK(session.clear() == 0);
    CHECK(session.world().bodies.size() == stageBodies);
}

TEST_CASE("Frames clamp the wall delta and sync visuals after stepping", "[session][frame]") {
    DiceSession session(testConfig());
    std::mt19937 rng(5u);
    REQUIRE(session.stageLoaded(makeStage(2.0f)));
    REQUIRE(session.dieTemplateLoaded(makeDie(1.0f)));
    DieInstance* d = session.roll({0, 10, 0}, {0, -1, 0}, rng);
    REQUIRE(d != nullptr);

    FrameReport r = session.frame(1.0f);
    CHECK(r.clampedDt == Approx(session.config().maxFrameDelta));
    CHECK(r.substeps == 1);
    CHECK(r.liveDice == 1);
    CHECK(r.now == Approx(1.0));

    for (int i = 0; i < 10; ++i) {
        session.frame(1.0f / 60.0f);
        CHECK(d->visual->position == d->body->position);
        CHECK(d->visual->orientation == d->body->orientation);
    }
}

TEST_CASE("A die expires exactly once after its lifetime", "[session][timeout]") {
    DiceSession session(testConfig());
    std::mt19937 rng(11u);
    REQUIRE(session.stageLoaded(makeStage(2.0f)));
    REQUIRE(session.dieTemplateLoaded(makeDie(1.0f)));
    REQUIRE(session.roll({0, 10, 0}, {0, -1, 0}, rng) != nullptr);
    const size_t withDie = session.world().bodies.size();

    for (int i = 0; i < 89; ++i) {
        FrameReport r = session.frame(1.0f);
        REQUIRE(r.expired == 0);
        REQUIRE(r.liveDice == 1);
    }

    FrameReport last = session.frame(1.0f);
    CHECK(last.now == Approx(90.0));
    CHECK(last.expired == 1);
    CHECK(last.liveDice == 0);
    CHECK(session.scene().size() == 0);
    CHECK(session.world().bodies.size() == withDie - 1);

    CHECK(session.frame(1.0f).expired == 0);
}

TEST_CASE("A rolled die comes to rest on the stage", "[session][settle]") {
    DiceSession session(testConfig());
    std::mt19937 rng(21u);
    REQUIRE(session.stageLoaded(makeStage(2.0f)));
    REQUIRE(session.dieTemplateLoaded(makeDie(1.0f)));
    DieInstance* d = session.roll({0, 10, 0}, {0, -1, 0}, rng);
    REQUIRE(d != nullptr);

    for (int i = 0; i < 600; ++i) session.frame(1.0f / 60.0f);

    CHECK(d->body->position.y == Approx(2.5f).margin(0.05));
    CHECK(d->body->position.y > 2.4f);
    CHECK(d->body->velocity.length() < 0.2f);
}

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE IdleBehaviorTests
#include <boost/test/unit_test.hpp>

#include "../common/TestWorlds.hpp"
#include "systems/IdleBehaviorSystem.hpp"
#include <cstdlib>

using namespace DelveTest;

BOOST_GLOBAL_FIXTURE(QuietLogFixture);

namespace {

SimConfig weighted(int stroll, int socialize, int rest) {
    SimConfig config = testConfig();
    config.strollWeight = stroll;
    config.socializeWeight = socialize;
    config.restWeight = rest;
    return config;
}

} // namespace

struct IdleFixture {
    WorldState state;

    IdleFixture() : state(flatWorld()) { state.tick = 100; }

    void idleOnce(const SimConfig& config) {
        SystemHarness h(config);
        h.run<IdleBehaviorSystem>(state);
    }

    const std::optional<IdleBehavior>& behavior(EntityID id) const {
        return state.gnomes.at(id).idleBehavior;
    }
};

BOOST_FIXTURE_TEST_SUITE(RestTests, IdleFixture)

BOOST_AUTO_TEST_CASE(TestRestDurationWithinRange) {
    SimConfig config = weighted(0, 0, 100);
    EntityID g = addGnome(state, config, 5, FLAT_STAND);

    idleOnce(config);

    BOOST_REQUIRE(behavior(g));
    BOOST_CHECK_EQUAL(behavior(g)->type, IdleBehaviorType::RESTING);
    BOOST_CHECK_EQUAL(behavior(g)->startedAt, 100u);
    BOOST_CHECK_GE(behavior(g)->endsAt, 100u + config.restMinTicks);
    BOOST_CHECK_LT(behavior(g)->endsAt, 100u + config.restMaxTicks);
    BOOST_CHECK_EQUAL(state.gnomes.at(g).state, GnomeState::IDLE);
}

BOOST_AUTO_TEST_CASE(TestRestEndsOnTime) {
    SimConfig config = weighted(0, 0, 100);
    EntityID g = addGnome(state, config, 5, FLAT_STAND);
    idleOnce(config);
    BOOST_REQUIRE(behavior(g));
    const uint64_t endsAt = behavior(g)->endsAt;

    state.tick = endsAt - 1;
    idleOnce(config);
    BOOST_CHECK(behavior(g));

    state.tick = endsAt;
    idleOnce(config);
    BOOST_CHECK(!behavior(g));
}

BOOST_AUTO_TEST_CASE(TestNowhereToStrollFallsBackToRest) {
    SimConfig config = weighted(100, 0, 0);
    state = flatWorld(3);
    EntityID g = addGnome(state, config, 1, FLAT_STAND);

    idleOnce(config);

    BOOST_REQUIRE(behavior(g));
    BOOST_CHECK_EQUAL(behavior(g)->type, IdleBehaviorType::RESTING);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(StrollTests, IdleFixture)

BOOST_AUTO_TEST_CASE(TestStrollStartsWalking) {
    SimConfig config = weighted(100, 0, 0);
    EntityID g = addGnome(state, config, 10, FLAT_STAND);

    idleOnce(config);

    BOOST_REQUIRE(behavior(g));
    BOOST_CHECK_EQUAL(behavior(g)->type, IdleBehaviorType::STROLLING);
    BOOST_CHECK_EQUAL(behavior(g)->endsAt, 100u + config.strollTimeoutTicks);
    BOOST_REQUIRE(behavior(g)->target);

    const TileCoord target = *behavior(g)->target;
    const int distance = std::abs(target.x - 10);
    BOOST_CHECK_GE(distance, config.strollMinRadius);
    BOOST_CHECK_LT(distance, config.strollMaxRadius);
    BOOST_CHECK(state.canStandAt(target.x, target.y));

    const Gnome& gnome = state.gnomes.at(g);
    BOOST_CHECK_EQUAL(gnome.state, GnomeState::WALKING);
    BOOST_REQUIRE(!gnome.path.empty());
    BOOST_CHECK_EQUAL(gnome.path.back(), target);
}

BOOST_AUTO_TEST_CASE(TestStrollCentresOnTheNearestStorage) {
    SimConfig config = weighted(100, 0, 0);
    state = flatWorld(60);
    state.tick = 100;
    BOOST_REQUIRE(placeStorage(state, 40, FLAT_STAND - 1) != INVALID_ENTITY);
    EntityID g = addGnome(state, config, 5, FLAT_STAND);

    idleOnce(config);

    BOOST_REQUIRE(behavior(g));
    BOOST_REQUIRE(behavior(g)->target);
    const int offset = std::abs(behavior(g)->target->x - 40);
    BOOST_CHECK_GE(offset, config.strollMinRadius);
    BOOST_CHECK_LT(offset, config.strollMaxRadius);
}

BOOST_AUTO_TEST_CASE(TestStrollTimesOut) {
    SimConfig config = weighted(100, 0, 0);
    EntityID g = addGnome(state, config, 10, FLAT_STAND);
    idleOnce(config);
    BOOST_REQUIRE(behavior(g));

    state.tick = behavior(g)->endsAt;
    idleOnce(config);

    BOOST_CHECK(!behavior(g));
    BOOST_CHECK_EQUAL(state.gnomes.at(g).state, GnomeState::IDLE);
    BOOST_CHECK(state.gnomes.at(g).path.empty());
}

BOOST_AUTO_TEST_CASE(TestArrivedStrollIsCleared) {
    SimConfig config = weighted(100, 0, 0);
    EntityID g = addGnome(state, config, 10, FLAT_STAND);
    IdleBehavior stroll;
    stroll.type = IdleBehaviorType::STROLLING;
    stroll.startedAt = 50;
    stroll.endsAt = 5000;
    stroll.target = TileCoord{10, FLAT_STAND};
    state.gnomes.at(g).idleBehavior = stroll;
    state.gnomes.at(g).path = {TileCoord{10, FLAT_STAND}};
    state.gnomes.at(g).pathIndex = 1;

    idleOnce(config);
    BOOST_CHECK(!behavior(g));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(SocializeTests, IdleFixture)

BOOST_AUTO_TEST_CASE(TestNeighboursPairUp) {
    SimConfig config = weighted(0, 100, 0);
    EntityID a = addGnome(state, config, 5, FLAT_STAND);
    EntityID b = addGnome(state, config, 8, FLAT_STAND);

    idleOnce(config);

    BOOST_REQUIRE(behavior(a));
    BOOST_REQUIRE(behavior(b));
    BOOST_CHECK_EQUAL(behavior(a)->type, IdleBehaviorType::SOCIALIZING);
    BOOST_CHECK(behavior(a)->partner == b);
    BOOST_CHECK(behavior(b)->partner == a);
    BOOST_CHECK_EQUAL(behavior(a)->endsAt, behavior(b)->endsAt);
    BOOST_CHECK_EQUAL(behavior(a)->marker, behavior(b)->marker);
    BOOST_CHECK_GE(behavior(a)->endsAt, 100u + config.socializeMinTicks);
    BOOST_CHECK_LT(behavior(a)->endsAt, 100u + config.socializeMaxTicks);
    BOOST_CHECK_EQUAL(checkInvariants(state, config.inventoryCapacity), "");
}

BOOST_AUTO_TEST_CASE(TestNobodyNearbyFallsBackToStroll) {
    SimConfig config = weighted(0, 100, 0);
    EntityID a = addGnome(state, config, 10, FLAT_STAND);
    EntityID busy = addGnome(state, config, 12, FLAT_STAND);
    state.gnomes.at(busy).state = GnomeState::MINING;

    idleOnce(config);

    BOOST_REQUIRE(behavior(a));
    BOOST_CHECK_EQUAL(behavior(a)->type, IdleBehaviorType::STROLLING);
    BOOST_CHECK(!behavior(busy));
}

BOOST_AUTO_TEST_CASE(TestConversationEndsForBoth) {
    SimConfig config = weighted(0, 100, 0);
    EntityID a = addGnome(state, config, 5, FLAT_STAND);
    EntityID b = addGnome(state, config, 6, FLAT_STAND);
    idleOnce(config);
    BOOST_REQUIRE(behavior(a));

    state.tick = behavior(a)->endsAt;
    idleOnce(weighted(0, 0, 100));

    // The first gnome ends the conversation for both; the second is then free to rest
    BOOST_CHECK(!behavior(a));
    BOOST_REQUIRE(behavior(b));
    BOOST_CHECK_EQUAL(behavior(b)->type, IdleBehaviorType::RESTING);
    BOOST_CHECK_EQUAL(checkInvariants(state, config.inventoryCapacity), "");
}

BOOST_AUTO_TEST_CASE(TestAbandonedTalkerStops) {
    SimConfig config = weighted(0, 0, 100);
    EntityID a = addGnome(state, config, 5, FLAT_STAND);
    EntityID b = addGnome(state, config, 6, FLAT_STAND);
    IdleBehavior talk;
    talk.type = IdleBehaviorType::SOCIALIZING;
    talk.startedAt = 90;
    talk.endsAt = 900;
    talk.partner = b;
    state.gnomes.at(a).idleBehavior = talk;
    state.gnomes.at(b).state = GnomeState::MINING;

    idleOnce(config);
    BOOST_CHECK(!behavior(a));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(SchedulingTests, IdleFixture)

BOOST_AUTO_TEST_CASE(TestBusyGnomesAreLeftAlone) {
    SimConfig config = weighted(0, 0, 100);
    EntityID miner = addGnome(state, config, 5, FLAT_STAND);
    EntityID carrier = addGnome(state, config, 9, FLAT_STAND);
    state.gnomes.at(miner).state = GnomeState::MINING;
    state.gnomes.at(carrier).depositTargetStorage = 77;

    idleOnce(config);

    BOOST_CHECK(!behavior(miner));
    BOOST_CHECK(!behavior(carrier));
}

BOOST_AUTO_TEST_CASE(TestRunsOnlyOnThrottleTicks) {
    SimConfig config = weighted(0, 0, 100);
    config.idleBehaviorInterval = 10;
    EntityID g = addGnome(state, config, 5, FLAT_STAND);

    state.tick = 103;
    idleOnce(config);
    BOOST_CHECK(!behavior(g));

    state.tick = 110;
    idleOnce(config);
    BOOST_CHECK(behavior(g));
}

BOOST_AUTO_TEST_CASE(TestSameStateSameChoice) {
    SimConfig config = testConfig();
    for (int x = 2; x < 18; x += 3) {
        addGnome(state, config, x, FLAT_STAND);
    }
    WorldState copy = state;

    idleOnce(config);
    SystemHarness other(config);
    other.run<IdleBehaviorSystem>(copy);

    BOOST_CHECK(state == copy);
}

BOOST_AUTO_TEST_SUITE_END()

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE PhysicsSystemTests
#include <boost/test/unit_test.hpp>

#include "../common/TestWorlds.hpp"
#include "systems/BoundsSystem.hpp"
#include "systems/HealthSystem.hpp"
#include "systems/PhysicsSystem.hpp"
#include "systems/ResourcePhysicsSystem.hpp"

using namespace DelveTest;

BOOST_GLOBAL_FIXTURE(QuietLogFixture);

namespace {

constexpr int MAX_STEPS = 1000;

} // namespace

struct PhysicsFixture {
    SystemHarness h;
    WorldState state;

    PhysicsFixture() : state(flatWorld()) {}

    void physicsStep() {
        h.run<PhysicsSystem>(state);
        ++state.tick;
    }

    // Steps until the gnome leaves the given state; returns the steps taken
    int stepWhile(EntityID id, GnomeState gnomeState) {
        int steps = 0;
        while (state.gnomes.at(id).state == gnomeState && steps < MAX_STEPS) {
            physicsStep();
            ++steps;
        }
        return steps;
    }

    EntityID walker(int x, std::vector<TileCoord> path) {
        EntityID id = addGnome(state, h.config, x, FLAT_STAND);
        state.gnomes.at(id).path = std::move(path);
        state.gnomes.at(id).state = GnomeState::WALKING;
        return id;
    }

    const Position& pos(EntityID id) const { return state.positions.at(id); }
};

BOOST_FIXTURE_TEST_SUITE(WalkingTests, PhysicsFixture)

BOOST_AUTO_TEST_CASE(TestWalkerAdvancesAtGnomeSpeed) {
    EntityID g = walker(2, {TileCoord{3, FLAT_STAND}});
    physicsStep();

    BOOST_CHECK_CLOSE(pos(g).x, 2.0f + h.config.gnomeSpeed, 0.01f);
    BOOST_CHECK_EQUAL(pos(g).y, static_cast<float>(FLAT_STAND));
    BOOST_CHECK_EQUAL(state.gnomes.at(g).state, GnomeState::WALKING);
}

BOOST_AUTO_TEST_CASE(TestWalkerSnapsOntoTheLastWaypoint) {
    EntityID g = walker(2, {TileCoord{3, FLAT_STAND}, TileCoord{4, FLAT_STAND}});

    const int steps = stepWhile(g, GnomeState::WALKING);

    BOOST_CHECK_LT(steps, MAX_STEPS);
    BOOST_CHECK_EQUAL(pos(g).x, 4.0f);
    BOOST_CHECK_EQUAL(state.gnomes.at(g).pathIndex, 2u);
    BOOST_CHECK_EQUAL(state.gnomes.at(g).state, GnomeState::IDLE);
}

BOOST_AUTO_TEST_CASE(TestArrivalStartsTheTask) {
    EntityID g = walker(2, {TileCoord{3, FLAT_STAND}});
    EntityID dig = addDigTask(state, 4, FLAT_FLOOR);
    assignTask(state, g, dig, GnomeState::WALKING);

    stepWhile(g, GnomeState::WALKING);
    BOOST_CHECK_EQUAL(state.gnomes.at(g).state, GnomeState::MINING);

    EntityID c = walker(6, {TileCoord{7, FLAT_STAND}});
    EntityID resource = addGroundedResource(state, 7, FLAT_STAND);
    assignTask(state, c, state.findCollectTaskFor(resource), GnomeState::WALKING);

    stepWhile(c, GnomeState::WALKING);
    BOOST_CHECK_EQUAL(state.gnomes.at(c).state, GnomeState::COLLECTING);
}

BOOST_AUTO_TEST_CASE(TestStrollingIsSlowerAndEndsOnArrival) {
    EntityID g = walker(2, {TileCoord{3, FLAT_STAND}});
    IdleBehavior stroll;
    stroll.type = IdleBehaviorType::STROLLING;
    stroll.endsAt = 3600;
    stroll.target = TileCoord{3, FLAT_STAND};
    state.gnomes.at(g).idleBehavior = stroll;

    physicsStep();
    BOOST_CHECK_CLOSE(pos(g).x, 2.0f + h.config.gnomeIdleSpeed, 0.01f);

    stepWhile(g, GnomeState::WALKING);
    BOOST_CHECK_EQUAL(state.gnomes.at(g).state, GnomeState::IDLE);
    BOOST_CHECK(!state.gnomes.at(g).idleBehavior);
}

BOOST_AUTO_TEST_CASE(TestBlockedRouteReturnsTheTask) {
    EntityID g = walker(2, {TileCoord{3, FLAT_STAND}, TileCoord{4, FLAT_STAND}});
    EntityID dig = addDigTask(state, 5, FLAT_FLOOR);
    assignTask(state, g, dig, GnomeState::WALKING);

    state.setTileType(3, FLAT_STAND, TileType::STONE);
    physicsStep();

    BOOST_CHECK_EQUAL(state.gnomes.at(g).state, GnomeState::IDLE);
    BOOST_CHECK(!state.gnomes.at(g).currentTaskId);
    BOOST_CHECK(state.gnomes.at(g).path.empty());
    BOOST_CHECK(!state.tasks.at(dig).assignedGnome);
}

BOOST_AUTO_TEST_CASE(TestClimbSlipDropsTheGnome) {
    SimConfig slippery = testConfig();
    slippery.climbSlipChance = 1.0;
    SystemHarness slip(slippery);

    for (int y = FLAT_FLOOR; y < FLAT_HEIGHT - 1; ++y) {
        state.setTileType(6, y, TileType::AIR);
    }
    EntityID g = addGnome(state, slippery, 6, FLAT_HEIGHT - 2);
    state.gnomes.at(g).path = {TileCoord{6, FLAT_HEIGHT - 3}};
    state.gnomes.at(g).state = GnomeState::WALKING;

    slip.run<PhysicsSystem>(state);

    BOOST_CHECK_EQUAL(state.gnomes.at(g).state, GnomeState::FALLING);
    BOOST_CHECK(state.gnomes.at(g).path.empty());
}

BOOST_AUTO_TEST_CASE(TestClimbingUsesClimbSpeed) {
    for (int y = FLAT_FLOOR; y < FLAT_HEIGHT - 1; ++y) {
        state.setTileType(6, y, TileType::AIR);
    }
    EntityID g = addGnome(state, h.config, 6, FLAT_HEIGHT - 2);
    state.gnomes.at(g).path = {TileCoord{6, FLAT_HEIGHT - 3}};
    state.gnomes.at(g).state = GnomeState::WALKING;

    physicsStep();

    BOOST_CHECK_EQUAL(pos(g).x, 6.0f);
    BOOST_CHECK_CLOSE(pos(g).y, static_cast<float>(FLAT_HEIGHT - 2) - h.config.gnomeClimbSpeed, 0.01f);
}

BOOST_AUTO_TEST_CASE(TestWalkerFallsWhenTheFloorIsDugAway) {
    EntityID g = walker(2, {TileCoord{3, FLAT_STAND}, TileCoord{4, FLAT_STAND}, TileCoord{5, FLAT_STAND}});
    EntityID dig = addDigTask(state, 6, FLAT_FLOOR);
    assignTask(state, g, dig, GnomeState::WALKING);

    for (int x = 3; x <= 5; ++x) {
        for (int y = FLAT_FLOOR; y < FLAT_HEIGHT - 1; ++y) {
            state.setTileType(x, y, TileType::AIR);
        }
    }

    const int steps = stepWhile(g, GnomeState::WALKING);

    BOOST_CHECK_LT(steps, MAX_STEPS);
    BOOST_CHECK_EQUAL(state.gnomes.at(g).state, GnomeState::FALLING);
    // Never walks on across the open air
    BOOST_CHECK_LE(pos(g).x, 3.0f);
    BOOST_CHECK(state.gnomes.at(g).path.empty());
    BOOST_CHECK(!state.gnomes.at(g).currentTaskId);
    BOOST_CHECK(!state.tasks.at(dig).assignedGnome);

    // Catches the wall of the hole one row down
    stepWhile(g, GnomeState::FALLING);
    BOOST_CHECK_EQUAL(state.gnomes.at(g).state, GnomeState::IDLE);
    BOOST_CHECK_EQUAL(pos(g).y, static_cast<float>(FLAT_FLOOR));
}

BOOST_AUTO_TEST_CASE(TestPlannedDropIntoAShaftStillWalks) {
    for (int y = FLAT_FLOOR; y < FLAT_HEIGHT - 1; ++y) {
        state.setTileType(3, y, TileType::AIR);
    }
    EntityID g = walker(2, {TileCoord{3, FLAT_STAND}, TileCoord{3, FLAT_FLOOR},
                            TileCoord{3, FLAT_FLOOR + 1}, TileCoord{3, FLAT_HEIGHT - 2}});

    const int steps = stepWhile(g, GnomeState::WALKING);

    BOOST_CHECK_LT(steps, MAX_STEPS);
    BOOST_CHECK_EQUAL(state.gnomes.at(g).state, GnomeState::IDLE);
    BOOST_CHECK_EQUAL(pos(g).x, 3.0f);
    BOOST_CHECK_EQUAL(pos(g).y, static_cast<float>(FLAT_HEIGHT - 2));
}

BOOST_AUTO_TEST_CASE(TestStepRulesOffUnsupportedTiles) {
    for (int y = FLAT_FLOOR; y < FLAT_HEIGHT - 1; ++y) {
        state.setTileType(3, y, TileType::AIR);
        state.setTileType(4, y, TileType::AIR);
    }
    const Position overHole{3.0f, static_cast<float>(FLAT_STAND)};

    // Dropping is always allowed, walking on over air is not
    BOOST_CHECK(PhysicsSystem::canTakeStep(state, overHole, TileCoord{3, FLAT_FLOOR}));
    BOOST_CHECK(!PhysicsSystem::canTakeStep(state, overHole, TileCoord{4, FLAT_STAND}));
    // Back onto solid footing is fine
    BOOST_CHECK(PhysicsSystem::canTakeStep(state, overHole, TileCoord{2, FLAT_STAND}));
    // Mid-step positions are judged at the next tile
    BOOST_CHECK(PhysicsSystem::canTakeStep(state, Position{3.5f, static_cast<float>(FLAT_STAND)},
                                           TileCoord{4, FLAT_STAND}));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(FallingTests, PhysicsFixture)

BOOST_AUTO_TEST_CASE(TestUnsupportedGnomeFallsAndLands) {
    EntityID g = addGnome(state, h.config, 5, FLAT_STAND);
    state.positions.at(g).y = 5.0f;

    physicsStep();
    BOOST_CHECK_EQUAL(state.gnomes.at(g).state, GnomeState::FALLING);
    BOOST_CHECK_CLOSE(pos(g).y, 5.0f + h.config.gravity, 0.01f);

    stepWhile(g, GnomeState::FALLING);
    BOOST_CHECK_EQUAL(state.gnomes.at(g).state, GnomeState::IDLE);
    BOOST_CHECK_EQUAL(pos(g).y, static_cast<float>(FLAT_STAND));
    BOOST_CHECK_EQUAL(state.velocities.at(g).dy, 0.0f);
    // Two tiles is below the damage threshold
    BOOST_CHECK_EQUAL(state.healths.at(g).current, 100);
    BOOST_CHECK(!state.gnomes.at(g).fallStartY);
}

BOOST_AUTO_TEST_CASE(TestFallSpeedIsCapped) {
    EntityID g = addGnome(state, h.config, 5, FLAT_STAND);
    state.positions.at(g).y = 0.0f;

    for (int i = 0; i < 30; ++i) {
        physicsStep();
    }
    BOOST_CHECK_LE(state.velocities.at(g).dy, h.config.terminalVelocity);
}

BOOST_AUTO_TEST_CASE(TestLongFallHurts) {
    EntityID g = addGnome(state, h.config, 5, FLAT_STAND);
    state.positions.at(g).y = 2.0f;

    stepWhile(g, GnomeState::IDLE);
    stepWhile(g, GnomeState::FALLING);

    // floor(7 - 2) = 5 tiles: (5 - 3 + 1) * 10
    BOOST_CHECK_EQUAL(state.healths.at(g).current, 70);
    BOOST_CHECK_EQUAL(state.gnomes.at(g).state, GnomeState::IDLE);
}

BOOST_AUTO_TEST_CASE(TestLethalFallIncapacitates) {
    EntityID g = addGnome(state, h.config, 5, FLAT_STAND);
    state.positions.at(g).y = 2.0f;
    state.healths.at(g).current = 20;

    stepWhile(g, GnomeState::IDLE);
    stepWhile(g, GnomeState::FALLING);

    BOOST_CHECK_EQUAL(state.healths.at(g).current, 0);
    BOOST_CHECK_EQUAL(state.gnomes.at(g).state, GnomeState::INCAPACITATED);
}

BOOST_AUTO_TEST_CASE(TestFallingDropsTheTask) {
    EntityID g = addGnome(state, h.config, 5, FLAT_STAND);
    EntityID dig = addDigTask(state, 5, FLAT_FLOOR);
    assignTask(state, g, dig, GnomeState::MINING);

    // Ground mined away under the miner
    state.setTileType(5, FLAT_FLOOR, TileType::AIR);
    physicsStep();

    BOOST_CHECK_EQUAL(state.gnomes.at(g).state, GnomeState::FALLING);
    BOOST_CHECK(!state.gnomes.at(g).currentTaskId);
    BOOST_CHECK(!state.tasks.at(dig).assignedGnome);
    BOOST_REQUIRE(state.gnomes.at(g).fallStartY);
    BOOST_CHECK_EQUAL(*state.gnomes.at(g).fallStartY, static_cast<float>(FLAT_STAND));

    stepWhile(g, GnomeState::FALLING);
    BOOST_CHECK_EQUAL(pos(g).y, static_cast<float>(FLAT_FLOOR));
}

BOOST_AUTO_TEST_CASE(TestWallGripStopsAFall) {
    // Gnome beside a pillar holds on instead of falling
    state.setTileType(6, 4, TileType::STONE);
    EntityID g = addGnome(state, h.config, 5, 4);

    physicsStep();
    BOOST_CHECK_EQUAL(state.gnomes.at(g).state, GnomeState::IDLE);
    BOOST_CHECK_EQUAL(pos(g).y, 4.0f);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(HealthTests, PhysicsFixture)

BOOST_AUTO_TEST_CASE(TestIncapacitatedGnomeRecovers) {
    SimConfig config = testConfig();
    config.healthRecoveryPerTick = 25;
    SystemHarness healer(config);

    EntityID g = addGnome(state, config, 5, FLAT_STAND);
    state.gnomes.at(g).state = GnomeState::INCAPACITATED;
    state.healths.at(g).current = 0;

    for (int i = 0; i < 3; ++i) {
        healer.run<HealthSystem>(state);
    }
    BOOST_CHECK_EQUAL(state.healths.at(g).current, 75);
    BOOST_CHECK_EQUAL(state.gnomes.at(g).state, GnomeState::INCAPACITATED);

    healer.run<HealthSystem>(state);
    BOOST_CHECK_EQUAL(state.healths.at(g).current, 100);
    BOOST_CHECK_EQUAL(state.gnomes.at(g).state, GnomeState::IDLE);
}

BOOST_AUTO_TEST_CASE(TestHealthyGnomesAreNotHealed) {
    EntityID g = addGnome(state, h.config, 5, FLAT_STAND);
    state.healths.at(g).current = 40;

    h.run<HealthSystem>(state);
    BOOST_CHECK_EQUAL(state.healths.at(g).current, 40);
}

BOOST_AUTO_TEST_CASE(TestIncapacitatedGnomeStaysPutOnTheGround) {
    EntityID g = addGnome(state, h.config, 5, FLAT_STAND);
    state.gnomes.at(g).state = GnomeState::INCAPACITATED;
    state.healths.at(g).current = 0;

    physicsStep();
    BOOST_CHECK_EQUAL(pos(g).y, static_cast<float>(FLAT_STAND));
    BOOST_CHECK_EQUAL(state.gnomes.at(g).state, GnomeState::INCAPACITATED);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(ResourcePhysicsTests, PhysicsFixture)

BOOST_AUTO_TEST_CASE(TestDroppedResourceLandsAndGetsOneCollectTask) {
    EntityID resource = state.createEntity();
    state.positions.emplace(resource, Position{5.0f, 3.0f});
    state.velocities.emplace(resource, Velocity{});
    state.resources.emplace(resource, Resource{ResourceType::STONE, false});

    int steps = 0;
    while (!state.resources.at(resource).isGrounded && steps < MAX_STEPS) {
        h.run<ResourcePhysicsSystem>(state);
        ++steps;
    }

    BOOST_CHECK(state.resources.at(resource).isGrounded);
    BOOST_CHECK_EQUAL(state.positions.at(resource).y, static_cast<float>(FLAT_STAND));
    EntityID task = state.findCollectTaskFor(resource);
    BOOST_REQUIRE(task != INVALID_ENTITY);

    for (int i = 0; i < 5; ++i) {
        h.run<ResourcePhysicsSystem>(state);
    }
    BOOST_CHECK_EQUAL(state.tasks.size(), 1u);
    BOOST_CHECK_EQUAL(checkInvariants(state, h.config.inventoryCapacity), "");
}

BOOST_AUTO_TEST_CASE(TestLostSupportCancelsTheCollectTask) {
    EntityID g = addGnome(state, h.config, 3, FLAT_STAND);
    EntityID resource = addGroundedResource(state, 5, FLAT_STAND);
    EntityID task = state.findCollectTaskFor(resource);
    assignTask(state, g, task, GnomeState::WALKING);

    state.setTileType(5, FLAT_FLOOR, TileType::AIR);
    h.run<ResourcePhysicsSystem>(state);

    BOOST_CHECK(!state.resources.at(resource).isGrounded);
    BOOST_CHECK(!state.tasks.contains(task));
    BOOST_CHECK(!state.gnomes.at(g).currentTaskId);
    BOOST_CHECK_EQUAL(state.gnomes.at(g).state, GnomeState::IDLE);

    // It drops into the hole and is collectable again
    int steps = 0;
    while (!state.resources.at(resource).isGrounded && steps < MAX_STEPS) {
        h.run<ResourcePhysicsSystem>(state);
        ++steps;
    }
    BOOST_CHECK_EQUAL(state.positions.at(resource).y, static_cast<float>(FLAT_FLOOR));
    BOOST_CHECK(state.findCollectTaskFor(resource) != INVALID_ENTITY);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(BoundsTests, PhysicsFixture)

BOOST_AUTO_TEST_CASE(TestMarginAroundTheWorld) {
    const int margin = 10;
    BOOST_CHECK(!BoundsSystem::isOutOfBounds(state, Position{-10.0f, 0.0f}, margin));
    BOOST_CHECK(BoundsSystem::isOutOfBounds(state, Position{-10.5f, 0.0f}, margin));
    BOOST_CHECK(!BoundsSystem::isOutOfBounds(state, Position{30.0f, 22.0f}, margin));
    BOOST_CHECK(BoundsSystem::isOutOfBounds(state, Position{30.5f, 0.0f}, margin));
    BOOST_CHECK(BoundsSystem::isOutOfBounds(state, Position{5.0f, 22.5f}, margin));
}

BOOST_AUTO_TEST_CASE(TestLostGnomeIsRemovedAndItsTaskFreed) {
    EntityID g = addGnome(state, h.config, 5, FLAT_STAND);
    EntityID dig = addDigTask(state, 6, FLAT_FLOOR);
    assignTask(state, g, dig, GnomeState::FALLING);
    state.positions.at(g).x = -40.0f;
    state.selectedGnomes = {g};

    h.run<BoundsSystem>(state);

    BOOST_CHECK(!state.gnomes.contains(g));
    BOOST_CHECK(!state.positions.contains(g));
    BOOST_CHECK(state.selectedGnomes.empty());
    BOOST_REQUIRE(state.tasks.contains(dig));
    BOOST_CHECK(!state.tasks.at(dig).assignedGnome);
}

BOOST_AUTO_TEST_CASE(TestLostResourceTakesItsTaskAlong) {
    EntityID resource = addGroundedResource(state, 5, FLAT_STAND);
    EntityID task = state.findCollectTaskFor(resource);
    state.positions.at(resource).y = 100.0f;

    h.run<BoundsSystem>(state);

    BOOST_CHECK(!state.resources.contains(resource));
    BOOST_CHECK(!state.tasks.contains(task));
}

BOOST_AUTO_TEST_CASE(TestEntitiesInsideTheWorldStay) {
    EntityID g = addGnome(state, h.config, 5, FLAT_STAND);
    EntityID resource = addGroundedResource(state, 7, FLAT_STAND);

    h.run<BoundsSystem>(state);

    BOOST_CHECK(state.gnomes.contains(g));
    BOOST_CHECK(state.resources.contains(resource));
}

BOOST_AUTO_TEST_SUITE_END()

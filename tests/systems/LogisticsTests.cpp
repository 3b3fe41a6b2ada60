/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE LogisticsTests
#include <boost/test/unit_test.hpp>

#include "../common/TestWorlds.hpp"
#include "systems/CollectTaskSystem.hpp"
#include "systems/DepositSystem.hpp"
#include "systems/MiningSystem.hpp"

using namespace DelveTest;

BOOST_GLOBAL_FIXTURE(QuietLogFixture);

struct LogisticsFixture {
    SystemHarness h;
    WorldState state;

    LogisticsFixture() : state(flatWorld()) {}

    EntityID miner(int x, int targetX, int targetY) {
        EntityID g = addGnome(state, h.config, x, FLAT_STAND);
        EntityID task = addDigTask(state, targetX, targetY);
        assignTask(state, g, task, GnomeState::MINING);
        return g;
    }

    EntityID collector(int x, EntityID resource) {
        EntityID g = addGnome(state, h.config, x, FLAT_STAND);
        assignTask(state, g, state.findCollectTaskFor(resource), GnomeState::COLLECTING);
        return g;
    }

    EntityID carrier(int x, size_t items) {
        EntityID g = addGnome(state, h.config, x, FLAT_STAND);
        for (size_t i = 0; i < items; ++i) {
            state.gnomes.at(g).inventory.push_back(i % 2 == 0 ? ResourceType::DIRT : ResourceType::STONE);
        }
        return g;
    }

    // Storage standing on the surface with its top-left at x
    EntityID storageAt(int x) { return placeStorage(state, x, FLAT_STAND - 1); }
};

BOOST_FIXTURE_TEST_SUITE(MiningTests, LogisticsFixture)

BOOST_AUTO_TEST_CASE(TestMiningWearsTheTileDown) {
    EntityID g = miner(4, 4, FLAT_FLOOR);
    EntityID task = *state.gnomes.at(g).currentTaskId;

    h.run<MiningSystem>(state);

    BOOST_CHECK_EQUAL(state.tileAt(4, FLAT_FLOOR)->durability, 98);
    BOOST_CHECK_EQUAL(state.tasks.at(task).progress, 2);
    BOOST_CHECK_EQUAL(state.gnomes.at(g).state, GnomeState::MINING);
}

BOOST_AUTO_TEST_CASE(TestBrokenTileDropsAResource) {
    EntityID g = miner(4, 5, FLAT_FLOOR);
    EntityID task = *state.gnomes.at(g).currentTaskId;
    state.selectedTiles = {TileCoord{5, FLAT_FLOOR}, TileCoord{9, FLAT_FLOOR}};
    const uint64_t revision = state.terrainRevision;

    // Dirt: 100 durability at 2 per tick
    for (int i = 0; i < 49; ++i) {
        h.run<MiningSystem>(state);
    }
    BOOST_CHECK_EQUAL(state.tasks.at(task).progress, 98);
    BOOST_CHECK(state.isSolid(5, FLAT_FLOOR));

    h.run<MiningSystem>(state);

    BOOST_CHECK(!state.isSolid(5, FLAT_FLOOR));
    BOOST_CHECK_GT(state.terrainRevision, revision);
    BOOST_CHECK(!state.tasks.contains(task));
    BOOST_CHECK(!state.gnomes.at(g).currentTaskId);
    BOOST_CHECK_EQUAL(state.gnomes.at(g).state, GnomeState::IDLE);
    BOOST_REQUIRE_EQUAL(state.selectedTiles.size(), 1u);
    BOOST_CHECK_EQUAL(state.selectedTiles[0], (TileCoord{9, FLAT_FLOOR}));

    BOOST_REQUIRE_EQUAL(state.resources.size(), 1u);
    const auto& [resourceId, resource] = *state.resources.begin();
    BOOST_CHECK_EQUAL(resource.type, ResourceType::DIRT);
    BOOST_CHECK(!resource.isGrounded);
    BOOST_CHECK(state.positions.at(resourceId) == (Position{5.0f, static_cast<float>(FLAT_FLOOR)}));
    // Falling resources have no collect task yet
    BOOST_CHECK_EQUAL(state.findCollectTaskFor(resourceId), INVALID_ENTITY);
}

BOOST_AUTO_TEST_CASE(TestStoneTakesLongerAndDropsStone) {
    state.setTileType(5, FLAT_FLOOR, TileType::STONE);
    EntityID g = miner(4, 5, FLAT_FLOOR);

    for (int i = 0; i < 199; ++i) {
        h.run<MiningSystem>(state);
    }
    BOOST_CHECK(state.isSolid(5, FLAT_FLOOR));
    h.run<MiningSystem>(state);
    BOOST_CHECK(!state.isSolid(5, FLAT_FLOOR));
    BOOST_CHECK_EQUAL(state.resources.begin()->second.type, ResourceType::STONE);
    BOOST_CHECK_EQUAL(state.gnomes.at(g).state, GnomeState::IDLE);
}

BOOST_AUTO_TEST_CASE(TestOutOfReachGivesTheTaskBack) {
    EntityID g = miner(1, 4, FLAT_FLOOR);
    EntityID task = *state.gnomes.at(g).currentTaskId;

    h.run<MiningSystem>(state);

    BOOST_CHECK_EQUAL(state.gnomes.at(g).state, GnomeState::IDLE);
    BOOST_CHECK(!state.tasks.at(task).assignedGnome);
    BOOST_CHECK_EQUAL(state.tileAt(4, FLAT_FLOOR)->durability, 100);
}

BOOST_AUTO_TEST_CASE(TestAlreadyOpenTileEndsTheTask) {
    EntityID g = miner(4, 5, FLAT_FLOOR);
    EntityID task = *state.gnomes.at(g).currentTaskId;
    state.setTileType(5, FLAT_FLOOR, TileType::AIR);

    h.run<MiningSystem>(state);

    BOOST_CHECK(!state.tasks.contains(task));
    BOOST_CHECK_EQUAL(state.gnomes.at(g).state, GnomeState::IDLE);
    BOOST_CHECK(state.resources.empty());
}

BOOST_AUTO_TEST_CASE(TestMinerWithoutATaskGoesIdle) {
    EntityID g = addGnome(state, h.config, 4, FLAT_STAND);
    state.gnomes.at(g).state = GnomeState::MINING;

    h.run<MiningSystem>(state);
    BOOST_CHECK_EQUAL(state.gnomes.at(g).state, GnomeState::IDLE);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(CollectTests, LogisticsFixture)

BOOST_AUTO_TEST_CASE(TestPickUpAnAdjacentResource) {
    EntityID resource = addGroundedResource(state, 5, FLAT_STAND, ResourceType::STONE);
    EntityID task = state.findCollectTaskFor(resource);
    EntityID g = collector(4, resource);

    h.run<CollectTaskSystem>(state);

    const Gnome& gnome = state.gnomes.at(g);
    BOOST_REQUIRE_EQUAL(gnome.inventory.size(), 1u);
    BOOST_CHECK_EQUAL(gnome.inventory[0], ResourceType::STONE);
    BOOST_CHECK_EQUAL(gnome.state, GnomeState::IDLE);
    BOOST_CHECK(!gnome.currentTaskId);
    BOOST_CHECK(!state.resources.contains(resource));
    BOOST_CHECK(!state.positions.contains(resource));
    BOOST_CHECK(!state.tasks.contains(task));
}

BOOST_AUTO_TEST_CASE(TestFullHandsLeaveTheResource) {
    EntityID resource = addGroundedResource(state, 5, FLAT_STAND);
    EntityID task = state.findCollectTaskFor(resource);
    EntityID g = collector(5, resource);
    for (size_t i = 0; i < h.config.inventoryCapacity; ++i) {
        state.gnomes.at(g).inventory.push_back(ResourceType::DIRT);
    }

    h.run<CollectTaskSystem>(state);

    BOOST_CHECK_EQUAL(state.gnomes.at(g).inventory.size(), h.config.inventoryCapacity);
    BOOST_CHECK_EQUAL(state.gnomes.at(g).state, GnomeState::IDLE);
    BOOST_CHECK(state.resources.contains(resource));
    BOOST_REQUIRE(state.tasks.contains(task));
    BOOST_CHECK(!state.tasks.at(task).assignedGnome);
}

BOOST_AUTO_TEST_CASE(TestTooFarToReach) {
    EntityID resource = addGroundedResource(state, 9, FLAT_STAND);
    EntityID g = collector(4, resource);

    h.run<CollectTaskSystem>(state);

    BOOST_CHECK(state.gnomes.at(g).inventory.empty());
    BOOST_CHECK(state.resources.contains(resource));
    BOOST_CHECK(!state.tasks.at(state.findCollectTaskFor(resource)).assignedGnome);
}

BOOST_AUTO_TEST_CASE(TestVanishedResourceEndsTheTask) {
    EntityID resource = addGroundedResource(state, 5, FLAT_STAND);
    EntityID task = state.findCollectTaskFor(resource);
    EntityID g = collector(5, resource);
    state.resources.erase(resource);

    h.run<CollectTaskSystem>(state);

    BOOST_CHECK(!state.tasks.contains(task));
    BOOST_CHECK_EQUAL(state.gnomes.at(g).state, GnomeState::IDLE);
    BOOST_CHECK(state.gnomes.at(g).inventory.empty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(DepositTests, LogisticsFixture)

BOOST_AUTO_TEST_CASE(TestCarrierHeadsToTheNearestSpot) {
    EntityID storage = storageAt(8);
    EntityID g = carrier(2, 3);

    h.run<DepositSystem>(state);

    const Gnome& gnome = state.gnomes.at(g);
    BOOST_CHECK(gnome.depositTargetStorage == storage);
    BOOST_CHECK_EQUAL(gnome.state, GnomeState::WALKING);
    BOOST_REQUIRE_EQUAL(gnome.path.size(), 5u);
    BOOST_CHECK_EQUAL(gnome.path.back(), (TileCoord{7, FLAT_STAND}));
}

BOOST_AUTO_TEST_CASE(TestDepositAtTheSpotFillsTheStorage) {
    EntityID storage = storageAt(8);
    EntityID g = carrier(10, 3);

    h.run<DepositSystem>(state);
    BOOST_CHECK_EQUAL(state.gnomes.at(g).state, GnomeState::DEPOSITING);
    BOOST_CHECK(state.gnomes.at(g).path.empty());

    h.run<DepositSystem>(state);

    const Gnome& gnome = state.gnomes.at(g);
    BOOST_CHECK(gnome.inventory.empty());
    BOOST_CHECK(!gnome.depositTargetStorage);
    BOOST_CHECK_EQUAL(gnome.state, GnomeState::IDLE);
    const Storage& contents = state.storages.at(storage);
    BOOST_CHECK_EQUAL(contents.count(ResourceType::DIRT), 2);
    BOOST_CHECK_EQUAL(contents.count(ResourceType::STONE), 1);
}

BOOST_AUTO_TEST_CASE(TestWalkerArrivesAndUnloads) {
    EntityID storage = storageAt(8);
    EntityID g = carrier(6, 1);
    h.run<DepositSystem>(state);
    BOOST_REQUIRE_EQUAL(state.gnomes.at(g).state, GnomeState::WALKING);

    // Arrival as the physics step leaves it
    state.positions.at(g).x = 7.0f;
    state.gnomes.at(g).pathIndex = state.gnomes.at(g).path.size();
    state.gnomes.at(g).state = GnomeState::DEPOSITING;

    h.run<DepositSystem>(state);
    BOOST_CHECK_EQUAL(state.storages.at(storage).count(ResourceType::DIRT), 1);
    BOOST_CHECK(state.gnomes.at(g).inventory.empty());
}

BOOST_AUTO_TEST_CASE(TestVanishedStorageKeepsTheInventory) {
    EntityID storage = storageAt(8);
    EntityID g = carrier(2, 2);
    h.run<DepositSystem>(state);
    BOOST_REQUIRE(state.gnomes.at(g).depositTargetStorage);

    state.destroyEntity(storage);
    h.run<DepositSystem>(state);

    const Gnome& gnome = state.gnomes.at(g);
    BOOST_CHECK(!gnome.depositTargetStorage);
    BOOST_CHECK_EQUAL(gnome.inventory.size(), 2u);
    BOOST_CHECK_EQUAL(gnome.state, GnomeState::IDLE);
    BOOST_CHECK(gnome.path.empty());
}

BOOST_AUTO_TEST_CASE(TestNothingHappensWithoutStorageOrCargo) {
    EntityID loaded = carrier(2, 2);
    h.run<DepositSystem>(state);
    BOOST_CHECK(!state.gnomes.at(loaded).depositTargetStorage);

    storageAt(8);
    EntityID empty = carrier(4, 0);
    h.run<DepositSystem>(state);
    BOOST_CHECK(!state.gnomes.at(empty).depositTargetStorage);
    BOOST_CHECK(state.gnomes.at(loaded).depositTargetStorage);
}

BOOST_AUTO_TEST_CASE(TestCloserStorageWins) {
    storageAt(3);
    EntityID near = storageAt(13);
    EntityID g = carrier(16, 1);

    h.run<DepositSystem>(state);

    BOOST_CHECK(state.gnomes.at(g).depositTargetStorage == near);
    BOOST_CHECK_EQUAL(state.gnomes.at(g).path.back(), (TileCoord{15, FLAT_STAND}));
}

BOOST_AUTO_TEST_CASE(TestDispatchEndsRest) {
    storageAt(8);
    EntityID g = carrier(2, 1);
    IdleBehavior rest;
    rest.type = IdleBehaviorType::RESTING;
    rest.endsAt = 400;
    state.gnomes.at(g).idleBehavior = rest;

    h.run<DepositSystem>(state);

    BOOST_CHECK(state.gnomes.at(g).depositTargetStorage);
    BOOST_CHECK(!state.gnomes.at(g).idleBehavior);
}

BOOST_AUTO_TEST_CASE(TestBatchedCarrierWaitsForAFullLoad) {
    SimConfig batching = testConfig();
    batching.batchDeposits = true;
    SystemHarness batched(batching);

    storageAt(8);
    EntityID partial = carrier(2, 2);
    EntityID full = carrier(4, batching.inventoryCapacity);
    EntityID loose = addGroundedResource(state, 15, FLAT_STAND);

    batched.run<DepositSystem>(state);
    BOOST_CHECK(!state.gnomes.at(partial).depositTargetStorage);
    BOOST_CHECK_EQUAL(state.gnomes.at(partial).state, GnomeState::IDLE);
    BOOST_CHECK(state.gnomes.at(full).depositTargetStorage);

    // Nothing left to collect: partial loads go too
    state.destroyTask(state.findCollectTaskFor(loose));
    batched.run<DepositSystem>(state);
    BOOST_CHECK(state.gnomes.at(partial).depositTargetStorage);
}

BOOST_AUTO_TEST_CASE(TestUnbatchedCarrierLeavesWithAnyLoad) {
    storageAt(8);
    EntityID g = carrier(2, 1);
    addGroundedResource(state, 15, FLAT_STAND);

    h.run<DepositSystem>(state);

    BOOST_CHECK(state.gnomes.at(g).depositTargetStorage);
}

BOOST_AUTO_TEST_SUITE_END()

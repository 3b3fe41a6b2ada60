/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE CommandProcessorTests
#include <boost/test/unit_test.hpp>

#include "../common/TestWorlds.hpp"
#include "commands/CommandProcessor.hpp"

using namespace DelveTest;

BOOST_GLOBAL_FIXTURE(QuietLogFixture);

struct CommandFixture {
    SimConfig config;
    CommandProcessor processor;
    WorldState state;

    CommandFixture() : config(testConfig()), processor(config), state(flatWorld()) {}
};

BOOST_FIXTURE_TEST_SUITE(SelectionTests, CommandFixture)

BOOST_AUTO_TEST_CASE(TestSelectTilesReplacesAndClearsGnomes) {
    EntityID gnome = addGnome(state, config, 3, FLAT_STAND);
    state.selectedGnomes = {gnome};
    state.selectedTiles = {TileCoord{0, 0}};

    BOOST_CHECK(processor.apply(state, SelectTiles{{TileCoord{2, FLAT_FLOOR}, TileCoord{3, FLAT_FLOOR}}, false}));
    BOOST_CHECK_EQUAL(state.selectedTiles.size(), 2u);
    BOOST_CHECK_EQUAL(state.selectedTiles[0], (TileCoord{2, FLAT_FLOOR}));
    BOOST_CHECK(state.selectedGnomes.empty());
}

BOOST_AUTO_TEST_CASE(TestAdditiveSelectTilesToggles) {
    state.selectedTiles = {TileCoord{1, FLAT_FLOOR}, TileCoord{2, FLAT_FLOOR}};

    processor.apply(state, SelectTiles{{TileCoord{2, FLAT_FLOOR}, TileCoord{5, FLAT_FLOOR}}, true});

    BOOST_REQUIRE_EQUAL(state.selectedTiles.size(), 2u);
    BOOST_CHECK_EQUAL(state.selectedTiles[0], (TileCoord{1, FLAT_FLOOR}));
    BOOST_CHECK_EQUAL(state.selectedTiles[1], (TileCoord{5, FLAT_FLOOR}));
}

BOOST_AUTO_TEST_CASE(TestSelectGnomesKeepsOnlyExistingIds) {
    EntityID a = addGnome(state, config, 3, FLAT_STAND);
    EntityID b = addGnome(state, config, 4, FLAT_STAND);
    state.selectedTiles = {TileCoord{1, FLAT_FLOOR}};

    processor.apply(state, SelectGnomes{{b, 4242, a}, false});

    BOOST_REQUIRE_EQUAL(state.selectedGnomes.size(), 2u);
    BOOST_CHECK_EQUAL(state.selectedGnomes[0], b);
    BOOST_CHECK_EQUAL(state.selectedGnomes[1], a);
    BOOST_CHECK(state.selectedTiles.empty());

    processor.apply(state, SelectGnomes{{a}, true});
    BOOST_REQUIRE_EQUAL(state.selectedGnomes.size(), 1u);
    BOOST_CHECK_EQUAL(state.selectedGnomes[0], b);
}

BOOST_AUTO_TEST_CASE(TestClearSelection) {
    state.selectedTiles = {TileCoord{1, 1}};
    state.selectedGnomes = {7};

    BOOST_CHECK(processor.apply(state, ClearSelection{}));
    BOOST_CHECK(state.selectedTiles.empty());
    BOOST_CHECK(state.selectedGnomes.empty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(DigCommandTests, CommandFixture)

BOOST_AUTO_TEST_CASE(TestDigCreatesOneTaskPerDiggableTile) {
    state.tick = 12;
    state.selectedTiles = {TileCoord{4, FLAT_FLOOR}};

    Dig dig;
    dig.tiles = {TileCoord{4, FLAT_FLOOR}, TileCoord{5, FLAT_FLOOR},
                 TileCoord{5, 2},                           // open air
                 TileCoord{5, FLAT_HEIGHT - 1},             // bedrock
                 TileCoord{-1, FLAT_FLOOR}};                // out of bounds
    dig.priority = TaskPriority::HIGH;

    BOOST_CHECK(processor.apply(state, dig));
    BOOST_CHECK_EQUAL(state.tasks.size(), 2u);
    BOOST_CHECK(state.selectedTiles.empty());

    EntityID taskId = state.findDigTaskAt(5, FLAT_FLOOR);
    BOOST_REQUIRE(taskId != INVALID_ENTITY);
    BOOST_CHECK_EQUAL(state.tasks.at(taskId).priority, TaskPriority::HIGH);
    BOOST_CHECK_EQUAL(state.tasks.at(taskId).createdAt, 12u);
    BOOST_CHECK(!state.tasks.at(taskId).assignedGnome);
}

BOOST_AUTO_TEST_CASE(TestDigSkipsTilesThatAlreadyHaveATask) {
    processor.apply(state, Dig{{TileCoord{4, FLAT_FLOOR}}, TaskPriority::NORMAL});
    EntityID original = state.findDigTaskAt(4, FLAT_FLOOR);

    BOOST_CHECK(!processor.apply(state, Dig{{TileCoord{4, FLAT_FLOOR}}, TaskPriority::URGENT}));
    BOOST_CHECK_EQUAL(state.tasks.size(), 1u);
    BOOST_CHECK_EQUAL(state.findDigTaskAt(4, FLAT_FLOOR), original);
    BOOST_CHECK_EQUAL(state.tasks.at(original).priority, TaskPriority::NORMAL);
}

BOOST_AUTO_TEST_CASE(TestRejectedDigKeepsTheSelection) {
    state.selectedTiles = {TileCoord{5, FLAT_HEIGHT - 1}};
    const WorldState before = state;

    BOOST_CHECK(!processor.apply(state, Dig{{TileCoord{5, FLAT_HEIGHT - 1}, TileCoord{5, 2}},
                                            TaskPriority::NORMAL}));
    BOOST_CHECK(state == before);
    BOOST_CHECK_EQUAL(state.selectedTiles.size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestCancelDigDetachesTheGnome) {
    EntityID gnome = addGnome(state, config, 4, FLAT_STAND);
    processor.apply(state, Dig{{TileCoord{4, FLAT_FLOOR}}, TaskPriority::NORMAL});
    EntityID task = state.findDigTaskAt(4, FLAT_FLOOR);
    assignTask(state, gnome, task, GnomeState::MINING);

    BOOST_CHECK(processor.apply(state, CancelDig{{TileCoord{4, FLAT_FLOOR}, TileCoord{9, FLAT_FLOOR}}}));
    BOOST_CHECK(state.tasks.empty());
    BOOST_CHECK(!state.gnomes.at(gnome).currentTaskId);
    BOOST_CHECK_EQUAL(state.gnomes.at(gnome).state, GnomeState::IDLE);

    BOOST_CHECK(!processor.apply(state, CancelDig{{TileCoord{4, FLAT_FLOOR}}}));
}

BOOST_AUTO_TEST_CASE(TestCancelTask) {
    processor.apply(state, Dig{{TileCoord{6, FLAT_FLOOR}}, TaskPriority::LOW});
    EntityID task = state.findDigTaskAt(6, FLAT_FLOOR);

    BOOST_CHECK(processor.apply(state, CancelTask{task}));
    BOOST_CHECK(!state.tasks.contains(task));
    BOOST_CHECK(!processor.apply(state, CancelTask{task}));
}

BOOST_AUTO_TEST_CASE(TestCollectTasksCannotBeCancelled) {
    EntityID resource = addGroundedResource(state, 6, FLAT_STAND);
    EntityID task = state.findCollectTaskFor(resource);

    BOOST_CHECK(!processor.apply(state, CancelTask{task}));
    BOOST_CHECK(state.tasks.contains(task));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(CameraCommandTests, CommandFixture)

BOOST_AUTO_TEST_CASE(TestPanMovesTheTarget) {
    const Camera before = state.camera;
    processor.apply(state, PanCamera{64.0f, -32.0f});

    BOOST_CHECK_CLOSE(state.camera.targetX, before.targetX + 64.0f, 0.001f);
    BOOST_CHECK_CLOSE(state.camera.targetY, before.targetY - 32.0f, 0.001f);
    // Only the frame loop eases the camera itself
    BOOST_CHECK_EQUAL(state.camera.x, before.x);
}

BOOST_AUTO_TEST_CASE(TestZoomKeepsThePointUnderTheMouse) {
    state.camera.targetX = 100.0f;
    state.camera.targetY = 50.0f;

    ZoomCamera zoom{1.0f, 600.0f, 200.0f, 800.0f, 600.0f};
    const float worldX = (zoom.mouseX - 400.0f) / 1.0f + 100.0f;
    const float worldY = (zoom.mouseY - 300.0f) / 1.0f + 50.0f;

    BOOST_CHECK(processor.apply(state, zoom));
    BOOST_CHECK_CLOSE(state.camera.zoom, 2.0f, 0.001f);

    const float afterX = (zoom.mouseX - 400.0f) / state.camera.zoom + state.camera.targetX;
    const float afterY = (zoom.mouseY - 300.0f) / state.camera.zoom + state.camera.targetY;
    BOOST_CHECK_CLOSE(afterX, worldX, 0.001f);
    BOOST_CHECK_CLOSE(afterY, worldY, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestZoomClampsAndRejectsNoChange) {
    BOOST_CHECK(processor.apply(state, ZoomCamera{100.0f, 0.0f, 0.0f, 800.0f, 600.0f}));
    BOOST_CHECK_CLOSE(state.camera.zoom, config.maxZoom, 0.001f);

    BOOST_CHECK(!processor.apply(state, ZoomCamera{1.0f, 0.0f, 0.0f, 800.0f, 600.0f}));

    BOOST_CHECK(processor.apply(state, ZoomCamera{-100.0f, 0.0f, 0.0f, 800.0f, 600.0f}));
    BOOST_CHECK_CLOSE(state.camera.zoom, config.minZoom, 0.001f);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(ControlCommandTests, CommandFixture)

BOOST_AUTO_TEST_CASE(TestSetSpeedAcceptsOnlyConfiguredMultipliers) {
    BOOST_CHECK(processor.apply(state, SetSpeed{3}));
    BOOST_CHECK_EQUAL(state.speed, 3);

    BOOST_CHECK(!processor.apply(state, SetSpeed{5}));
    BOOST_CHECK(!processor.apply(state, SetSpeed{0}));
    BOOST_CHECK_EQUAL(state.speed, 3);
}

BOOST_AUTO_TEST_CASE(TestTogglePause) {
    BOOST_CHECK(processor.apply(state, TogglePause{}));
    BOOST_CHECK(state.isPaused);
    BOOST_CHECK(processor.apply(state, TogglePause{}));
    BOOST_CHECK(!state.isPaused);
}

BOOST_AUTO_TEST_CASE(TestSpawnGnomeAtAndNearCentre) {
    BOOST_CHECK(processor.apply(state, SpawnGnome{TileCoord{2, FLAT_STAND}}));
    BOOST_CHECK(processor.apply(state, SpawnGnome{}));
    BOOST_REQUIRE_EQUAL(state.gnomes.size(), 2u);

    auto it = state.gnomes.begin();
    ++it;
    BOOST_CHECK(state.positions.at(it->first) ==
                (Position{static_cast<float>(FLAT_WIDTH / 2), static_cast<float>(FLAT_STAND)}));

    // Midair and inside rock are refused
    BOOST_CHECK(!processor.apply(state, SpawnGnome{TileCoord{2, 1}}));
    BOOST_CHECK(!processor.apply(state, SpawnGnome{TileCoord{2, FLAT_FLOOR}}));
    BOOST_CHECK_EQUAL(state.gnomes.size(), 2u);
}

BOOST_AUTO_TEST_CASE(TestSpawnGnomeWithoutGroundFails) {
    InitialTerrain sky;
    sky.width = 4;
    sky.height = 4;
    sky.tiles.assign(16, TileType::AIR);
    WorldState empty = createWorld(sky);

    BOOST_CHECK(!processor.apply(empty, SpawnGnome{}));
    BOOST_CHECK(empty.gnomes.empty());
}

BOOST_AUTO_TEST_CASE(TestPlaceBuilding) {
    BOOST_CHECK(processor.apply(state, PlaceBuilding{BuildingType::STORAGE, 12, FLAT_STAND - 1}));
    BOOST_CHECK_EQUAL(state.storages.size(), 1u);
    BOOST_CHECK(!processor.apply(state, PlaceBuilding{BuildingType::STORAGE, 13, FLAT_STAND - 1}));
    BOOST_CHECK_EQUAL(state.storages.size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestReduceLeavesTheInputUntouched) {
    const WorldState before = state;
    WorldState after = processor.reduce(state, TogglePause{});

    BOOST_CHECK(state == before);
    BOOST_CHECK(after.isPaused);
}

BOOST_AUTO_TEST_CASE(TestCommandNames) {
    BOOST_CHECK_EQUAL(commandName(Command{Dig{}}), "Dig");
    BOOST_CHECK_EQUAL(commandName(Command{TogglePause{}}), "TogglePause");
    BOOST_CHECK_EQUAL(commandName(Command{PlaceBuilding{}}), "PlaceBuilding");
}

BOOST_AUTO_TEST_SUITE_END()

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef WORLD_FACTORY_HPP
#define WORLD_FACTORY_HPP

#include "world/WorldState.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace Delve {

struct SimConfig;

/**
 * @brief Pre-generated terrain handed over by the world generator
 *
 * Row-major, width * height entries. horizonY is informational (sky
 * rendering) and not used by any system.
 */
struct InitialTerrain {
    int width{0};
    int height{0};
    int horizonY{0};
    uint32_t seed{0};
    std::vector<TileType> tiles;
};

/**
 * @brief Builds a simple layered terrain: sky above the horizon, a dirt
 * band, stone below it and a bedrock floor
 *
 * Stand-in for the real generator, used by the driver and tests.
 */
InitialTerrain makeLayeredTerrain(int width, int height, uint32_t seed, int dirtDepth = 4);

/**
 * @brief Creates the initial world state from terrain
 *
 * One tile entity is created per non-air cell, in row-major order. The
 * camera is centred horizontally on the world at the horizon.
 *
 * @throws std::invalid_argument if the dimensions are non-positive or the
 *         tile vector does not match them
 */
WorldState createWorld(const InitialTerrain& terrain);

/**
 * @brief Finds a standable tile for a new gnome
 *
 * Searches columns from the centre outward (centre, +1, -1, +2, ...) and
 * returns the surface of the first column that has one.
 */
std::optional<TileCoord> findSpawnPosition(const WorldState& state);

/**
 * @brief Adds a gnome with full health at a tile
 * @return New gnome id
 */
EntityID spawnGnome(WorldState& state, const SimConfig& config, const TileCoord& at);

/**
 * @brief Checks the placement rules for a storage anchored at its top-left tile
 *
 * Every footprint tile must be passable, the row directly beneath the
 * footprint must be solid and no existing building may overlap.
 */
bool canPlaceStorage(const WorldState& state, int x, int y);

/**
 * @brief Places a storage if canPlaceStorage() allows it
 * @return Storage id, INVALID_ENTITY when the placement is invalid
 */
EntityID placeStorage(WorldState& state, int x, int y);

/**
 * @brief Tiles a gnome stands on to use a storage
 *
 * Left and right of the footprint on its bottom row, when standable.
 */
std::vector<TileCoord> depositSpots(const WorldState& state, EntityID storage);

} // namespace Delve

#endif // WORLD_FACTORY_HPP

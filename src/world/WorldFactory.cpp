/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/WorldFactory.hpp"
#include "core/Logger.hpp"
#include "core/SimConfig.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace Delve {

InitialTerrain makeLayeredTerrain(int width, int height, uint32_t seed, int dirtDepth) {
    InitialTerrain terrain;
    terrain.width = width;
    terrain.height = height;
    terrain.horizonY = static_cast<int>(std::floor(height * 0.3));
    terrain.seed = seed;
    if (width <= 0 || height <= 0) {
        return terrain;
    }

    terrain.tiles.assign(static_cast<size_t>(width) * static_cast<size_t>(height), TileType::AIR);
    for (int y = 0; y < height; ++y) {
        TileType type = TileType::AIR;
        if (y == height - 1) {
            type = TileType::BEDROCK;
        } else if (y > terrain.horizonY + dirtDepth) {
            type = TileType::STONE;
        } else if (y > terrain.horizonY) {
            type = TileType::DIRT;
        }
        for (int x = 0; x < width; ++x) {
            terrain.tiles[static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x)] = type;
        }
    }
    return terrain;
}

WorldState createWorld(const InitialTerrain& terrain) {
    if (terrain.width <= 0 || terrain.height <= 0) {
        throw std::invalid_argument("World dimensions must be positive: " +
                                    std::to_string(terrain.width) + "x" + std::to_string(terrain.height));
    }
    const size_t expected = static_cast<size_t>(terrain.width) * static_cast<size_t>(terrain.height);
    if (terrain.tiles.size() != expected) {
        throw std::invalid_argument("Terrain has " + std::to_string(terrain.tiles.size()) +
                                    " tiles, expected " + std::to_string(expected));
    }

    WorldState state;
    state.seed = terrain.seed;
    state.worldWidth = terrain.width;
    state.worldHeight = terrain.height;
    state.horizonY = terrain.horizonY;
    state.tileGrid.assign(expected, INVALID_ENTITY);

    for (int y = 0; y < terrain.height; ++y) {
        for (int x = 0; x < terrain.width; ++x) {
            const TileType type =
                terrain.tiles[static_cast<size_t>(y) * static_cast<size_t>(terrain.width) + static_cast<size_t>(x)];
            if (type != TileType::AIR) {
                state.setTileType(x, y, type);
            }
        }
    }
    // Building the terrain is not a terrain change
    state.terrainRevision = 0;

    state.camera.x = static_cast<float>(terrain.width) * TILE_SIZE / 2.0f;
    state.camera.y = static_cast<float>(terrain.horizonY) * TILE_SIZE;
    state.camera.targetX = state.camera.x;
    state.camera.targetY = state.camera.y;

    WORLD_INFO("Created " + std::to_string(terrain.width) + "x" + std::to_string(terrain.height) +
               " world with " + std::to_string(state.tiles.size()) + " tiles, seed " +
               std::to_string(terrain.seed));
    return state;
}

std::optional<TileCoord> findSpawnPosition(const WorldState& state) {
    const int centre = state.worldWidth / 2;
    for (int offset = 0; offset <= state.worldWidth; ++offset) {
        for (int x : {centre + offset, centre - offset}) {
            if (x < 0 || x >= state.worldWidth) {
                continue;
            }
            const int y = state.surfaceY(x);
            if (y >= 0) {
                return TileCoord{x, y};
            }
            if (offset == 0) {
                break;
            }
        }
    }
    return std::nullopt;
}

EntityID spawnGnome(WorldState& state, const SimConfig& config, const TileCoord& at) {
    EntityID id = state.createEntity();
    state.positions.emplace(id, Position{static_cast<float>(at.x), static_cast<float>(at.y)});
    state.velocities.emplace(id, Velocity{});
    state.gnomes.emplace(id, Gnome{});
    state.healths.emplace(id, Health{config.gnomeMaxHealth, config.gnomeMaxHealth});

    WORLD_DEBUG("Spawned gnome " + std::to_string(id) + " at (" + std::to_string(at.x) + "," +
                std::to_string(at.y) + ")");
    return id;
}

bool canPlaceStorage(const WorldState& state, int x, int y) {
    for (int dy = 0; dy < STORAGE_HEIGHT; ++dy) {
        for (int dx = 0; dx < STORAGE_WIDTH; ++dx) {
            if (!state.isPassable(x + dx, y + dy)) {
                return false;
            }
        }
    }
    for (int dx = 0; dx < STORAGE_WIDTH; ++dx) {
        if (!state.isSolid(x + dx, y + STORAGE_HEIGHT)) {
            return false;
        }
    }

    for (const auto& [id, building] : state.buildings) {
        auto pos = state.positions.find(id);
        if (pos == state.positions.end()) {
            continue;
        }
        const int bx = static_cast<int>(pos->second.x);
        const int by = static_cast<int>(pos->second.y);
        const bool overlapX = x < bx + building.width && bx < x + STORAGE_WIDTH;
        const bool overlapY = y < by + building.height && by < y + STORAGE_HEIGHT;
        if (overlapX && overlapY) {
            return false;
        }
    }
    return true;
}

EntityID placeStorage(WorldState& state, int x, int y) {
    if (!canPlaceStorage(state, x, y)) {
        return INVALID_ENTITY;
    }

    EntityID id = state.createEntity();
    state.positions.emplace(id, Position{static_cast<float>(x), static_cast<float>(y)});
    state.buildings.emplace(id, Building{BuildingType::STORAGE, STORAGE_WIDTH, STORAGE_HEIGHT});
    state.storages.emplace(id, Storage{});

    LOGISTICS_INFO("Storage " + std::to_string(id) + " placed at (" + std::to_string(x) + "," +
                   std::to_string(y) + ")");
    return id;
}

std::vector<TileCoord> depositSpots(const WorldState& state, EntityID storage) {
    std::vector<TileCoord> spots;
    auto building = state.buildings.find(storage);
    auto pos = state.positions.find(storage);
    if (building == state.buildings.end() || pos == state.positions.end()) {
        return spots;
    }

    const int x = static_cast<int>(pos->second.x);
    const int bottom = static_cast<int>(pos->second.y) + building->second.height - 1;
    for (int sx : {x - 1, x + building->second.width}) {
        if (state.canStandAt(sx, bottom)) {
            spots.push_back(TileCoord{sx, bottom});
        }
    }
    return spots;
}

} // namespace Delve

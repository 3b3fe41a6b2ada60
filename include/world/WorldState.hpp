/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef WORLD_STATE_HPP
#define WORLD_STATE_HPP

#include "world/Components.hpp"
#include <boost/container/flat_map.hpp>
#include <cstdint>
#include <vector>

namespace Delve {

/**
 * Component storage keyed by entity id. Ordered so that every system walks
 * entities in ascending id order, independent of insertion history.
 */
template<typename T>
using ComponentMap = boost::container::flat_map<EntityID, T>;

/**
 * @brief The complete, authoritative simulation state
 *
 * A plain aggregate threaded explicitly through the command processor and
 * every system. Holds the entity id counter, one map per component type,
 * the tile grid index and the presentation fields (camera, selection).
 * Nothing in here is a cache: two states that compare equal produce the
 * same future under the same commands.
 *
 * Tile coordinates grow rightward (x) and downward (y). A gnome at tile
 * (x, y) stands on tile (x, y + 1).
 */
struct WorldState {
    // Metadata
    uint32_t seed{0};
    uint64_t tick{0};
    bool isPaused{false};
    int speed{1};
    EntityID nextEntityId{1};

    // Terrain
    int worldWidth{0};
    int worldHeight{0};
    int horizonY{0};
    uint64_t terrainRevision{0};          // bumped on every tile change
    std::vector<EntityID> tileGrid;       // row-major, INVALID_ENTITY = open air

    // Components
    ComponentMap<Position> positions;
    ComponentMap<Velocity> velocities;
    ComponentMap<Tile> tiles;
    ComponentMap<Gnome> gnomes;
    ComponentMap<Task> tasks;
    ComponentMap<Resource> resources;
    ComponentMap<Building> buildings;
    ComponentMap<Storage> storages;
    ComponentMap<Health> healths;

    // Presentation
    Camera camera;
    std::vector<TileCoord> selectedTiles;
    std::vector<EntityID> selectedGnomes;

    bool operator==(const WorldState&) const = default;

    // Entity store

    /**
     * @brief Allocates the next entity id
     * @return Fresh id, never returned before by this state
     */
    EntityID createEntity();

    /**
     * @brief Removes an entity from every component map and the tile grid
     * @param entity Entity to destroy (unknown ids are ignored)
     */
    void destroyEntity(EntityID entity);

    bool exists(EntityID entity) const;

    // Terrain queries

    bool inBounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < worldWidth && y < worldHeight;
    }

    /**
     * @return Tile entity at a cell, INVALID_ENTITY for open air or out of bounds
     */
    EntityID tileEntityAt(int x, int y) const;

    /**
     * @return Tile component at a cell, nullptr when the cell has none
     */
    const Tile* tileAt(int x, int y) const;
    Tile* tileAt(int x, int y);

    TileType tileTypeAt(int x, int y) const;

    // Out-of-bounds cells are never solid
    bool isSolid(int x, int y) const;
    bool isPassable(int x, int y) const { return inBounds(x, y) && !isSolid(x, y); }

    // Solid tile directly left or right to hold onto
    bool hasGrip(int x, int y) const { return isSolid(x - 1, y) || isSolid(x + 1, y); }

    bool canStandAt(int x, int y) const { return isPassable(x, y) && isSolid(x, y + 1); }
    bool canHoldAt(int x, int y) const {
        return isPassable(x, y) && (isSolid(x, y + 1) || hasGrip(x, y));
    }

    /**
     * @brief Finds the standing row on top of the first solid tile in a column
     * @return Row index, or -1 when the column has no solid tile with air above
     */
    int surfaceY(int x) const;

    /**
     * @brief Replaces a cell's tile type and bumps the terrain revision
     */
    void setTileType(int x, int y, TileType type);

    // Relationship helpers shared by systems and the command processor

    /**
     * @brief Clears both sides of a task assignment
     *
     * The gnome loses its task, its path and returns to IDLE unless it is
     * falling or incapacitated. The task becomes unassigned.
     */
    void unassignTask(EntityID taskId);

    /**
     * @brief Destroys a task, detaching its gnome first
     */
    void destroyTask(EntityID taskId);

    /**
     * @brief Clears a gnome's idle behavior and, for socializing, its partner's too
     */
    void clearIdleBehavior(EntityID gnomeId);

    /**
     * @return Collect task that references the resource, INVALID_ENTITY if none
     */
    EntityID findCollectTaskFor(EntityID resource) const;

    /**
     * @return Dig task targeting the tile, INVALID_ENTITY if none
     */
    EntityID findDigTaskAt(int x, int y) const;

    /**
     * @brief Creates a Normal-priority Collect task for a grounded resource
     * @return New task id, or the existing one if the resource already has one
     */
    EntityID createCollectTask(EntityID resource);

private:
    size_t gridIndex(int x, int y) const {
        return static_cast<size_t>(y) * static_cast<size_t>(worldWidth) + static_cast<size_t>(x);
    }
};

/**
 * @brief Floors a float position to the tile it occupies
 */
TileCoord toTile(const Position& position);

int manhattan(const TileCoord& a, const TileCoord& b);

} // namespace Delve

#endif // WORLD_STATE_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/WorldState.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace Delve {

EntityID WorldState::createEntity() {
    return nextEntityId++;
}

void WorldState::destroyEntity(EntityID entity) {
    if (entity == INVALID_ENTITY) {
        return;
    }

    // Tiles are also indexed by the grid
    if (auto it = tiles.find(entity); it != tiles.end()) {
        auto pos = positions.find(entity);
        if (pos != positions.end()) {
            const int x = static_cast<int>(pos->second.x);
            const int y = static_cast<int>(pos->second.y);
            if (inBounds(x, y) && tileGrid[gridIndex(x, y)] == entity) {
                tileGrid[gridIndex(x, y)] = INVALID_ENTITY;
                ++terrainRevision;
            }
        }
    }

    positions.erase(entity);
    velocities.erase(entity);
    tiles.erase(entity);
    gnomes.erase(entity);
    tasks.erase(entity);
    resources.erase(entity);
    buildings.erase(entity);
    storages.erase(entity);
    healths.erase(entity);

    selectedGnomes.erase(std::remove(selectedGnomes.begin(), selectedGnomes.end(), entity),
                         selectedGnomes.end());
}

bool WorldState::exists(EntityID entity) const {
    return positions.contains(entity) || tiles.contains(entity) || gnomes.contains(entity) ||
           tasks.contains(entity) || resources.contains(entity) || buildings.contains(entity);
}

EntityID WorldState::tileEntityAt(int x, int y) const {
    if (!inBounds(x, y) || tileGrid.empty()) {
        return INVALID_ENTITY;
    }
    return tileGrid[gridIndex(x, y)];
}

const Tile* WorldState::tileAt(int x, int y) const {
    EntityID entity = tileEntityAt(x, y);
    if (entity == INVALID_ENTITY) {
        return nullptr;
    }
    auto it = tiles.find(entity);
    return it != tiles.end() ? &it->second : nullptr;
}

Tile* WorldState::tileAt(int x, int y) {
    EntityID entity = tileEntityAt(x, y);
    if (entity == INVALID_ENTITY) {
        return nullptr;
    }
    auto it = tiles.find(entity);
    return it != tiles.end() ? &it->second : nullptr;
}

TileType WorldState::tileTypeAt(int x, int y) const {
    const Tile* tile = tileAt(x, y);
    return tile ? tile->type : TileType::AIR;
}

bool WorldState::isSolid(int x, int y) const {
    return tileTypeAt(x, y) != TileType::AIR;
}

int WorldState::surfaceY(int x) const {
    for (int y = 0; y < worldHeight - 1; ++y) {
        if (canStandAt(x, y)) {
            return y;
        }
    }
    return -1;
}

void WorldState::setTileType(int x, int y, TileType type) {
    if (!inBounds(x, y)) {
        return;
    }

    const TileProperties props = getTileProperties(type);
    if (Tile* tile = tileAt(x, y)) {
        if (tile->type == type) {
            return;
        }
        tile->type = type;
        tile->durability = props.durability;
    } else {
        if (type == TileType::AIR) {
            return;
        }
        EntityID entity = createEntity();
        positions.emplace_hint(positions.end(), entity,
                               Position{static_cast<float>(x), static_cast<float>(y)});
        tiles.emplace_hint(tiles.end(), entity, Tile{type, props.durability});
        tileGrid[gridIndex(x, y)] = entity;
    }
    ++terrainRevision;
}

void WorldState::unassignTask(EntityID taskId) {
    auto taskIt = tasks.find(taskId);
    if (taskIt == tasks.end() || !taskIt->second.assignedGnome) {
        return;
    }

    const EntityID gnomeId = *taskIt->second.assignedGnome;
    taskIt->second.assignedGnome.reset();

    auto gnomeIt = gnomes.find(gnomeId);
    if (gnomeIt == gnomes.end()) {
        return;
    }

    Gnome& gnome = gnomeIt->second;
    if (gnome.currentTaskId == taskId) {
        gnome.currentTaskId.reset();
        gnome.path.clear();
        gnome.pathIndex = 0;
        if (gnome.state != GnomeState::FALLING && gnome.state != GnomeState::INCAPACITATED) {
            gnome.state = GnomeState::IDLE;
        }
    }
}

void WorldState::destroyTask(EntityID taskId) {
    unassignTask(taskId);
    destroyEntity(taskId);
}

void WorldState::clearIdleBehavior(EntityID gnomeId) {
    auto it = gnomes.find(gnomeId);
    if (it == gnomes.end() || !it->second.idleBehavior) {
        return;
    }

    const IdleBehavior behavior = *it->second.idleBehavior;
    it->second.idleBehavior.reset();

    if (behavior.type == IdleBehaviorType::SOCIALIZING && behavior.partner) {
        auto partnerIt = gnomes.find(*behavior.partner);
        if (partnerIt != gnomes.end() && partnerIt->second.idleBehavior &&
            partnerIt->second.idleBehavior->type == IdleBehaviorType::SOCIALIZING &&
            partnerIt->second.idleBehavior->partner == gnomeId) {
            partnerIt->second.idleBehavior.reset();
        }
    }
}

EntityID WorldState::findCollectTaskFor(EntityID resource) const {
    for (const auto& [id, task] : tasks) {
        if (task.type == TaskType::COLLECT && task.targetEntity == resource) {
            return id;
        }
    }
    return INVALID_ENTITY;
}

EntityID WorldState::findDigTaskAt(int x, int y) const {
    for (const auto& [id, task] : tasks) {
        if (task.type == TaskType::DIG && task.targetX == x && task.targetY == y) {
            return id;
        }
    }
    return INVALID_ENTITY;
}

EntityID WorldState::createCollectTask(EntityID resource) {
    if (EntityID existing = findCollectTaskFor(resource); existing != INVALID_ENTITY) {
        return existing;
    }

    auto pos = positions.find(resource);
    if (pos == positions.end()) {
        return INVALID_ENTITY;
    }

    const TileCoord target = toTile(pos->second);
    EntityID taskId = createEntity();

    Task task;
    task.type = TaskType::COLLECT;
    task.targetX = target.x;
    task.targetY = target.y;
    task.priority = TaskPriority::NORMAL;
    task.createdAt = tick;
    task.targetEntity = resource;
    tasks.emplace_hint(tasks.end(), taskId, task);

    LOGISTICS_DEBUG("Collect task " + std::to_string(taskId) + " created for resource " +
                    std::to_string(resource));
    return taskId;
}

TileCoord toTile(const Position& position) {
    return TileCoord{static_cast<int>(std::floor(position.x)),
                     static_cast<int>(std::floor(position.y))};
}

int manhattan(const TileCoord& a, const TileCoord& b) {
    return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

} // namespace Delve

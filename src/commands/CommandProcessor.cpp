/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "commands/CommandProcessor.hpp"
#include "core/Logger.hpp"
#include "core/SimConfig.hpp"
#include "world/WorldFactory.hpp"
#include <algorithm>
#include <string>
#include <type_traits>

namespace Delve {

namespace {

template<typename>
inline constexpr bool always_false_v = false;

} // namespace

std::string_view commandName(const Command& command) {
    return std::visit([](auto&& arg) -> std::string_view {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, SelectTiles>) {
            return "SelectTiles";
        } else if constexpr (std::is_same_v<T, SelectGnomes>) {
            return "SelectGnomes";
        } else if constexpr (std::is_same_v<T, ClearSelection>) {
            return "ClearSelection";
        } else if constexpr (std::is_same_v<T, Dig>) {
            return "Dig";
        } else if constexpr (std::is_same_v<T, CancelDig>) {
            return "CancelDig";
        } else if constexpr (std::is_same_v<T, CancelTask>) {
            return "CancelTask";
        } else if constexpr (std::is_same_v<T, PanCamera>) {
            return "PanCamera";
        } else if constexpr (std::is_same_v<T, ZoomCamera>) {
            return "ZoomCamera";
        } else if constexpr (std::is_same_v<T, SetSpeed>) {
            return "SetSpeed";
        } else if constexpr (std::is_same_v<T, TogglePause>) {
            return "TogglePause";
        } else if constexpr (std::is_same_v<T, SpawnGnome>) {
            return "SpawnGnome";
        } else if constexpr (std::is_same_v<T, PlaceBuilding>) {
            return "PlaceBuilding";
        } else {
            static_assert(always_false_v<T>, "unhandled command");
        }
    }, command);
}

bool CommandProcessor::apply(WorldState& state, const Command& command) const {
    const bool accepted = std::visit([&](auto&& arg) -> bool {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, SelectTiles>) {
            return selectTiles(state, arg);
        } else if constexpr (std::is_same_v<T, SelectGnomes>) {
            return selectGnomes(state, arg);
        } else if constexpr (std::is_same_v<T, ClearSelection>) {
            return clearSelection(state);
        } else if constexpr (std::is_same_v<T, Dig>) {
            return dig(state, arg);
        } else if constexpr (std::is_same_v<T, CancelDig>) {
            return cancelDig(state, arg);
        } else if constexpr (std::is_same_v<T, CancelTask>) {
            return cancelTask(state, arg.taskId);
        } else if constexpr (std::is_same_v<T, PanCamera>) {
            return panCamera(state, arg);
        } else if constexpr (std::is_same_v<T, ZoomCamera>) {
            return zoomCamera(state, arg);
        } else if constexpr (std::is_same_v<T, SetSpeed>) {
            return setSpeed(state, arg);
        } else if constexpr (std::is_same_v<T, TogglePause>) {
            return togglePause(state);
        } else if constexpr (std::is_same_v<T, SpawnGnome>) {
            return spawnGnome(state, arg);
        } else if constexpr (std::is_same_v<T, PlaceBuilding>) {
            return placeBuilding(state, arg);
        } else {
            static_assert(always_false_v<T>, "unhandled command");
        }
    }, command);

    if (!accepted) {
        COMMAND_DEBUG("Rejected " + std::string(commandName(command)) + " at tick " +
                      std::to_string(state.tick));
    }
    return accepted;
}

bool CommandProcessor::selectTiles(WorldState& state, const SelectTiles& command) const {
    if (!command.additive) {
        state.selectedTiles = command.tiles;
        state.selectedGnomes.clear();
        return true;
    }

    for (const TileCoord& tile : command.tiles) {
        auto it = std::find(state.selectedTiles.begin(), state.selectedTiles.end(), tile);
        if (it != state.selectedTiles.end()) {
            state.selectedTiles.erase(it);
        } else {
            state.selectedTiles.push_back(tile);
        }
    }
    return true;
}

bool CommandProcessor::selectGnomes(WorldState& state, const SelectGnomes& command) const {
    if (!command.additive) {
        state.selectedGnomes.clear();
    }

    for (EntityID id : command.ids) {
        auto it = std::find(state.selectedGnomes.begin(), state.selectedGnomes.end(), id);
        if (it != state.selectedGnomes.end()) {
            if (command.additive) {
                state.selectedGnomes.erase(it);
            }
        } else if (state.gnomes.contains(id)) {
            state.selectedGnomes.push_back(id);
        }
    }
    state.selectedTiles.clear();
    return true;
}

bool CommandProcessor::clearSelection(WorldState& state) const {
    state.selectedTiles.clear();
    state.selectedGnomes.clear();
    return true;
}

bool CommandProcessor::dig(WorldState& state, const Dig& command) const {
    int created = 0;
    for (const TileCoord& tile : command.tiles) {
        if (!state.inBounds(tile.x, tile.y)) {
            continue;
        }
        const TileType type = state.tileTypeAt(tile.x, tile.y);
        if (type == TileType::AIR || getTileProperties(type).indestructible) {
            continue;
        }
        if (state.findDigTaskAt(tile.x, tile.y) != INVALID_ENTITY) {
            continue;
        }

        EntityID taskId = state.createEntity();
        Task task;
        task.type = TaskType::DIG;
        task.targetX = tile.x;
        task.targetY = tile.y;
        task.priority = command.priority;
        task.createdAt = state.tick;
        state.tasks.emplace_hint(state.tasks.end(), taskId, task);
        ++created;
    }

    if (created == 0) {
        return false;
    }

    state.selectedTiles.clear();
    TASK_DEBUG("Created " + std::to_string(created) + " dig task(s) at tick " +
               std::to_string(state.tick));
    return true;
}

bool CommandProcessor::cancelDig(WorldState& state, const CancelDig& command) const {
    bool cancelled = false;
    for (const TileCoord& tile : command.tiles) {
        EntityID taskId = state.findDigTaskAt(tile.x, tile.y);
        if (taskId != INVALID_ENTITY) {
            cancelled = cancelTask(state, taskId) || cancelled;
        }
    }
    return cancelled;
}

bool CommandProcessor::cancelTask(WorldState& state, EntityID taskId) const {
    auto it = state.tasks.find(taskId);
    if (it == state.tasks.end()) {
        return false;
    }
    // A grounded resource always keeps its collect task
    if (it->second.type == TaskType::COLLECT) {
        return false;
    }

    state.destroyTask(taskId);
    TASK_DEBUG("Cancelled task " + std::to_string(taskId));
    return true;
}

bool CommandProcessor::panCamera(WorldState& state, const PanCamera& command) const {
    state.camera.targetX += command.dx;
    state.camera.targetY += command.dy;
    return true;
}

bool CommandProcessor::zoomCamera(WorldState& state, const ZoomCamera& command) const {
    Camera& camera = state.camera;
    const float oldZoom = camera.zoom;
    const float newZoom = std::clamp(oldZoom + command.delta, m_config.minZoom, m_config.maxZoom);
    if (newZoom == oldZoom) {
        return false;
    }

    // Keep the world point under the mouse fixed
    const float offsetX = command.mouseX - command.screenWidth / 2.0f;
    const float offsetY = command.mouseY - command.screenHeight / 2.0f;
    const float worldX = offsetX / oldZoom + camera.targetX;
    const float worldY = offsetY / oldZoom + camera.targetY;

    camera.zoom = newZoom;
    camera.targetX = worldX - offsetX / newZoom;
    camera.targetY = worldY - offsetY / newZoom;
    return true;
}

bool CommandProcessor::setSpeed(WorldState& state, const SetSpeed& command) const {
    if (!m_config.isAllowedSpeed(command.multiplier)) {
        return false;
    }
    state.speed = command.multiplier;
    return true;
}

bool CommandProcessor::togglePause(WorldState& state) const {
    state.isPaused = !state.isPaused;
    SIM_INFO(state.isPaused ? "Simulation paused" : "Simulation resumed");
    return true;
}

bool CommandProcessor::spawnGnome(WorldState& state, const SpawnGnome& command) const {
    std::optional<TileCoord> at = command.at;
    if (at) {
        if (!state.canHoldAt(at->x, at->y)) {
            return false;
        }
    } else {
        at = findSpawnPosition(state);
        if (!at) {
            return false;
        }
    }

    Delve::spawnGnome(state, m_config, *at);
    return true;
}

bool CommandProcessor::placeBuilding(WorldState& state, const PlaceBuilding& command) const {
    switch (command.type) {
        case BuildingType::STORAGE:
            return placeStorage(state, command.x, command.y) != INVALID_ENTITY;
    }
    return false;
}

} // namespace Delve

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "systems/MiningSystem.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cstdlib>
#include <string>

namespace Delve {

void MiningSystem::update(WorldState& state, [[maybe_unused]] SystemContext& ctx) {
  for (auto& [id, gnome] : state.gnomes) {
    if (gnome.state == GnomeState::MINING) {
      mine(state, id, gnome);
    }
  }
}

void MiningSystem::mine(WorldState& state, EntityID gnomeId, Gnome& gnome) {
  if (!gnome.currentTaskId) {
    gnome.state = GnomeState::IDLE;
    return;
  }

  const EntityID taskId = *gnome.currentTaskId;
  auto taskIt = state.tasks.find(taskId);
  if (taskIt == state.tasks.end() || taskIt->second.type != TaskType::DIG) {
    gnome.currentTaskId.reset();
    gnome.state = GnomeState::IDLE;
    return;
  }
  Task& task = taskIt->second;

  Tile* tile = state.tileAt(task.targetX, task.targetY);
  if (!tile || tile->type == TileType::AIR || getTileProperties(tile->type).indestructible) {
    // Nothing left to mine here
    state.destroyTask(taskId);
    return;
  }

  auto posIt = state.positions.find(gnomeId);
  if (posIt == state.positions.end()) {
    return;
  }
  const TileCoord at = toTile(posIt->second);
  if (std::abs(at.x - task.targetX) > 1 || std::abs(at.y - task.targetY) > 1) {
    // Out of reach, give the task back
    state.unassignTask(taskId);
    return;
  }

  const TileProperties props = getTileProperties(tile->type);
  tile->durability -= props.mineRate;

  if (tile->durability <= 0) {
    breakTile(state, taskId, task);
    return;
  }

  const int mined = props.durability - tile->durability;
  task.progress = std::min(99, mined * 100 / std::max(1, props.durability));
}

void MiningSystem::breakTile(WorldState& state, EntityID taskId, const Task& task) {
  const int x = task.targetX;
  const int y = task.targetY;
  const TileProperties props = getTileProperties(state.tileTypeAt(x, y));

  state.setTileType(x, y, TileType::AIR);

  if (props.drop) {
    EntityID resource = state.createEntity();
    state.positions.emplace(resource, Position{static_cast<float>(x), static_cast<float>(y)});
    state.velocities.emplace(resource, Velocity{});
    state.resources.emplace(resource, Resource{*props.drop, false});
    LOGISTICS_DEBUG("Resource " + std::to_string(resource) + " dropped at (" + std::to_string(x) +
                    "," + std::to_string(y) + ")");
  }

  const TileCoord mined{x, y};
  state.selectedTiles.erase(std::remove(state.selectedTiles.begin(), state.selectedTiles.end(), mined),
                            state.selectedTiles.end());

  TASK_DEBUG("Dig task " + std::to_string(taskId) + " complete");
  state.destroyTask(taskId);
}

} // namespace Delve

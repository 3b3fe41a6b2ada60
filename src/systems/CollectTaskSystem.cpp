/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "systems/CollectTaskSystem.hpp"
#include "core/Logger.hpp"
#include "core/SimConfig.hpp"
#include <cstdlib>
#include <string>

namespace Delve {

void CollectTaskSystem::update(WorldState& state, SystemContext& ctx) {
  for (auto& [id, gnome] : state.gnomes) {
    if (gnome.state == GnomeState::COLLECTING) {
      collect(state, ctx, id, gnome);
    }
  }
}

void CollectTaskSystem::collect(WorldState& state, SystemContext& ctx, EntityID gnomeId, Gnome& gnome) {
  if (!gnome.currentTaskId) {
    gnome.state = GnomeState::IDLE;
    return;
  }

  const EntityID taskId = *gnome.currentTaskId;
  auto taskIt = state.tasks.find(taskId);
  if (taskIt == state.tasks.end() || taskIt->second.type != TaskType::COLLECT) {
    gnome.currentTaskId.reset();
    gnome.state = GnomeState::IDLE;
    return;
  }

  const std::optional<EntityID> resourceId = taskIt->second.targetEntity;
  auto resourceIt = resourceId ? state.resources.find(*resourceId) : state.resources.end();
  if (resourceIt == state.resources.end()) {
    // Resource already gone
    state.destroyTask(taskId);
    return;
  }

  if (gnome.inventory.size() >= ctx.config.inventoryCapacity) {
    state.unassignTask(taskId);
    return;
  }

  auto gnomePos = state.positions.find(gnomeId);
  auto resourcePos = state.positions.find(*resourceId);
  if (gnomePos == state.positions.end() || resourcePos == state.positions.end()) {
    state.unassignTask(taskId);
    return;
  }

  const TileCoord gnomeTile = toTile(gnomePos->second);
  const TileCoord resourceTile = toTile(resourcePos->second);
  if (std::abs(gnomeTile.x - resourceTile.x) > 1 || std::abs(gnomeTile.y - resourceTile.y) > 1) {
    state.unassignTask(taskId);
    return;
  }

  gnome.inventory.push_back(resourceIt->second.type);
  const EntityID collected = *resourceId;

  state.destroyTask(taskId);
  state.destroyEntity(collected);

  LOGISTICS_DEBUG("Gnome " + std::to_string(gnomeId) + " collected resource " + std::to_string(collected) +
                  " (" + std::to_string(gnome.inventory.size()) + " carried)");
}

} // namespace Delve

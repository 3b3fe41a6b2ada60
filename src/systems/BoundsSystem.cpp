/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "systems/BoundsSystem.hpp"
#include "core/Logger.hpp"
#include "core/SimConfig.hpp"
#include <string>
#include <vector>

namespace Delve {

bool BoundsSystem::isOutOfBounds(const WorldState& state, const Position& position, int margin) {
  const float m = static_cast<float>(margin);
  return position.x < -m || position.y < -m ||
         position.x > static_cast<float>(state.worldWidth) + m ||
         position.y > static_cast<float>(state.worldHeight) + m;
}

void BoundsSystem::update(WorldState& state, SystemContext& ctx) {
  const int margin = ctx.config.boundsMargin;

  // Collect first; destroying while walking a flat_map invalidates iterators
  std::vector<EntityID> lostGnomes;
  std::vector<EntityID> lostResources;

  for (const auto& [id, gnome] : state.gnomes) {
    auto pos = state.positions.find(id);
    if (pos != state.positions.end() && isOutOfBounds(state, pos->second, margin)) {
      lostGnomes.push_back(id);
    }
  }
  for (const auto& [id, resource] : state.resources) {
    auto pos = state.positions.find(id);
    if (pos != state.positions.end() && isOutOfBounds(state, pos->second, margin)) {
      lostResources.push_back(id);
    }
  }

  for (EntityID id : lostGnomes) {
    const Gnome& gnome = state.gnomes.at(id);
    if (gnome.currentTaskId) {
      state.unassignTask(*gnome.currentTaskId);
    }
    state.clearIdleBehavior(id);
    state.destroyEntity(id);
    PHYSICS_WARN("Gnome " + std::to_string(id) + " left the world and was removed");
  }

  for (EntityID id : lostResources) {
    EntityID task = state.findCollectTaskFor(id);
    if (task != INVALID_ENTITY) {
      state.destroyTask(task);
    }
    state.destroyEntity(id);
    PHYSICS_DEBUG("Resource " + std::to_string(id) + " left the world and was removed");
  }
}

} // namespace Delve

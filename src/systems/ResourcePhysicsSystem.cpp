/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "systems/ResourcePhysicsSystem.hpp"
#include "core/Logger.hpp"
#include "core/SimConfig.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace Delve {

void ResourcePhysicsSystem::update(WorldState& state, SystemContext& ctx) {
  // Grounding creates task entities, so collect the transitions first
  std::vector<EntityID> landed;
  std::vector<EntityID> unsupported;

  for (auto& [id, resource] : state.resources) {
    auto posIt = state.positions.find(id);
    auto velIt = state.velocities.find(id);
    if (posIt == state.positions.end() || velIt == state.velocities.end()) {
      continue;
    }
    Position& position = posIt->second;
    Velocity& velocity = velIt->second;
    const TileCoord tile = toTile(position);

    if (resource.isGrounded) {
      if (!state.isSolid(tile.x, tile.y + 1)) {
        resource.isGrounded = false;
        velocity = Velocity{};
        unsupported.push_back(id);
      }
      continue;
    }

    velocity.dy = std::min(velocity.dy + ctx.config.gravity, ctx.config.terminalVelocity);
    const float newY = position.y + velocity.dy;
    const int newTileY = static_cast<int>(std::floor(newY));

    if (state.isSolid(tile.x, newTileY + 1)) {
      position.y = static_cast<float>(newTileY);
      velocity.dy = 0.0f;
      resource.isGrounded = true;
      landed.push_back(id);
    } else {
      position.y = newY;
    }
  }

  for (EntityID id : unsupported) {
    EntityID taskId = state.findCollectTaskFor(id);
    if (taskId != INVALID_ENTITY) {
      state.destroyTask(taskId);
    }
    LOGISTICS_DEBUG("Resource " + std::to_string(id) + " lost its support");
  }

  for (EntityID id : landed) {
    state.createCollectTask(id);
  }
}

} // namespace Delve

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "systems/DepositSystem.hpp"
#include "ai/pathfinding/Pathfinder.hpp"
#include "core/Logger.hpp"
#include "core/SimConfig.hpp"
#include "world/WorldFactory.hpp"
#include <algorithm>
#include <string>

namespace Delve {

void DepositSystem::update(WorldState& state, SystemContext& ctx) {
  completeDeposits(state);
  dispatchCarriers(state, ctx);
}

void DepositSystem::completeDeposits(WorldState& state) {
  for (auto& [id, gnome] : state.gnomes) {
    if (!gnome.depositTargetStorage) {
      continue;
    }

    const EntityID storageId = *gnome.depositTargetStorage;
    auto storageIt = state.storages.find(storageId);
    if (storageIt == state.storages.end()) {
      // Storage vanished; keep the inventory and look again later
      gnome.depositTargetStorage.reset();
      gnome.path.clear();
      gnome.pathIndex = 0;
      if (gnome.state == GnomeState::WALKING || gnome.state == GnomeState::DEPOSITING) {
        gnome.state = GnomeState::IDLE;
      }
      continue;
    }

    if (gnome.state != GnomeState::DEPOSITING) {
      continue;
    }

    auto posIt = state.positions.find(id);
    const std::vector<TileCoord> spots = depositSpots(state, storageId);
    const bool atSpot = posIt != state.positions.end() &&
                        std::find(spots.begin(), spots.end(), toTile(posIt->second)) != spots.end();

    if (atSpot) {
      Storage& storage = storageIt->second;
      for (ResourceType item : gnome.inventory) {
        storage.contents[item] += 1;
      }
      LOGISTICS_DEBUG("Gnome " + std::to_string(id) + " deposited " +
                      std::to_string(gnome.inventory.size()) + " item(s) into storage " +
                      std::to_string(storageId));
      gnome.inventory.clear();
    }

    gnome.depositTargetStorage.reset();
    gnome.path.clear();
    gnome.pathIndex = 0;
    gnome.state = GnomeState::IDLE;
  }
}

void DepositSystem::dispatchCarriers(WorldState& state, SystemContext& ctx) {
  if (state.storages.empty()) {
    return;
  }

  // Batching holds partial loads back while there is still something to pick up
  bool holdPartialLoads = false;
  if (ctx.config.batchDeposits) {
    holdPartialLoads = std::any_of(state.tasks.begin(), state.tasks.end(), [](const auto& entry) {
      return entry.second.type == TaskType::COLLECT && !entry.second.assignedGnome;
    });
  }

  for (auto& [id, gnome] : state.gnomes) {
    if (gnome.state != GnomeState::IDLE || gnome.currentTaskId || gnome.depositTargetStorage ||
        gnome.inventory.empty()) {
      continue;
    }
    if (holdPartialLoads && gnome.inventory.size() < ctx.config.inventoryCapacity) {
      continue;
    }
    auto posIt = state.positions.find(id);
    if (posIt == state.positions.end()) {
      continue;
    }

    std::optional<DepositRoute> route = findNearestStorage(state, ctx, toTile(posIt->second));
    if (!route) {
      continue;
    }

    state.clearIdleBehavior(id);
    gnome.depositTargetStorage = route->storage;
    gnome.path = std::move(route->path);
    gnome.pathIndex = 0;
    gnome.state = gnome.path.empty() ? GnomeState::DEPOSITING : GnomeState::WALKING;

    LOGISTICS_DEBUG("Gnome " + std::to_string(id) + " heading to storage " +
                    std::to_string(route->storage));
  }
}

std::optional<DepositSystem::DepositRoute> DepositSystem::findNearestStorage(
    const WorldState& state, SystemContext& ctx, const TileCoord& from) const {
  std::optional<DepositRoute> best;

  // Ascending storage id, so strict comparison keeps the lowest id on ties
  for (const auto& [storageId, storage] : state.storages) {
    (void)storage;
    for (const TileCoord& spot : depositSpots(state, storageId)) {
      std::vector<TileCoord> path;
      if (ctx.pathfinder.findPath(state, from, spot, path) != PathfindingResult::SUCCESS) {
        continue;
      }
      if (!best || path.size() < best->path.size()) {
        best = DepositRoute{storageId, std::move(path)};
      }
    }
  }
  return best;
}

} // namespace Delve

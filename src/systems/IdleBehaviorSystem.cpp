/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "systems/IdleBehaviorSystem.hpp"
#include "ai/pathfinding/Pathfinder.hpp"
#include "core/Logger.hpp"
#include "core/SeededRandom.hpp"
#include "core/SimConfig.hpp"
#include <cmath>
#include <string>
#include <vector>

namespace Delve {

namespace {

// Vertical search window around the gnome's row for a stroll destination
constexpr int STROLL_ROW_SEARCH = 5;

// Number of distinct conversation markers the renderer knows
constexpr int SOCIAL_MARKER_COUNT = 4;

// min + floor(r * (max - min)), the span used for every idle draw
uint64_t drawDuration(SeededRandom& rng, uint64_t min, uint64_t max) {
  if (max <= min) {
    return min;
  }
  return min + static_cast<uint64_t>(std::floor(rng.nextDouble() * static_cast<double>(max - min)));
}

} // namespace

bool IdleBehaviorSystem::isFree(const Gnome& gnome) {
  if (gnome.currentTaskId || gnome.depositTargetStorage) {
    return false;
  }
  return gnome.state == GnomeState::IDLE ||
         (gnome.state == GnomeState::WALKING && gnome.isStrolling());
}

void IdleBehaviorSystem::update(WorldState& state, SystemContext& ctx) {
  if (!isThrottleTick(state.tick, ctx.config.idleBehaviorInterval)) {
    return;
  }

  for (auto& [id, gnome] : state.gnomes) {
    if (!isFree(gnome)) {
      continue;
    }
    if (gnome.idleBehavior) {
      updateBehavior(state, id, gnome);
    } else if (gnome.state == GnomeState::IDLE) {
      assignBehavior(state, ctx, id, gnome);
    }
  }
}

void IdleBehaviorSystem::updateBehavior(WorldState& state, EntityID id, Gnome& gnome) {
  const IdleBehavior& behavior = *gnome.idleBehavior;

  switch (behavior.type) {
    case IdleBehaviorType::STROLLING: {
      const bool arrived = gnome.state == GnomeState::IDLE && gnome.pathIndex >= gnome.path.size();
      if (arrived || state.tick >= behavior.endsAt) {
        gnome.idleBehavior.reset();
        gnome.path.clear();
        gnome.pathIndex = 0;
        gnome.state = GnomeState::IDLE;
      }
      break;
    }
    case IdleBehaviorType::SOCIALIZING: {
      if (state.tick >= behavior.endsAt) {
        // Clears the partner too, so both end on the same tick
        state.clearIdleBehavior(id);
        break;
      }
      bool partnerEngaged = false;
      if (behavior.partner) {
        auto partnerIt = state.gnomes.find(*behavior.partner);
        partnerEngaged = partnerIt != state.gnomes.end() && partnerIt->second.idleBehavior &&
                         partnerIt->second.idleBehavior->type == IdleBehaviorType::SOCIALIZING &&
                         partnerIt->second.idleBehavior->partner == id;
      }
      if (!partnerEngaged) {
        gnome.idleBehavior.reset();
      }
      break;
    }
    case IdleBehaviorType::RESTING:
      if (state.tick >= behavior.endsAt) {
        gnome.idleBehavior.reset();
      }
      break;
  }
}

void IdleBehaviorSystem::assignBehavior(WorldState& state, SystemContext& ctx, EntityID id, Gnome& gnome) {
  SeededRandom rng(state.seed, id, state.tick);
  const double roll = rng.nextDouble() * 100.0;

  const SimConfig& config = ctx.config;
  const double strollBand = static_cast<double>(config.strollWeight);
  const double socializeBand = strollBand + static_cast<double>(config.socializeWeight);

  if (roll < strollBand) {
    if (!assignStroll(state, ctx, id, gnome, rng)) {
      assignRest(state, ctx, gnome, rng);
    }
  } else if (roll < socializeBand) {
    if (!assignSocialize(state, ctx, id, rng) && !assignStroll(state, ctx, id, gnome, rng)) {
      assignRest(state, ctx, gnome, rng);
    }
  } else {
    assignRest(state, ctx, gnome, rng);
  }
}

bool IdleBehaviorSystem::assignStroll(WorldState& state, SystemContext& ctx, EntityID id, Gnome& gnome,
                                      SeededRandom& rng) {
  auto posIt = state.positions.find(id);
  if (posIt == state.positions.end()) {
    return false;
  }
  const TileCoord from = toTile(posIt->second);

  std::optional<TileCoord> destination = pickStrollDestination(state, ctx, from, rng);
  if (!destination) {
    return false;
  }

  std::vector<TileCoord> path;
  if (ctx.pathfinder.findPath(state, from, *destination, path) != PathfindingResult::SUCCESS ||
      path.empty()) {
    return false;
  }

  IdleBehavior behavior;
  behavior.type = IdleBehaviorType::STROLLING;
  behavior.startedAt = state.tick;
  behavior.endsAt = state.tick + ctx.config.strollTimeoutTicks;
  behavior.target = destination;

  gnome.idleBehavior = behavior;
  gnome.path = std::move(path);
  gnome.pathIndex = 0;
  gnome.state = GnomeState::WALKING;

  IDLE_DEBUG("Gnome " + std::to_string(id) + " strolling to (" + std::to_string(destination->x) + "," +
             std::to_string(destination->y) + ")");
  return true;
}

bool IdleBehaviorSystem::assignSocialize(WorldState& state, SystemContext& ctx, EntityID id,
                                         SeededRandom& rng) {
  std::optional<EntityID> partner = findPartner(state, ctx, id);
  if (!partner) {
    return false;
  }

  const uint64_t duration = drawDuration(rng, ctx.config.socializeMinTicks, ctx.config.socializeMaxTicks);
  const int marker = static_cast<int>(rng.nextInRange(0, SOCIAL_MARKER_COUNT - 1));

  IdleBehavior behavior;
  behavior.type = IdleBehaviorType::SOCIALIZING;
  behavior.startedAt = state.tick;
  behavior.endsAt = state.tick + duration;
  behavior.marker = marker;

  behavior.partner = *partner;
  state.gnomes.at(id).idleBehavior = behavior;

  behavior.partner = id;
  state.gnomes.at(*partner).idleBehavior = behavior;

  IDLE_DEBUG("Gnomes " + std::to_string(id) + " and " + std::to_string(*partner) + " socializing for " +
             std::to_string(duration) + " ticks");
  return true;
}

void IdleBehaviorSystem::assignRest(WorldState& state, SystemContext& ctx, Gnome& gnome, SeededRandom& rng) {
  IdleBehavior behavior;
  behavior.type = IdleBehaviorType::RESTING;
  behavior.startedAt = state.tick;
  behavior.endsAt = state.tick + drawDuration(rng, ctx.config.restMinTicks, ctx.config.restMaxTicks);
  gnome.idleBehavior = behavior;
}

std::optional<EntityID> IdleBehaviorSystem::findPartner(const WorldState& state, SystemContext& ctx,
                                                        EntityID id) const {
  auto posIt = state.positions.find(id);
  if (posIt == state.positions.end()) {
    return std::nullopt;
  }
  const TileCoord from = toTile(posIt->second);

  std::optional<EntityID> best;
  int bestDistance = 0;
  for (const auto& [otherId, other] : state.gnomes) {
    if (otherId == id || other.state != GnomeState::IDLE || other.currentTaskId ||
        other.depositTargetStorage) {
      continue;
    }
    if (other.idleBehavior && other.idleBehavior->type == IdleBehaviorType::SOCIALIZING) {
      continue;
    }
    auto otherPos = state.positions.find(otherId);
    if (otherPos == state.positions.end()) {
      continue;
    }

    const int distance = manhattan(from, toTile(otherPos->second));
    if (distance > ctx.config.socializeMaxDistance) {
      continue;
    }
    // Ascending ids, so strict comparison keeps the lowest id on ties
    if (!best || distance < bestDistance) {
      best = otherId;
      bestDistance = distance;
    }
  }
  return best;
}

TileCoord IdleBehaviorSystem::strollCentre(const WorldState& state, const TileCoord& from) const {
  std::optional<TileCoord> centre;
  int bestDistance = 0;
  for (const auto& [storageId, storage] : state.storages) {
    (void)storage;
    auto pos = state.positions.find(storageId);
    if (pos == state.positions.end()) {
      continue;
    }
    const TileCoord tile = toTile(pos->second);
    const int distance = manhattan(from, tile);
    if (!centre || distance < bestDistance) {
      centre = tile;
      bestDistance = distance;
    }
  }
  return centre.value_or(from);
}

std::optional<TileCoord> IdleBehaviorSystem::pickStrollDestination(const WorldState& state, SystemContext& ctx,
                                                                   const TileCoord& from,
                                                                   SeededRandom& rng) const {
  const SimConfig& config = ctx.config;
  const TileCoord centre = strollCentre(state, from);

  for (int attempt = 0; attempt < config.strollDestinationAttempts; ++attempt) {
    const int direction = rng.nextDouble() < 0.5 ? -1 : 1;
    const int distance = config.strollMinRadius +
        static_cast<int>(std::floor(rng.nextDouble() * (config.strollMaxRadius - config.strollMinRadius)));
    const int targetX = centre.x + direction * distance;

    if (targetX < 1 || targetX >= state.worldWidth - 1) {
      continue;
    }

    // Nearest standable row to the gnome's own: 0, -1, +1, -2, +2, ...
    for (int offset = 0; offset <= STROLL_ROW_SEARCH; ++offset) {
      for (int dy : {-offset, offset}) {
        const int targetY = from.y + dy;
        if (targetY >= 1 && targetY < state.worldHeight - 1 && state.canStandAt(targetX, targetY)) {
          return TileCoord{targetX, targetY};
        }
        if (offset == 0) {
          break;
        }
      }
    }
  }
  return std::nullopt;
}

} // namespace Delve

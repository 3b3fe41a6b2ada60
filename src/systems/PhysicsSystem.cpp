/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "systems/PhysicsSystem.hpp"
#include "core/Logger.hpp"
#include "core/SeededRandom.hpp"
#include "core/SimConfig.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace Delve {

namespace {

// Distance at which a walker snaps onto its waypoint
constexpr float ARRIVAL_EPSILON = 0.1f;

bool isOnTileCentre(const Position& position) {
  return std::abs(position.x - std::round(position.x)) < 1e-4f &&
         std::abs(position.y - std::round(position.y)) < 1e-4f;
}

} // namespace

bool PhysicsSystem::canTakeStep(const WorldState& state, const Position& position,
                                const TileCoord& target) {
  if (!isOnTileCentre(position)) {
    return true;
  }
  const TileCoord current{static_cast<int>(std::round(position.x)),
                          static_cast<int>(std::round(position.y))};
  if (current == target || state.canHoldAt(current.x, current.y)) {
    return true;
  }

  // Unsupported: only the moves the route planner allows from open air
  if (target.y > current.y) {
    return true;
  }
  if (target.y < current.y) {
    return state.hasGrip(target.x, target.y);
  }
  return state.canHoldAt(target.x, target.y);
}

void PhysicsSystem::startFalling(WorldState& state, EntityID gnomeId) {
  auto gnomeIt = state.gnomes.find(gnomeId);
  if (gnomeIt == state.gnomes.end()) {
    return;
  }

  Gnome& gnome = gnomeIt->second;
  gnome.state = GnomeState::FALLING;
  if (gnome.currentTaskId) {
    state.unassignTask(*gnome.currentTaskId);
  }
  gnome.currentTaskId.reset();
  gnome.path.clear();
  gnome.pathIndex = 0;
  gnome.depositTargetStorage.reset();
  state.clearIdleBehavior(gnomeId);

  if (auto pos = state.positions.find(gnomeId); pos != state.positions.end()) {
    gnome.fallStartY = pos->second.y;
  }
  if (auto vel = state.velocities.find(gnomeId); vel != state.velocities.end()) {
    vel->second = Velocity{};
  }

  PHYSICS_DEBUG("Gnome " + std::to_string(gnomeId) + " started falling");
}

void PhysicsSystem::update(WorldState& state, SystemContext& ctx) {
  for (auto& [id, gnome] : state.gnomes) {
    auto posIt = state.positions.find(id);
    auto velIt = state.velocities.find(id);
    if (posIt == state.positions.end() || velIt == state.velocities.end()) {
      continue;
    }
    Position& position = posIt->second;
    Velocity& velocity = velIt->second;

    switch (gnome.state) {
      case GnomeState::WALKING:
        updateWalking(state, ctx, id, gnome, position);
        break;
      case GnomeState::INCAPACITATED:
        updateIncapacitated(state, ctx, position, velocity);
        break;
      case GnomeState::FALLING:
        updateFalling(state, ctx, id, gnome, position, velocity);
        break;
      default: {
        const TileCoord tile = toTile(position);
        if (!state.canHoldAt(tile.x, tile.y)) {
          startFalling(state, id);
          updateFalling(state, ctx, id, gnome, position, velocity);
        }
        break;
      }
    }
  }
}

void PhysicsSystem::updateWalking(WorldState& state, SystemContext& ctx, EntityID id,
                                  Gnome& gnome, Position& position) {
  if (gnome.pathIndex >= gnome.path.size()) {
    position.x = std::round(position.x);
    position.y = std::round(position.y);
    gnome.state = arrivalState(state, gnome);
    if (gnome.isStrolling()) {
      state.clearIdleBehavior(id);
    }
    return;
  }

  const TileCoord target = gnome.path[gnome.pathIndex];

  // Terrain changed under the route
  if (!state.isPassable(target.x, target.y)) {
    if (gnome.currentTaskId) {
      state.unassignTask(*gnome.currentTaskId);
    }
    gnome.path.clear();
    gnome.pathIndex = 0;
    gnome.depositTargetStorage.reset();
    gnome.state = GnomeState::IDLE;
    if (gnome.isStrolling()) {
      state.clearIdleBehavior(id);
    }
    PHYSICS_DEBUG("Gnome " + std::to_string(id) + " lost its route");
    return;
  }

  // Support is judged once per step, while the gnome still sits on the tile it leaves
  if (!canTakeStep(state, position, target)) {
    PHYSICS_DEBUG("Gnome " + std::to_string(id) + " lost its footing");
    startFalling(state, id);
    return;
  }

  const float dx = static_cast<float>(target.x) - position.x;
  const float dy = static_cast<float>(target.y) - position.y;

  // Climbing: a vertical step with a wall to hold
  const TileCoord current = toTile(position);
  const bool climbing = std::abs(dx) < ARRIVAL_EPSILON && std::abs(dy) >= ARRIVAL_EPSILON &&
                        (state.hasGrip(current.x, current.y) || state.hasGrip(target.x, target.y));
  if (climbing && ctx.config.climbSlipChance > 0.0) {
    SeededRandom rng(state.seed, id, state.tick, SeededRandom::CLIMB_SLIP_SALT);
    if (rng.chance(ctx.config.climbSlipChance)) {
      PHYSICS_INFO("Gnome " + std::to_string(id) + " slipped while climbing");
      startFalling(state, id);
      return;
    }
  }

  const float dist = std::sqrt(dx * dx + dy * dy);
  if (dist < ARRIVAL_EPSILON) {
    position.x = static_cast<float>(target.x);
    position.y = static_cast<float>(target.y);
    gnome.pathIndex++;
    if (gnome.pathIndex >= gnome.path.size()) {
      gnome.state = arrivalState(state, gnome);
      if (gnome.isStrolling()) {
        state.clearIdleBehavior(id);
      }
    }
    return;
  }

  float speed = gnome.isStrolling() ? ctx.config.gnomeIdleSpeed : ctx.config.gnomeSpeed;
  if (climbing) {
    speed = std::min(speed, ctx.config.gnomeClimbSpeed);
  }
  const float step = std::min(speed, dist);
  position.x += dx / dist * step;
  position.y += dy / dist * step;
}

void PhysicsSystem::updateFalling(WorldState& state, SystemContext& ctx, EntityID id,
                                  Gnome& gnome, Position& position, Velocity& velocity) {
  velocity.dy = std::min(velocity.dy + ctx.config.gravity, ctx.config.terminalVelocity);
  position.y += velocity.dy;

  const TileCoord tile = toTile(position);
  if (!state.canHoldAt(tile.x, tile.y)) {
    return;
  }

  // Land on the surface or grab the wall
  position.y = std::floor(position.y);
  velocity.dy = 0.0f;
  gnome.state = GnomeState::IDLE;
  applyFallDamage(state, ctx, id, gnome, position.y);
}

void PhysicsSystem::updateIncapacitated(WorldState& state, SystemContext& ctx,
                                        Position& position, Velocity& velocity) {
  const TileCoord tile = toTile(position);
  if (velocity.dy == 0.0f && state.canHoldAt(tile.x, tile.y)) {
    return;
  }

  velocity.dy = std::min(velocity.dy + ctx.config.gravity, ctx.config.terminalVelocity);
  position.y += velocity.dy;

  const TileCoord landed = toTile(position);
  if (state.canHoldAt(landed.x, landed.y)) {
    position.y = std::floor(position.y);
    velocity.dy = 0.0f;
  }
}

void PhysicsSystem::applyFallDamage(WorldState& state, SystemContext& ctx, EntityID id,
                                    Gnome& gnome, float landedY) {
  if (!gnome.fallStartY) {
    return;
  }
  const int distance = static_cast<int>(std::floor(landedY - *gnome.fallStartY));
  gnome.fallStartY.reset();

  const int threshold = ctx.config.fallDamageThreshold;
  if (distance < threshold) {
    return;
  }

  auto healthIt = state.healths.find(id);
  if (healthIt == state.healths.end()) {
    return;
  }

  Health& health = healthIt->second;
  const int damage = (distance - threshold + 1) * ctx.config.fallDamagePerTile;
  health.current = std::max(0, health.current - damage);
  HEALTH_DEBUG("Gnome " + std::to_string(id) + " fell " + std::to_string(distance) +
               " tiles and took " + std::to_string(damage) + " damage");

  if (health.current == 0) {
    gnome.state = GnomeState::INCAPACITATED;
    HEALTH_INFO("Gnome " + std::to_string(id) + " is incapacitated");
  }
}

GnomeState PhysicsSystem::arrivalState(const WorldState& state, const Gnome& gnome) const {
  if (gnome.currentTaskId) {
    auto task = state.tasks.find(*gnome.currentTaskId);
    if (task != state.tasks.end()) {
      return task->second.type == TaskType::DIG ? GnomeState::MINING : GnomeState::COLLECTING;
    }
  }
  if (gnome.depositTargetStorage) {
    return GnomeState::DEPOSITING;
  }
  return GnomeState::IDLE;
}

} // namespace Delve

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PHYSICS_SYSTEM_HPP
#define PHYSICS_SYSTEM_HPP

#include "systems/System.hpp"

namespace Delve {

/**
 * @brief Gnome movement and gravity
 *
 * Walking gnomes advance along their path (slower while strolling) and,
 * when the path ends, switch to the state their errand calls for. A gnome
 * that is not walking and cannot hold its tile starts falling, releasing
 * its task, path, deposit target and idle behavior. Falling gnomes
 * accelerate up to terminal velocity and land on the first tile they can
 * hold, taking damage for long drops. Climbing gnomes may slip.
 */
class PhysicsSystem : public System {
public:
  void update(WorldState& state, SystemContext& ctx) override;
  std::string getName() const override { return "Physics"; }

  /**
   * @brief Puts a gnome into free fall from its current height
   *
   * Both sides of its task assignment are cleared in the same step.
   */
  static void startFalling(WorldState& state, EntityID gnomeId);

  /**
   * @brief Whether a gnome standing at position may start the step to target
   *
   * Off a tile it cannot hold, a gnome may only drop, climb onto a tile
   * with grip, or step sideways onto a tile it can hold.
   */
  static bool canTakeStep(const WorldState& state, const Position& position,
                          const TileCoord& target);

private:
  void updateWalking(WorldState& state, SystemContext& ctx, EntityID id,
                     Gnome& gnome, Position& position);
  void updateFalling(WorldState& state, SystemContext& ctx, EntityID id,
                     Gnome& gnome, Position& position, Velocity& velocity);
  void updateIncapacitated(WorldState& state, SystemContext& ctx,
                           Position& position, Velocity& velocity);
  void applyFallDamage(WorldState& state, SystemContext& ctx, EntityID id,
                       Gnome& gnome, float landedY);
  GnomeState arrivalState(const WorldState& state, const Gnome& gnome) const;
};

} // namespace Delve

#endif // PHYSICS_SYSTEM_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef IDLE_BEHAVIOR_SYSTEM_HPP
#define IDLE_BEHAVIOR_SYSTEM_HPP

#include "systems/System.hpp"
#include <optional>

namespace Delve {

class SeededRandom;

/**
 * @brief Gives unemployed gnomes something to do
 *
 * Runs on the same ticks as task assignment. A free gnome without a tag
 * draws one weighted roll from its (seed, id, tick) generator:
 *
 *  - STROLLING: walk at reduced speed to a point 3..10 tiles left or right
 *    of the nearest storage (or of itself), ending on arrival or timeout.
 *    No destination or no route falls back to resting.
 *  - SOCIALIZING: pair with the nearest free gnome within range; both share
 *    the duration and a cosmetic marker and end together. No partner falls
 *    back to strolling.
 *  - RESTING: stay put for a random duration.
 */
class IdleBehaviorSystem : public System {
public:
  void update(WorldState& state, SystemContext& ctx) override;
  std::string getName() const override { return "IdleBehavior"; }

  // Gnomes this system may tag or update
  static bool isFree(const Gnome& gnome);

private:
  void updateBehavior(WorldState& state, EntityID id, Gnome& gnome);
  void assignBehavior(WorldState& state, SystemContext& ctx, EntityID id, Gnome& gnome);

  bool assignStroll(WorldState& state, SystemContext& ctx, EntityID id, Gnome& gnome,
                    SeededRandom& rng);
  bool assignSocialize(WorldState& state, SystemContext& ctx, EntityID id, SeededRandom& rng);
  void assignRest(WorldState& state, SystemContext& ctx, Gnome& gnome, SeededRandom& rng);

  std::optional<EntityID> findPartner(const WorldState& state, SystemContext& ctx, EntityID id) const;
  TileCoord strollCentre(const WorldState& state, const TileCoord& from) const;
  std::optional<TileCoord> pickStrollDestination(const WorldState& state, SystemContext& ctx,
                                                 const TileCoord& from, SeededRandom& rng) const;
};

} // namespace Delve

#endif // IDLE_BEHAVIOR_SYSTEM_HPP

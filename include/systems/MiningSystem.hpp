/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MINING_SYSTEM_HPP
#define MINING_SYSTEM_HPP

#include "systems/System.hpp"

namespace Delve {

/**
 * @brief Wears down dig targets
 *
 * Each tick a mining gnome next to its target removes the tile type's mine
 * rate from the tile's durability. At zero the tile turns to air, drops its
 * resource (if any) as a falling Resource and the Dig task is finished.
 */
class MiningSystem : public System {
public:
  void update(WorldState& state, SystemContext& ctx) override;
  std::string getName() const override { return "Mining"; }

private:
  void mine(WorldState& state, EntityID gnomeId, Gnome& gnome);
  void breakTile(WorldState& state, EntityID taskId, const Task& task);
};

} // namespace Delve

#endif // MINING_SYSTEM_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DEPOSIT_SYSTEM_HPP
#define DEPOSIT_SYSTEM_HPP

#include "systems/System.hpp"
#include <optional>
#include <vector>

namespace Delve {

/**
 * @brief Carries gathered resources to storage
 *
 * Runs before task assignment so gnomes unload before taking new work.
 * An idle gnome with a non-empty inventory walks to the storage with the
 * shortest route (lowest id on ties); on arrival its whole inventory is
 * added to the storage's counts. Without a reachable storage the gnome
 * keeps its inventory. With batchDeposits set, a partial load waits while
 * any collect task is unassigned.
 */
class DepositSystem : public System {
public:
  void update(WorldState& state, SystemContext& ctx) override;
  std::string getName() const override { return "Deposit"; }

private:
  struct DepositRoute {
    EntityID storage{INVALID_ENTITY};
    std::vector<TileCoord> path;
  };

  void completeDeposits(WorldState& state);
  void dispatchCarriers(WorldState& state, SystemContext& ctx);
  std::optional<DepositRoute> findNearestStorage(const WorldState& state, SystemContext& ctx,
                                                 const TileCoord& from) const;
};

} // namespace Delve

#endif // DEPOSIT_SYSTEM_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TASK_ASSIGNMENT_SYSTEM_HPP
#define TASK_ASSIGNMENT_SYSTEM_HPP

#include "systems/System.hpp"
#include <boost/container/flat_map.hpp>
#include <boost/container/flat_set.hpp>
#include <optional>
#include <vector>

namespace Delve {

/**
 * @brief Hands unassigned tasks to available gnomes
 *
 * Runs every taskAssignmentInterval ticks. Each available gnome, in id
 * order, scans priority buckets from Urgent down to Low and takes the
 * reachable task with the shortest route in the first bucket that has
 * one; a nearer task in a lower bucket never wins. Equal routes go to the
 * older task, then the lower id. Route searches are capped per gnome per
 * cycle, and the cheapest-looking candidates (Manhattan distance) are
 * searched first.
 *
 * Assignment pre-empts idle behavior in the same step. Tasks that every
 * searching gnome found unreachable have their unreachable counter bumped,
 * except dig tasks chained to a dig in progress (through adjacent dig
 * targets or open tiles): those only wait, and their counter is reset.
 */
class TaskAssignmentSystem : public System {
public:
  void update(WorldState& state, SystemContext& ctx) override;
  std::string getName() const override { return "TaskAssignment"; }

  static bool isAvailable(const Gnome& gnome);

private:
  struct Candidate {
    EntityID taskId;
    int manhattan;
    uint64_t createdAt;
  };

  struct Choice {
    EntityID taskId{INVALID_ENTITY};
    std::vector<TileCoord> path;
    uint64_t createdAt{0};
  };

  // Reachability observed during one cycle
  enum class Seen : uint8_t { UNREACHABLE, REACHABLE };

  std::optional<Choice> chooseTask(WorldState& state, SystemContext& ctx, const Gnome& gnome,
                                   const TileCoord& from,
                                   boost::container::flat_map<EntityID, Seen>& seen) const;

  void assign(WorldState& state, EntityID gnomeId, Choice&& choice) const;

  // Unassigned dig tasks connected to an assigned one
  static boost::container::flat_set<EntityID> chainedToActiveDigs(const WorldState& state);
};

} // namespace Delve

#endif // TASK_ASSIGNMENT_SYSTEM_HPP

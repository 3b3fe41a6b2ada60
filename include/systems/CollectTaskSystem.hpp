/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLECT_TASK_SYSTEM_HPP
#define COLLECT_TASK_SYSTEM_HPP

#include "systems/System.hpp"

namespace Delve {

/**
 * @brief Resolves Collect tasks for gnomes that reached their resource
 *
 * A collecting gnome within one tile of the resource picks it up: the
 * item joins its inventory and both the resource and the task are
 * destroyed. A gnome with no room, or one that ended up out of reach,
 * hands the task back.
 */
class CollectTaskSystem : public System {
public:
  void update(WorldState& state, SystemContext& ctx) override;
  std::string getName() const override { return "CollectTask"; }

private:
  void collect(WorldState& state, SystemContext& ctx, EntityID gnomeId, Gnome& gnome);
};

} // namespace Delve

#endif // COLLECT_TASK_SYSTEM_HPP

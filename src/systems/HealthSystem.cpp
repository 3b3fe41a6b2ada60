/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "systems/HealthSystem.hpp"
#include "core/Logger.hpp"
#include "core/SimConfig.hpp"
#include <algorithm>
#include <string>

namespace Delve {

void HealthSystem::update(WorldState& state, SystemContext& ctx) {
  for (auto& [id, gnome] : state.gnomes) {
    if (gnome.state != GnomeState::INCAPACITATED) {
      continue;
    }
    auto healthIt = state.healths.find(id);
    if (healthIt == state.healths.end()) {
      continue;
    }

    Health& health = healthIt->second;
    health.current = std::min(health.max, health.current + ctx.config.healthRecoveryPerTick);
    if (health.current >= health.max) {
      gnome.state = GnomeState::IDLE;
      gnome.fallStartY.reset();
      HEALTH_INFO("Gnome " + std::to_string(id) + " recovered");
    }
  }
}

} // namespace Delve

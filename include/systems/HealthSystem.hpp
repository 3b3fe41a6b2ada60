/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef HEALTH_SYSTEM_HPP
#define HEALTH_SYSTEM_HPP

#include "systems/System.hpp"

namespace Delve {

/**
 * @brief Recovery of incapacitated gnomes
 *
 * An incapacitated gnome regains health every tick and is back on its feet
 * (Idle) once fully healed.
 */
class HealthSystem : public System {
public:
  void update(WorldState& state, SystemContext& ctx) override;
  std::string getName() const override { return "Health"; }
};

} // namespace Delve

#endif // HEALTH_SYSTEM_HPP

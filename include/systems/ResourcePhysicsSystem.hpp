/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RESOURCE_PHYSICS_SYSTEM_HPP
#define RESOURCE_PHYSICS_SYSTEM_HPP

#include "systems/System.hpp"

namespace Delve {

/**
 * @brief Gravity for dropped resources
 *
 * A resource is either falling or grounded. A falling resource lands on top
 * of the first solid tile below it and, on that transition only, gets its
 * Collect task. A grounded resource whose supporting tile disappears starts
 * falling again and loses its Collect task, so no task ever points at a
 * resource in the air.
 */
class ResourcePhysicsSystem : public System {
public:
  void update(WorldState& state, SystemContext& ctx) override;
  std::string getName() const override { return "ResourcePhysics"; }
};

} // namespace Delve

#endif // RESOURCE_PHYSICS_SYSTEM_HPP

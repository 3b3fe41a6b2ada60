/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BOUNDS_SYSTEM_HPP
#define BOUNDS_SYSTEM_HPP

#include "systems/System.hpp"

namespace Delve {

/**
 * @brief Removes gnomes and resources that left the world
 *
 * Anything further than the configured margin outside the world rectangle
 * is destroyed. Gnomes release their task and idle partner first so no
 * reference outlives them.
 */
class BoundsSystem : public System {
public:
  void update(WorldState& state, SystemContext& ctx) override;
  std::string getName() const override { return "Bounds"; }

  static bool isOutOfBounds(const WorldState& state, const Position& position, int margin);
};

} // namespace Delve

#endif // BOUNDS_SYSTEM_HPP

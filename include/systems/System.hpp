/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SYSTEM_HPP
#define SYSTEM_HPP

#include "world/WorldState.hpp"
#include <cstdint>
#include <string>

namespace Delve {

struct SimConfig;
class Pathfinder;

/**
 * @brief Collaborators every system may use during a tick
 *
 * Read-only tunables and the shared pathfinder. The world itself is passed
 * separately so a system can never reach state it was not handed.
 */
struct SystemContext {
    const SimConfig& config;
    Pathfinder& pathfinder;

    SystemContext(const SimConfig& c, Pathfinder& p)
        : config(c), pathfinder(p) {}
};

/**
 * @brief One stage of the tick pipeline
 *
 * Systems run in a fixed order, each completing before the next starts.
 * They walk entities in ascending id order and draw randomness only from
 * SeededRandom, so a stage's output depends on nothing but its input state.
 */
class System {
public:
  virtual ~System() = default;

  /**
   * @brief Advances this stage by one tick
   * @param state World state, mutated in place
   * @param ctx Tunables and pathfinder
   */
  virtual void update(WorldState& state, SystemContext& ctx) = 0;

  virtual std::string getName() const = 0;
};

/**
 * @brief True on ticks where a throttled system should run
 */
inline bool isThrottleTick(uint64_t tick, uint32_t interval) {
  return interval == 0 || tick % interval == 0;
}

} // namespace Delve

#endif // SYSTEM_HPP

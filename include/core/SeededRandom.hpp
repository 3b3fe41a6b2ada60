/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SEEDED_RANDOM_HPP
#define SEEDED_RANDOM_HPP

#include "world/Components.hpp"
#include <cstdint>
#include <random>

namespace Delve {

/**
 * @brief Deterministic generator keyed by (world seed, entity, tick)
 *
 * Every random decision in the tick pipeline draws from one of these, built
 * on the spot for the entity and tick making the decision. Two streams that
 * must stay independent for the same entity and tick use different salts.
 *
 * Floats are built from the top 24 bits of each 32-bit draw so results do
 * not depend on the standard library's distribution implementations.
 */
class SeededRandom {
public:
    struct Salt {
        uint32_t entityMul;
        uint32_t tickMul;
    };

    static constexpr Salt IDLE_SALT{31, 17};
    static constexpr Salt CLIMB_SLIP_SALT{37, 19};

    SeededRandom(uint32_t seed, EntityID entity, uint64_t tick, Salt salt = IDLE_SALT)
        : m_engine(mix(seed, entity, tick, salt)) {}

    static uint32_t mix(uint32_t seed, EntityID entity, uint64_t tick, Salt salt) {
        return seed ^ (entity * salt.entityMul) ^ static_cast<uint32_t>(tick * salt.tickMul);
    }

    // Uniform in [0, 1)
    double nextDouble() {
        return static_cast<double>(m_engine() >> 8) / 16777216.0;
    }

    // Uniform integer in [min, max]; min > max returns min
    int64_t nextInRange(int64_t min, int64_t max) {
        if (max <= min) {
            return min;
        }
        const double span = static_cast<double>(max - min + 1);
        return min + static_cast<int64_t>(nextDouble() * span);
    }

    bool chance(double probability) {
        return nextDouble() < probability;
    }

private:
    std::mt19937 m_engine;
};

} // namespace Delve

#endif // SEEDED_RANDOM_HPP

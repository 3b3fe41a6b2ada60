/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/TickScheduler.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace Delve {

TickScheduler::TickScheduler(int ticksPerSecond, int maxTicksPerFrame)
    : m_msPerTick(0.0)
    , m_maxTicksPerFrame(maxTicksPerFrame)
{
    if (ticksPerSecond <= 0) {
        throw std::invalid_argument("TickScheduler: tick rate must be positive, got " +
                                    std::to_string(ticksPerSecond));
    }
    if (maxTicksPerFrame <= 0) {
        throw std::invalid_argument("TickScheduler: max ticks per frame must be positive, got " +
                                    std::to_string(maxTicksPerFrame));
    }
    m_msPerTick = 1000.0 / static_cast<double>(ticksPerSecond);
}

int TickScheduler::startFrame(double elapsedMs, int speedMultiplier, bool paused) {
    if (paused) {
        return 0;
    }

    // A clock that stepped backwards contributes nothing
    if (elapsedMs > 0.0 && speedMultiplier > 0) {
        m_accumulator += elapsedMs * static_cast<double>(speedMultiplier);
    }

    const double due = std::floor(m_accumulator / m_msPerTick);
    if (due <= static_cast<double>(m_maxTicksPerFrame)) {
        const int ticks = static_cast<int>(due);
        m_accumulator -= static_cast<double>(ticks) * m_msPerTick;
        return ticks;
    }

    // Over the cap: run the cap, keep only the partial tick
    const uint64_t dropped = static_cast<uint64_t>(due) - static_cast<uint64_t>(m_maxTicksPerFrame);
    m_droppedTicks += dropped;
    m_accumulator = std::fmod(m_accumulator, m_msPerTick);
    TICK_DEBUG("Frame over tick budget, dropped " + std::to_string(dropped) + " ticks");
    return m_maxTicksPerFrame;
}

double TickScheduler::getInterpolationAlpha() const {
    const double alpha = m_accumulator / m_msPerTick;
    return std::clamp(alpha, 0.0, std::nextafter(1.0, 0.0));
}

void TickScheduler::reset() {
    m_accumulator = 0.0;
    m_droppedTicks = 0;
}

} // namespace Delve

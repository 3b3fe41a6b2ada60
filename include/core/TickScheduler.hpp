/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TICK_SCHEDULER_HPP
#define TICK_SCHEDULER_HPP

#include <cstdint>

namespace Delve {

/**
 * TickScheduler converts real frame time into fixed simulation ticks.
 *
 * Elapsed time, scaled by the speed multiplier, feeds an accumulator that is
 * drained one logical tick at a time. A frame never runs more than
 * maxTicksPerFrame ticks; any backlog beyond the cap is dropped instead of
 * carried over, so a slow frame cannot snowball into ever longer catch-up.
 *
 * The remainder left in the accumulator gives the interpolation alpha the
 * renderer uses between the last two ticks.
 *
 * Knows nothing about wall clocks: the caller measures frame time.
 */
class TickScheduler {
public:
    /**
     * Constructor
     * @param ticksPerSecond Logical tick rate (e.g., 60)
     * @param maxTicksPerFrame Catch-up cap per frame
     * @throws std::invalid_argument if either value is not positive
     */
    TickScheduler(int ticksPerSecond, int maxTicksPerFrame);

    /**
     * Accounts for one frame of real time
     * @param elapsedMs Real time since the previous frame in milliseconds
     * @param speedMultiplier Simulation speed (1, 2, 3, ...)
     * @param paused No time accumulates while paused
     * @return Number of ticks to run this frame, at most maxTicksPerFrame
     */
    int startFrame(double elapsedMs, int speedMultiplier, bool paused);

    /**
     * Gets the fraction of the next tick already elapsed
     * @return alpha in [0, 1)
     */
    double getInterpolationAlpha() const;

    double getMsPerTick() const { return m_msPerTick; }
    int getMaxTicksPerFrame() const { return m_maxTicksPerFrame; }

    /**
     * Ticks discarded by the per-frame cap since construction or reset()
     */
    uint64_t getDroppedTicks() const { return m_droppedTicks; }

    /**
     * Clears the accumulator (after loading a save, for example)
     */
    void reset();

private:
    double m_msPerTick;
    int m_maxTicksPerFrame;
    double m_accumulator{0.0};
    uint64_t m_droppedTicks{0};
};

} // namespace Delve

#endif // TICK_SCHEDULER_HPP

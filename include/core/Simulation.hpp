/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SIMULATION_HPP
#define SIMULATION_HPP

#include "ai/pathfinding/Pathfinder.hpp"
#include "commands/CommandProcessor.hpp"
#include "commands/Commands.hpp"
#include "core/SimConfig.hpp"
#include "core/TickScheduler.hpp"
#include "systems/System.hpp"
#include "world/WorldState.hpp"
#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace Delve {

/**
 * What the presentation layer receives each frame. The state reference is
 * valid until the next call into the Simulation.
 */
struct RenderFrame {
    const WorldState& state;
    double interpolation;   // [0, 1) progress toward the next tick
    int ticksRun;
};

/**
 * Simulation owns the world and drives it one frame at a time.
 *
 * Per frame:
 *  1. every queued command is applied in FIFO order, paused or not
 *  2. the scheduler converts elapsed time into a capped number of ticks
 *  3. each tick runs the system pipeline in its fixed order, then advances
 *     the tick counter
 *  4. the camera eases toward its target
 *
 * Everything the pipeline reads is inside the WorldState or the config, so
 * two simulations fed the same commands at the same ticks stay identical.
 */
class Simulation {
public:
    /**
     * @throws std::invalid_argument if the config fails validation
     */
    Simulation(const SimConfig& config, WorldState initialState);
    ~Simulation();

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    /**
     * Queues a command for the start of the next frame
     */
    void enqueue(Command command);

    /**
     * Applies queued commands without running any tick
     * @return Number of commands the processor accepted
     */
    size_t drainCommands();

    /**
     * Advances one real frame
     * @param elapsedMs Real time since the previous frame
     */
    RenderFrame frame(double elapsedMs);

    /**
     * Runs exactly one tick of the pipeline, ignoring pause and timing
     */
    void step();

    /**
     * Replaces the world, e.g. after loading a save. Pending commands and
     * cached routes are discarded.
     */
    void loadState(WorldState state);

    const WorldState& state() const { return m_state; }
    const SimConfig& config() const { return m_config; }
    Pathfinder& pathfinder() { return *m_pathfinder; }
    const TickScheduler& scheduler() const { return m_scheduler; }
    size_t pendingCommands() const { return m_queue.size(); }

    std::vector<std::string> systemNames() const;

    /**
     * Eases the camera a fixed fraction of the way to its target
     */
    static void updateCamera(Camera& camera, float lerpSpeed);

private:
    SimConfig m_config;
    WorldState m_state;
    std::unique_ptr<Pathfinder> m_pathfinder;
    CommandProcessor m_commandProcessor;
    TickScheduler m_scheduler;
    std::vector<std::unique_ptr<System>> m_systems;
    std::deque<Command> m_queue;

    static const SimConfig& validated(const SimConfig& config);
};

} // namespace Delve

#endif // SIMULATION_HPP

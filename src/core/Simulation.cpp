/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/Simulation.hpp"
#include "core/Logger.hpp"
#include "systems/BoundsSystem.hpp"
#include "systems/CollectTaskSystem.hpp"
#include "systems/DepositSystem.hpp"
#include "systems/HealthSystem.hpp"
#include "systems/IdleBehaviorSystem.hpp"
#include "systems/MiningSystem.hpp"
#include "systems/PhysicsSystem.hpp"
#include "systems/ResourcePhysicsSystem.hpp"
#include "systems/TaskAssignmentSystem.hpp"
#include <stdexcept>
#include <utility>

namespace Delve {

const SimConfig& Simulation::validated(const SimConfig& config) {
    std::string error;
    if (!config.validate(error)) {
        throw std::invalid_argument("Simulation: invalid config: " + error);
    }
    return config;
}

Simulation::Simulation(const SimConfig& config, WorldState initialState)
    : m_config(validated(config))
    , m_state(std::move(initialState))
    , m_pathfinder(std::make_unique<Pathfinder>(m_config))
    , m_commandProcessor(m_config)
    , m_scheduler(m_config.ticksPerSecond, m_config.maxTicksPerFrame)
{
    // Deposit precedes assignment so carriers unload before taking new work
    m_systems.push_back(std::make_unique<PhysicsSystem>());
    m_systems.push_back(std::make_unique<ResourcePhysicsSystem>());
    m_systems.push_back(std::make_unique<HealthSystem>());
    m_systems.push_back(std::make_unique<DepositSystem>());
    m_systems.push_back(std::make_unique<TaskAssignmentSystem>());
    m_systems.push_back(std::make_unique<MiningSystem>());
    m_systems.push_back(std::make_unique<CollectTaskSystem>());
    m_systems.push_back(std::make_unique<IdleBehaviorSystem>());
    m_systems.push_back(std::make_unique<BoundsSystem>());

    SIM_INFO("Simulation ready: " + std::to_string(m_state.worldWidth) + "x" +
             std::to_string(m_state.worldHeight) + " world, seed " + std::to_string(m_state.seed) +
             ", " + std::to_string(m_systems.size()) + " systems");
}

Simulation::~Simulation() = default;

void Simulation::enqueue(Command command) {
    m_queue.push_back(std::move(command));
}

size_t Simulation::drainCommands() {
    size_t accepted = 0;
    while (!m_queue.empty()) {
        Command command = std::move(m_queue.front());
        m_queue.pop_front();
        if (m_commandProcessor.apply(m_state, command)) {
            ++accepted;
        }
    }
    return accepted;
}

RenderFrame Simulation::frame(double elapsedMs) {
    drainCommands();

    const int ticks = m_scheduler.startFrame(elapsedMs, m_state.speed, m_state.isPaused);
    for (int i = 0; i < ticks; ++i) {
        step();
    }

    updateCamera(m_state.camera, m_config.cameraLerpSpeed);

    return RenderFrame{m_state, m_scheduler.getInterpolationAlpha(), ticks};
}

void Simulation::step() {
    SystemContext ctx(m_config, *m_pathfinder);
    for (auto& system : m_systems) {
        system->update(m_state, ctx);
    }
    ++m_state.tick;
}

void Simulation::loadState(WorldState state) {
    m_state = std::move(state);
    m_queue.clear();
    m_pathfinder->clearCache();
    m_scheduler.reset();
    SIM_INFO("World replaced at tick " + std::to_string(m_state.tick));
}

std::vector<std::string> Simulation::systemNames() const {
    std::vector<std::string> names;
    names.reserve(m_systems.size());
    for (const auto& system : m_systems) {
        names.push_back(system->getName());
    }
    return names;
}

void Simulation::updateCamera(Camera& camera, float lerpSpeed) {
    camera.x += (camera.targetX - camera.x) * lerpSpeed;
    camera.y += (camera.targetY - camera.y) * lerpSpeed;
}

} // namespace Delve

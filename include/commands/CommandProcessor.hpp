/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef COMMAND_PROCESSOR_HPP
#define COMMAND_PROCESSOR_HPP

#include "commands/Commands.hpp"
#include "world/WorldState.hpp"

namespace Delve {

struct SimConfig;

/**
 * @brief Applies player commands to the world state
 *
 * Commands that fail validation (digging bedrock, a blocked building
 * footprint, an unknown speed) leave the state untouched. Nothing here
 * throws for gameplay input.
 */
class CommandProcessor {
public:
    explicit CommandProcessor(const SimConfig& config) : m_config(config) {}

    /**
     * @brief Applies a command in place
     * @return true if the command was accepted
     */
    bool apply(WorldState& state, const Command& command) const;

    /**
     * @brief Value form of apply(): returns the successor state
     */
    WorldState reduce(WorldState state, const Command& command) const {
        apply(state, command);
        return state;
    }

private:
    const SimConfig& m_config;

    bool selectTiles(WorldState& state, const SelectTiles& command) const;
    bool selectGnomes(WorldState& state, const SelectGnomes& command) const;
    bool clearSelection(WorldState& state) const;
    bool dig(WorldState& state, const Dig& command) const;
    bool cancelDig(WorldState& state, const CancelDig& command) const;
    bool cancelTask(WorldState& state, EntityID taskId) const;
    bool panCamera(WorldState& state, const PanCamera& command) const;
    bool zoomCamera(WorldState& state, const ZoomCamera& command) const;
    bool setSpeed(WorldState& state, const SetSpeed& command) const;
    bool togglePause(WorldState& state) const;
    bool spawnGnome(WorldState& state, const SpawnGnome& command) const;
    bool placeBuilding(WorldState& state, const PlaceBuilding& command) const;
};

} // namespace Delve

#endif // COMMAND_PROCESSOR_HPP

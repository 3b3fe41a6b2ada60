/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef COMMANDS_HPP
#define COMMANDS_HPP

#include "world/Components.hpp"
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace Delve {

// Player commands, queued by the input layer and applied in FIFO order

/**
 * Replaces the tile selection (and clears selected gnomes), or toggles each
 * tile's membership when additive.
 */
struct SelectTiles {
    std::vector<TileCoord> tiles;
    bool additive{false};
};

/**
 * Replaces the gnome selection with the ids that exist, or toggles each id
 * when additive. Clears the tile selection either way.
 */
struct SelectGnomes {
    std::vector<EntityID> ids;
    bool additive{false};
};

struct ClearSelection {};

/**
 * Creates one Dig task per diggable tile that has none yet, then clears
 * the tile selection.
 */
struct Dig {
    std::vector<TileCoord> tiles;
    TaskPriority priority{TaskPriority::NORMAL};
};

struct CancelDig {
    std::vector<TileCoord> tiles;
};

struct CancelTask {
    EntityID taskId{INVALID_ENTITY};
};

// Moves the camera target by a world-pixel offset
struct PanCamera {
    float dx{0.0f};
    float dy{0.0f};
};

// Changes zoom by delta keeping the world point under the mouse fixed
struct ZoomCamera {
    float delta{0.0f};
    float mouseX{0.0f};
    float mouseY{0.0f};
    float screenWidth{0.0f};
    float screenHeight{0.0f};
};

struct SetSpeed {
    int multiplier{1};
};

struct TogglePause {};

// Without a position the gnome spawns on the surface nearest the world centre
struct SpawnGnome {
    std::optional<TileCoord> at;
};

// Anchored at the footprint's top-left tile
struct PlaceBuilding {
    BuildingType type{BuildingType::STORAGE};
    int x{0};
    int y{0};
};

using Command = std::variant<SelectTiles, SelectGnomes, ClearSelection, Dig, CancelDig, CancelTask,
                             PanCamera, ZoomCamera, SetSpeed, TogglePause, SpawnGnome, PlaceBuilding>;

/**
 * @brief Short command name for logs
 */
std::string_view commandName(const Command& command);

} // namespace Delve

#endif // COMMANDS_HPP

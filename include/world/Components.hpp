/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef COMPONENTS_HPP
#define COMPONENTS_HPP

#include <boost/container/flat_map.hpp>
#include <boost/container/small_vector.hpp>
#include <cstdint>
#include <optional>
#include <ostream>
#include <vector>

namespace Delve {

/**
 * Entities are bare integer ids. An entity's kind is defined only by which
 * component maps contain it. Ids start at 1 and are never reused.
 */
using EntityID = uint32_t;
constexpr EntityID INVALID_ENTITY = 0;

// World rendering constant shared with the camera
constexpr float TILE_SIZE = 32.0f;

struct TileCoord {
    int x{0};
    int y{0};

    bool operator==(const TileCoord&) const = default;
};

inline std::ostream& operator<<(std::ostream& os, const TileCoord& coord) {
    return os << "(" << coord.x << "," << coord.y << ")";
}

enum class TileType : uint8_t {
    AIR = 0,
    DIRT = 1,
    STONE = 2,
    BEDROCK = 3
};

enum class ResourceType : uint8_t {
    DIRT = 1,
    STONE = 2
};

enum class GnomeState : uint8_t {
    IDLE = 0,
    WALKING,
    MINING,
    FALLING,
    COLLECTING,
    DEPOSITING,
    INCAPACITATED
};

enum class TaskType : uint8_t {
    DIG = 0,
    COLLECT
};

enum class TaskPriority : uint8_t {
    LOW = 0,
    NORMAL = 1,
    HIGH = 2,
    URGENT = 3
};

enum class IdleBehaviorType : uint8_t {
    STROLLING = 0,
    SOCIALIZING,
    RESTING
};

enum class BuildingType : uint8_t {
    STORAGE = 0
};

// Stream operators for test output
inline std::ostream& operator<<(std::ostream& os, const TileType& type) {
    switch (type) {
        case TileType::AIR: return os << "AIR";
        case TileType::DIRT: return os << "DIRT";
        case TileType::STONE: return os << "STONE";
        case TileType::BEDROCK: return os << "BEDROCK";
        default: return os << "UNKNOWN";
    }
}

inline std::ostream& operator<<(std::ostream& os, const ResourceType& type) {
    switch (type) {
        case ResourceType::DIRT: return os << "DIRT";
        case ResourceType::STONE: return os << "STONE";
        default: return os << "UNKNOWN";
    }
}

inline std::ostream& operator<<(std::ostream& os, const GnomeState& state) {
    switch (state) {
        case GnomeState::IDLE: return os << "IDLE";
        case GnomeState::WALKING: return os << "WALKING";
        case GnomeState::MINING: return os << "MINING";
        case GnomeState::FALLING: return os << "FALLING";
        case GnomeState::COLLECTING: return os << "COLLECTING";
        case GnomeState::DEPOSITING: return os << "DEPOSITING";
        case GnomeState::INCAPACITATED: return os << "INCAPACITATED";
        default: return os << "UNKNOWN";
    }
}

inline std::ostream& operator<<(std::ostream& os, const TaskType& type) {
    switch (type) {
        case TaskType::DIG: return os << "DIG";
        case TaskType::COLLECT: return os << "COLLECT";
        default: return os << "UNKNOWN";
    }
}

inline std::ostream& operator<<(std::ostream& os, const TaskPriority& priority) {
    switch (priority) {
        case TaskPriority::LOW: return os << "LOW";
        case TaskPriority::NORMAL: return os << "NORMAL";
        case TaskPriority::HIGH: return os << "HIGH";
        case TaskPriority::URGENT: return os << "URGENT";
        default: return os << "UNKNOWN";
    }
}

inline std::ostream& operator<<(std::ostream& os, const IdleBehaviorType& type) {
    switch (type) {
        case IdleBehaviorType::STROLLING: return os << "STROLLING";
        case IdleBehaviorType::SOCIALIZING: return os << "SOCIALIZING";
        case IdleBehaviorType::RESTING: return os << "RESTING";
        default: return os << "UNKNOWN";
    }
}

/**
 * Per-type tile properties. Bedrock carries no durability because it can
 * never be mined.
 */
struct TileProperties {
    int durability;
    int mineRate;
    bool indestructible;
    std::optional<ResourceType> drop;
};

inline TileProperties getTileProperties(TileType type) {
    switch (type) {
        case TileType::DIRT: return {100, 2, false, ResourceType::DIRT};
        case TileType::STONE: return {200, 1, false, ResourceType::STONE};
        case TileType::BEDROCK: return {0, 0, true, std::nullopt};
        case TileType::AIR:
        default: return {0, 0, false, std::nullopt};
    }
}

// Components

struct Position {
    float x{0.0f};
    float y{0.0f};

    bool operator==(const Position&) const = default;
};

struct Velocity {
    float dx{0.0f};
    float dy{0.0f};

    bool operator==(const Velocity&) const = default;
};

struct Tile {
    TileType type{TileType::AIR};
    int durability{0};

    bool operator==(const Tile&) const = default;
};

struct IdleBehavior {
    IdleBehaviorType type{IdleBehaviorType::RESTING};
    uint64_t startedAt{0};
    uint64_t endsAt{0};
    std::optional<TileCoord> target;   // stroll destination
    std::optional<EntityID> partner;   // socialize partner
    int marker{0};                     // cosmetic conversation marker

    bool operator==(const IdleBehavior&) const = default;
};

// Inline storage covers the default capacity without heap allocation
constexpr size_t INVENTORY_INLINE_CAPACITY = 5;
using Inventory = boost::container::small_vector<ResourceType, INVENTORY_INLINE_CAPACITY>;

struct Gnome {
    GnomeState state{GnomeState::IDLE};
    std::optional<EntityID> currentTaskId;
    std::vector<TileCoord> path;       // excludes the tile the gnome started on
    size_t pathIndex{0};
    Inventory inventory;
    std::optional<IdleBehavior> idleBehavior;
    std::optional<EntityID> depositTargetStorage;
    std::optional<float> fallStartY;

    bool isStrolling() const {
        return idleBehavior && idleBehavior->type == IdleBehaviorType::STROLLING;
    }

    bool operator==(const Gnome&) const = default;
};

struct Task {
    TaskType type{TaskType::DIG};
    int targetX{0};
    int targetY{0};
    TaskPriority priority{TaskPriority::NORMAL};
    uint64_t createdAt{0};
    std::optional<EntityID> assignedGnome;
    int progress{0};                   // 0..100
    std::optional<EntityID> targetEntity;
    int unreachableCount{0};

    bool operator==(const Task&) const = default;
};

struct Resource {
    ResourceType type{ResourceType::DIRT};
    bool isGrounded{false};

    bool operator==(const Resource&) const = default;
};

struct Building {
    BuildingType type{BuildingType::STORAGE};
    int width{2};
    int height{2};

    bool operator==(const Building&) const = default;
};

struct Storage {
    boost::container::flat_map<ResourceType, int> contents;

    int count(ResourceType type) const {
        auto it = contents.find(type);
        return it != contents.end() ? it->second : 0;
    }

    bool operator==(const Storage&) const = default;
};

struct Health {
    int current{100};
    int max{100};

    bool operator==(const Health&) const = default;
};

/**
 * Presentation camera in world pixels. Eased toward its target once per
 * frame; never read by the tick pipeline.
 */
struct Camera {
    float x{0.0f};
    float y{0.0f};
    float zoom{1.0f};
    float targetX{0.0f};
    float targetY{0.0f};

    bool operator==(const Camera&) const = default;
};

// Footprint of a storage building in tiles
constexpr int STORAGE_WIDTH = 2;
constexpr int STORAGE_HEIGHT = 2;

} // namespace Delve

#endif // COMPONENTS_HPP

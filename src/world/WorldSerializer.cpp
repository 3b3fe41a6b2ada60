/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/WorldSerializer.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <optional>
#include <stdexcept>

namespace Delve {

namespace {

// Thrown inside fromJson only, turned into the error string at the boundary
struct FormatError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

JsonValue id(EntityID entity) {
    return JsonValue(static_cast<uint64_t>(entity));
}

JsonValue coordToJson(const TileCoord& coord) {
    return JsonValue(JsonArray{JsonValue(coord.x), JsonValue(coord.y)});
}

JsonValue coordsToJson(const std::vector<TileCoord>& coords) {
    JsonArray arr;
    arr.reserve(coords.size());
    for (const auto& coord : coords) {
        arr.push_back(coordToJson(coord));
    }
    return JsonValue(std::move(arr));
}

// Readers. Missing keys fall back; present keys of the wrong type are errors.

double readNumber(const JsonValue& obj, const std::string& key, double fallback) {
    const JsonValue& v = obj[key];
    if (v.isNull()) {
        return fallback;
    }
    if (!v.isNumber()) {
        throw FormatError("'" + key + "' is not a number");
    }
    return v.asNumber();
}

int readInt(const JsonValue& obj, const std::string& key, int fallback) {
    return static_cast<int>(readNumber(obj, key, fallback));
}

uint64_t readUInt64(const JsonValue& obj, const std::string& key, uint64_t fallback) {
    const double value = readNumber(obj, key, static_cast<double>(fallback));
    if (value < 0.0) {
        throw FormatError("'" + key + "' is negative");
    }
    return static_cast<uint64_t>(value);
}

float readFloat(const JsonValue& obj, const std::string& key, float fallback) {
    return static_cast<float>(readNumber(obj, key, fallback));
}

bool readBool(const JsonValue& obj, const std::string& key, bool fallback) {
    const JsonValue& v = obj[key];
    if (v.isNull()) {
        return fallback;
    }
    if (!v.isBool()) {
        throw FormatError("'" + key + "' is not a boolean");
    }
    return v.asBool();
}

std::optional<EntityID> readOptionalId(const JsonValue& obj, const std::string& key) {
    const JsonValue& v = obj[key];
    if (v.isNull()) {
        return std::nullopt;
    }
    if (!v.isNumber() || v.asNumber() < 1.0) {
        throw FormatError("'" + key + "' is not an entity id");
    }
    return static_cast<EntityID>(v.asUInt64());
}

EntityID readId(const JsonValue& record) {
    std::optional<EntityID> entity = readOptionalId(record, "id");
    if (!entity) {
        throw FormatError("record without id");
    }
    return *entity;
}

template<typename E>
E readEnum(const JsonValue& obj, const std::string& key, E fallback, int minValue, int maxValue) {
    const int raw = readInt(obj, key, static_cast<int>(fallback));
    if (raw < minValue || raw > maxValue) {
        throw FormatError("'" + key + "' has unknown value " + std::to_string(raw));
    }
    return static_cast<E>(raw);
}

TileCoord readCoord(const JsonValue& v) {
    if (!v.isArray() || v.size() != 2 || !v[0].isNumber() || !v[1].isNumber()) {
        throw FormatError("malformed tile coordinate");
    }
    return TileCoord{v[0].asInt(), v[1].asInt()};
}

std::vector<TileCoord> readCoords(const JsonValue& obj, const std::string& key) {
    std::vector<TileCoord> coords;
    const JsonValue& v = obj[key];
    if (v.isNull()) {
        return coords;
    }
    if (!v.isArray()) {
        throw FormatError("'" + key + "' is not an array");
    }
    coords.reserve(v.size());
    for (const auto& item : v.asArray()) {
        coords.push_back(readCoord(item));
    }
    return coords;
}

const JsonArray& readRecords(const JsonValue& root, const std::string& key) {
    static const JsonArray empty;
    const JsonValue& v = root[key];
    if (v.isNull()) {
        return empty;
    }
    if (!v.isArray()) {
        throw FormatError("'" + key + "' is not an array");
    }
    return v.asArray();
}

// Writers per component

JsonValue gnomeToJson(EntityID entity, const Gnome& gnome) {
    JsonValue out(JsonObject{});
    out["id"] = id(entity);
    out["state"] = JsonValue(static_cast<int>(gnome.state));
    if (gnome.currentTaskId) {
        out["currentTaskId"] = id(*gnome.currentTaskId);
    }
    out["path"] = coordsToJson(gnome.path);
    out["pathIndex"] = JsonValue(static_cast<uint64_t>(gnome.pathIndex));

    JsonArray inventory;
    for (ResourceType item : gnome.inventory) {
        inventory.push_back(JsonValue(static_cast<int>(item)));
    }
    out["inventory"] = JsonValue(std::move(inventory));

    if (gnome.idleBehavior) {
        const IdleBehavior& idle = *gnome.idleBehavior;
        JsonValue tag(JsonObject{});
        tag["type"] = JsonValue(static_cast<int>(idle.type));
        tag["startedAt"] = JsonValue(idle.startedAt);
        tag["endsAt"] = JsonValue(idle.endsAt);
        if (idle.target) {
            tag["target"] = coordToJson(*idle.target);
        }
        if (idle.partner) {
            tag["partner"] = id(*idle.partner);
        }
        tag["marker"] = JsonValue(idle.marker);
        out["idleBehavior"] = std::move(tag);
    }
    if (gnome.depositTargetStorage) {
        out["depositTargetStorage"] = id(*gnome.depositTargetStorage);
    }
    if (gnome.fallStartY) {
        out["fallStartY"] = JsonValue(static_cast<double>(*gnome.fallStartY));
    }
    return out;
}

JsonValue taskToJson(EntityID entity, const Task& task) {
    JsonValue out(JsonObject{});
    out["id"] = id(entity);
    out["type"] = JsonValue(static_cast<int>(task.type));
    out["targetX"] = JsonValue(task.targetX);
    out["targetY"] = JsonValue(task.targetY);
    out["priority"] = JsonValue(static_cast<int>(task.priority));
    out["createdAt"] = JsonValue(task.createdAt);
    if (task.assignedGnome) {
        out["assignedGnome"] = id(*task.assignedGnome);
    }
    out["progress"] = JsonValue(task.progress);
    if (task.targetEntity) {
        out["targetEntity"] = id(*task.targetEntity);
    }
    out["unreachableCount"] = JsonValue(task.unreachableCount);
    return out;
}

// Readers per component

Gnome gnomeFromJson(const JsonValue& record) {
    Gnome gnome;
    gnome.state = readEnum(record, "state", GnomeState::IDLE, 0, static_cast<int>(GnomeState::INCAPACITATED));
    gnome.currentTaskId = readOptionalId(record, "currentTaskId");
    gnome.path = readCoords(record, "path");
    gnome.pathIndex = static_cast<size_t>(readUInt64(record, "pathIndex", 0));
    if (gnome.pathIndex > gnome.path.size()) {
        gnome.pathIndex = gnome.path.size();
    }

    const JsonValue& inventory = record["inventory"];
    if (inventory.isArray()) {
        for (const auto& item : inventory.asArray()) {
            if (!item.isNumber() || item.asInt() < static_cast<int>(ResourceType::DIRT) ||
                item.asInt() > static_cast<int>(ResourceType::STONE)) {
                throw FormatError("unknown inventory item");
            }
            gnome.inventory.push_back(static_cast<ResourceType>(item.asInt()));
        }
    } else if (!inventory.isNull()) {
        throw FormatError("'inventory' is not an array");
    }

    const JsonValue& tag = record["idleBehavior"];
    if (tag.isObject()) {
        IdleBehavior idle;
        idle.type = readEnum(tag, "type", IdleBehaviorType::RESTING, 0, static_cast<int>(IdleBehaviorType::RESTING));
        idle.startedAt = readUInt64(tag, "startedAt", 0);
        idle.endsAt = readUInt64(tag, "endsAt", 0);
        if (!tag["target"].isNull()) {
            idle.target = readCoord(tag["target"]);
        }
        idle.partner = readOptionalId(tag, "partner");
        idle.marker = readInt(tag, "marker", 0);
        gnome.idleBehavior = idle;
    } else if (!tag.isNull()) {
        throw FormatError("'idleBehavior' is not an object");
    }

    gnome.depositTargetStorage = readOptionalId(record, "depositTargetStorage");
    if (!record["fallStartY"].isNull()) {
        gnome.fallStartY = readFloat(record, "fallStartY", 0.0f);
    }
    return gnome;
}

Task taskFromJson(const JsonValue& record) {
    Task task;
    task.type = readEnum(record, "type", TaskType::DIG, 0, static_cast<int>(TaskType::COLLECT));
    task.targetX = readInt(record, "targetX", 0);
    task.targetY = readInt(record, "targetY", 0);
    task.priority = readEnum(record, "priority", TaskPriority::NORMAL, 0, static_cast<int>(TaskPriority::URGENT));
    task.createdAt = readUInt64(record, "createdAt", 0);
    task.assignedGnome = readOptionalId(record, "assignedGnome");
    task.progress = readInt(record, "progress", 0);
    task.targetEntity = readOptionalId(record, "targetEntity");
    task.unreachableCount = readInt(record, "unreachableCount", 0);
    return task;
}

void parseWorld(const JsonValue& root, WorldState& state, int gnomeMaxHealth) {
    if (!root.isObject()) {
        throw FormatError("world is not a JSON object");
    }

    if (!root["worldWidth"].isNumber() || !root["worldHeight"].isNumber()) {
        throw FormatError("missing world dimensions");
    }
    state.worldWidth = root["worldWidth"].asInt();
    state.worldHeight = root["worldHeight"].asInt();
    if (state.worldWidth <= 0 || state.worldHeight <= 0) {
        throw FormatError("non-positive world dimensions");
    }

    state.seed = static_cast<uint32_t>(readUInt64(root, "seed", 0));
    state.tick = readUInt64(root, "tick", 0);
    state.isPaused = readBool(root, "isPaused", false);
    state.speed = readInt(root, "speed", 1);
    state.horizonY = readInt(root, "horizonY",
                             static_cast<int>(std::floor(static_cast<double>(state.worldHeight) * 0.3)));
    state.terrainRevision = readUInt64(root, "terrainRevision", 0);

    // Components
    for (const auto& record : readRecords(root, "positions")) {
        state.positions[readId(record)] = Position{readFloat(record, "x", 0.0f), readFloat(record, "y", 0.0f)};
    }
    for (const auto& record : readRecords(root, "velocities")) {
        state.velocities[readId(record)] = Velocity{readFloat(record, "dx", 0.0f), readFloat(record, "dy", 0.0f)};
    }
    for (const auto& record : readRecords(root, "tiles")) {
        Tile tile;
        tile.type = readEnum(record, "type", TileType::AIR, 0, static_cast<int>(TileType::BEDROCK));
        tile.durability = readInt(record, "durability", getTileProperties(tile.type).durability);
        state.tiles[readId(record)] = tile;
    }
    for (const auto& record : readRecords(root, "gnomes")) {
        state.gnomes[readId(record)] = gnomeFromJson(record);
    }
    for (const auto& record : readRecords(root, "tasks")) {
        state.tasks[readId(record)] = taskFromJson(record);
    }
    for (const auto& record : readRecords(root, "resources")) {
        Resource resource;
        resource.type = readEnum(record, "type", ResourceType::DIRT,
                                 static_cast<int>(ResourceType::DIRT), static_cast<int>(ResourceType::STONE));
        // Older saves only held resources that had already landed
        resource.isGrounded = readBool(record, "isGrounded", true);
        state.resources[readId(record)] = resource;
    }
    for (const auto& record : readRecords(root, "buildings")) {
        Building building;
        building.type = readEnum(record, "type", BuildingType::STORAGE, 0, static_cast<int>(BuildingType::STORAGE));
        building.width = readInt(record, "width", STORAGE_WIDTH);
        building.height = readInt(record, "height", STORAGE_HEIGHT);
        state.buildings[readId(record)] = building;
    }
    for (const auto& record : readRecords(root, "storages")) {
        Storage storage;
        for (const auto& pair : readRecords(record, "contents")) {
            if (!pair.isArray() || pair.size() != 2 || !pair[0].isNumber() || !pair[1].isNumber()) {
                throw FormatError("malformed storage entry");
            }
            const int type = pair[0].asInt();
            if (type < static_cast<int>(ResourceType::DIRT) || type > static_cast<int>(ResourceType::STONE)) {
                throw FormatError("unknown stored resource type " + std::to_string(type));
            }
            storage.contents[static_cast<ResourceType>(type)] = pair[1].asInt();
        }
        state.storages[readId(record)] = storage;
    }
    for (const auto& record : readRecords(root, "healths")) {
        Health health;
        health.max = readInt(record, "max", gnomeMaxHealth);
        health.current = readInt(record, "current", health.max);
        state.healths[readId(record)] = health;
    }

    // Tile grid
    const JsonValue& grid = root["tileGrid"];
    const size_t cells = static_cast<size_t>(state.worldWidth) * static_cast<size_t>(state.worldHeight);
    if (!grid.isArray() || grid.size() != cells) {
        throw FormatError("tile grid does not match world dimensions");
    }
    state.tileGrid.assign(cells, INVALID_ENTITY);
    for (size_t i = 0; i < cells; ++i) {
        const JsonValue& cell = grid.asArray()[i];
        if (!cell.isNumber() || cell.asNumber() < 0.0) {
            throw FormatError("malformed tile grid cell");
        }
        const EntityID tile = static_cast<EntityID>(cell.asUInt64());
        if (tile != INVALID_ENTITY && !state.tiles.contains(tile)) {
            throw FormatError("tile grid references unknown tile " + std::to_string(tile));
        }
        state.tileGrid[i] = tile;
    }

    // Backfill fields older saves lacked
    for (const auto& [entity, gnome] : state.gnomes) {
        if (!state.healths.contains(entity)) {
            state.healths[entity] = Health{gnomeMaxHealth, gnomeMaxHealth};
        }
        if (!state.velocities.contains(entity)) {
            state.velocities[entity] = Velocity{};
        }
    }
    for (const auto& [entity, resource] : state.resources) {
        if (!state.velocities.contains(entity)) {
            state.velocities[entity] = Velocity{};
        }
    }

    EntityID highest = 0;
    auto track = [&highest](EntityID entity) { highest = std::max(highest, entity); };
    for (const auto& entry : state.positions) track(entry.first);
    for (const auto& entry : state.tiles) track(entry.first);
    for (const auto& entry : state.gnomes) track(entry.first);
    for (const auto& entry : state.tasks) track(entry.first);
    for (const auto& entry : state.resources) track(entry.first);
    for (const auto& entry : state.buildings) track(entry.first);
    const EntityID savedNext = static_cast<EntityID>(readUInt64(root, "nextEntityId", 0));
    state.nextEntityId = std::max(savedNext, static_cast<EntityID>(highest + 1));

    const JsonValue& camera = root["camera"];
    if (camera.isObject()) {
        state.camera.x = readFloat(camera, "x", 0.0f);
        state.camera.y = readFloat(camera, "y", 0.0f);
        state.camera.zoom = readFloat(camera, "zoom", 1.0f);
        state.camera.targetX = readFloat(camera, "targetX", state.camera.x);
        state.camera.targetY = readFloat(camera, "targetY", state.camera.y);
    } else {
        state.camera = Camera{};
        state.camera.x = static_cast<float>(state.worldWidth) * TILE_SIZE / 2.0f;
        state.camera.y = static_cast<float>(state.horizonY) * TILE_SIZE;
        state.camera.targetX = state.camera.x;
        state.camera.targetY = state.camera.y;
    }

    state.selectedTiles = readCoords(root, "selectedTiles");
    for (const auto& v : readRecords(root, "selectedGnomes")) {
        if (!v.isNumber()) {
            throw FormatError("malformed selected gnome");
        }
        const EntityID gnome = static_cast<EntityID>(v.asUInt64());
        if (state.gnomes.contains(gnome)) {
            state.selectedGnomes.push_back(gnome);
        }
    }
}

} // namespace

JsonValue WorldSerializer::toJson(const WorldState& state) {
    JsonValue root(JsonObject{});

    root["seed"] = JsonValue(static_cast<uint64_t>(state.seed));
    root["tick"] = JsonValue(state.tick);
    root["isPaused"] = JsonValue(state.isPaused);
    root["speed"] = JsonValue(state.speed);
    root["nextEntityId"] = id(state.nextEntityId);
    root["worldWidth"] = JsonValue(state.worldWidth);
    root["worldHeight"] = JsonValue(state.worldHeight);
    root["horizonY"] = JsonValue(state.horizonY);
    root["terrainRevision"] = JsonValue(state.terrainRevision);

    JsonArray grid;
    grid.reserve(state.tileGrid.size());
    for (EntityID tile : state.tileGrid) {
        grid.push_back(id(tile));
    }
    root["tileGrid"] = JsonValue(std::move(grid));

    JsonArray positions;
    for (const auto& [entity, pos] : state.positions) {
        JsonValue record(JsonObject{});
        record["id"] = id(entity);
        record["x"] = JsonValue(static_cast<double>(pos.x));
        record["y"] = JsonValue(static_cast<double>(pos.y));
        positions.push_back(std::move(record));
    }
    root["positions"] = JsonValue(std::move(positions));

    JsonArray velocities;
    for (const auto& [entity, vel] : state.velocities) {
        JsonValue record(JsonObject{});
        record["id"] = id(entity);
        record["dx"] = JsonValue(static_cast<double>(vel.dx));
        record["dy"] = JsonValue(static_cast<double>(vel.dy));
        velocities.push_back(std::move(record));
    }
    root["velocities"] = JsonValue(std::move(velocities));

    JsonArray tiles;
    for (const auto& [entity, tile] : state.tiles) {
        JsonValue record(JsonObject{});
        record["id"] = id(entity);
        record["type"] = JsonValue(static_cast<int>(tile.type));
        record["durability"] = JsonValue(tile.durability);
        tiles.push_back(std::move(record));
    }
    root["tiles"] = JsonValue(std::move(tiles));

    JsonArray gnomes;
    for (const auto& [entity, gnome] : state.gnomes) {
        gnomes.push_back(gnomeToJson(entity, gnome));
    }
    root["gnomes"] = JsonValue(std::move(gnomes));

    JsonArray tasks;
    for (const auto& [entity, task] : state.tasks) {
        tasks.push_back(taskToJson(entity, task));
    }
    root["tasks"] = JsonValue(std::move(tasks));

    JsonArray resources;
    for (const auto& [entity, resource] : state.resources) {
        JsonValue record(JsonObject{});
        record["id"] = id(entity);
        record["type"] = JsonValue(static_cast<int>(resource.type));
        record["isGrounded"] = JsonValue(resource.isGrounded);
        resources.push_back(std::move(record));
    }
    root["resources"] = JsonValue(std::move(resources));

    JsonArray buildings;
    for (const auto& [entity, building] : state.buildings) {
        JsonValue record(JsonObject{});
        record["id"] = id(entity);
        record["type"] = JsonValue(static_cast<int>(building.type));
        record["width"] = JsonValue(building.width);
        record["height"] = JsonValue(building.height);
        buildings.push_back(std::move(record));
    }
    root["buildings"] = JsonValue(std::move(buildings));

    JsonArray storages;
    for (const auto& [entity, storage] : state.storages) {
        JsonArray contents;
        for (const auto& [type, count] : storage.contents) {
            contents.push_back(JsonValue(JsonArray{JsonValue(static_cast<int>(type)), JsonValue(count)}));
        }
        JsonValue record(JsonObject{});
        record["id"] = id(entity);
        record["contents"] = JsonValue(std::move(contents));
        storages.push_back(std::move(record));
    }
    root["storages"] = JsonValue(std::move(storages));

    JsonArray healths;
    for (const auto& [entity, health] : state.healths) {
        JsonValue record(JsonObject{});
        record["id"] = id(entity);
        record["current"] = JsonValue(health.current);
        record["max"] = JsonValue(health.max);
        healths.push_back(std::move(record));
    }
    root["healths"] = JsonValue(std::move(healths));

    JsonValue camera(JsonObject{});
    camera["x"] = JsonValue(static_cast<double>(state.camera.x));
    camera["y"] = JsonValue(static_cast<double>(state.camera.y));
    camera["zoom"] = JsonValue(static_cast<double>(state.camera.zoom));
    camera["targetX"] = JsonValue(static_cast<double>(state.camera.targetX));
    camera["targetY"] = JsonValue(static_cast<double>(state.camera.targetY));
    root["camera"] = std::move(camera);

    root["selectedTiles"] = coordsToJson(state.selectedTiles);
    JsonArray selectedGnomes;
    for (EntityID gnome : state.selectedGnomes) {
        selectedGnomes.push_back(id(gnome));
    }
    root["selectedGnomes"] = JsonValue(std::move(selectedGnomes));

    return root;
}

bool WorldSerializer::fromJson(const JsonValue& json, WorldState& out, std::string& error,
                               int gnomeMaxHealth) {
    WorldState loaded;
    try {
        parseWorld(json, loaded, gnomeMaxHealth);
    } catch (const FormatError& e) {
        error = e.what();
        WORLD_ERROR("Cannot load world: " + error);
        return false;
    }

    out = std::move(loaded);
    WORLD_DEBUG("Loaded world at tick " + std::to_string(out.tick) + " with " +
                std::to_string(out.gnomes.size()) + " gnomes");
    return true;
}

} // namespace Delve

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/SimConfig.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <fstream>
#include <set>

namespace Delve {

namespace {

// Known keys per category, used to warn about typos in settings files
const std::set<std::string>& knownKeys(const std::string& category) {
    static const std::set<std::string> timing{"ticks_per_second", "max_ticks_per_frame",
                                              "speed_multipliers"};
    static const std::set<std::string> tasks{"assignment_interval", "max_pathfind_attempts"};
    static const std::set<std::string> pathfinding{"cache_size", "cache_ttl_ticks",
                                                   "max_iterations"};
    static const std::set<std::string> physics{"gravity", "terminal_velocity", "gnome_speed",
                                               "gnome_idle_speed", "gnome_climb_speed",
                                               "inventory_capacity",
                                               "climb_slip_chance", "bounds_margin"};
    static const std::set<std::string> idle{"interval", "stroll_min_radius", "stroll_max_radius",
                                            "stroll_destination_attempts", "stroll_timeout_ticks",
                                            "socialize_max_distance", "weights", "rest_min_ticks",
                                            "rest_max_ticks", "socialize_min_ticks",
                                            "socialize_max_ticks"};
    static const std::set<std::string> camera{"min_zoom", "max_zoom", "lerp_speed"};
    static const std::set<std::string> health{"max", "recovery_per_tick",
                                              "fall_damage_threshold", "fall_damage_per_tile"};
    static const std::set<std::string> logistics{"batch_deposits"};
    static const std::set<std::string> none{};

    if (category == "timing") return timing;
    if (category == "tasks") return tasks;
    if (category == "pathfinding") return pathfinding;
    if (category == "physics") return physics;
    if (category == "idle") return idle;
    if (category == "camera") return camera;
    if (category == "health") return health;
    if (category == "logistics") return logistics;
    return none;
}

template<typename T>
void readNumber(const JsonValue& category, const char* key, T& out) {
    if (auto value = category[key].tryAsNumber()) {
        out = static_cast<T>(*value);
    }
}

} // namespace

bool SimConfig::isAllowedSpeed(int multiplier) const {
    return std::find(speedMultipliers.begin(), speedMultipliers.end(), multiplier) !=
           speedMultipliers.end();
}

bool SimConfig::validate(std::string& error) const {
    if (ticksPerSecond <= 0) {
        error = "ticks_per_second must be positive";
        return false;
    }
    if (maxTicksPerFrame <= 0) {
        error = "max_ticks_per_frame must be positive";
        return false;
    }
    if (speedMultipliers.empty() ||
        std::any_of(speedMultipliers.begin(), speedMultipliers.end(),
                    [](int m) { return m <= 0; })) {
        error = "speed_multipliers must be a non-empty list of positive values";
        return false;
    }
    if (taskAssignmentInterval == 0 || idleBehaviorInterval == 0) {
        error = "throttle intervals must be positive";
        return false;
    }
    if (maxPathfindAttemptsPerGnome <= 0 || pathMaxIterations <= 0 || pathCacheSize == 0) {
        error = "pathfinding limits must be positive";
        return false;
    }
    if (strollWeight < 0 || socializeWeight < 0 || restWeight < 0 ||
        strollWeight + socializeWeight + restWeight != 100) {
        error = "idle weights must be non-negative and sum to 100";
        return false;
    }
    if (restMinTicks > restMaxTicks || socializeMinTicks > socializeMaxTicks) {
        error = "idle duration ranges must have min <= max";
        return false;
    }
    if (strollMinRadius < 0 || strollMinRadius > strollMaxRadius) {
        error = "stroll radii must satisfy 0 <= min <= max";
        return false;
    }
    if (gravity <= 0.0f || terminalVelocity <= 0.0f || gnomeSpeed <= 0.0f || gnomeIdleSpeed <= 0.0f ||
        gnomeClimbSpeed <= 0.0f) {
        error = "movement rates must be positive";
        return false;
    }
    // Landing checks one tile per tick
    if (terminalVelocity >= 1.0f) {
        error = "terminal_velocity must be below one tile per tick";
        return false;
    }
    if (inventoryCapacity == 0) {
        error = "inventory_capacity must be positive";
        return false;
    }
    if (minZoom <= 0.0f || minZoom > maxZoom) {
        error = "zoom range must satisfy 0 < min <= max";
        return false;
    }
    if (gnomeMaxHealth <= 0 || healthRecoveryPerTick <= 0 || fallDamageThreshold <= 0) {
        error = "health values must be positive";
        return false;
    }
    return true;
}

bool SimConfig::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        SETTINGS_ERROR("Failed to load settings from file: " + filepath + " - " + reader.getLastError());
        return false;
    }

    if (!loadFromJson(reader.getRoot())) {
        SETTINGS_ERROR("Rejected settings file: " + filepath);
        return false;
    }

    SETTINGS_INFO("Loaded settings from file: " + filepath);
    return true;
}

bool SimConfig::loadFromJson(const JsonValue& root) {
    if (!root.isObject()) {
        SETTINGS_ERROR("Settings root is not a JSON object");
        return false;
    }

    for (const auto& [categoryName, categoryValue] : root.asObject()) {
        if (!categoryValue.isObject()) {
            SETTINGS_WARNING("Category '" + categoryName + "' is not an object, skipping");
            continue;
        }
        const auto& keys = knownKeys(categoryName);
        if (keys.empty()) {
            SETTINGS_WARNING("Unknown settings category '" + categoryName + "', skipping");
            continue;
        }
        for (const auto& [key, value] : categoryValue.asObject()) {
            (void)value;
            if (!keys.contains(key)) {
                SETTINGS_WARNING("Unknown setting '" + categoryName + "." + key + "', ignoring");
            }
        }
    }

    // Work on a copy so a rejected file leaves this config untouched
    SimConfig next = *this;

    const JsonValue& timing = root["timing"];
    readNumber(timing, "ticks_per_second", next.ticksPerSecond);
    readNumber(timing, "max_ticks_per_frame", next.maxTicksPerFrame);
    if (const JsonArray* speeds = timing["speed_multipliers"].tryAsArray()) {
        next.speedMultipliers.clear();
        for (const auto& speed : *speeds) {
            if (auto value = speed.tryAsInt()) {
                next.speedMultipliers.push_back(*value);
            }
        }
    }

    const JsonValue& tasks = root["tasks"];
    readNumber(tasks, "assignment_interval", next.taskAssignmentInterval);
    readNumber(tasks, "max_pathfind_attempts", next.maxPathfindAttemptsPerGnome);

    const JsonValue& pathfinding = root["pathfinding"];
    readNumber(pathfinding, "cache_size", next.pathCacheSize);
    readNumber(pathfinding, "cache_ttl_ticks", next.pathCacheTtlTicks);
    readNumber(pathfinding, "max_iterations", next.pathMaxIterations);

    const JsonValue& physics = root["physics"];
    readNumber(physics, "gravity", next.gravity);
    readNumber(physics, "terminal_velocity", next.terminalVelocity);
    readNumber(physics, "gnome_speed", next.gnomeSpeed);
    readNumber(physics, "gnome_idle_speed", next.gnomeIdleSpeed);
    readNumber(physics, "gnome_climb_speed", next.gnomeClimbSpeed);
    readNumber(physics, "inventory_capacity", next.inventoryCapacity);
    readNumber(physics, "climb_slip_chance", next.climbSlipChance);
    readNumber(physics, "bounds_margin", next.boundsMargin);

    const JsonValue& logistics = root["logistics"];
    if (auto batch = logistics["batch_deposits"].tryAsBool()) {
        next.batchDeposits = *batch;
    }

    const JsonValue& idle = root["idle"];
    readNumber(idle, "interval", next.idleBehaviorInterval);
    readNumber(idle, "stroll_min_radius", next.strollMinRadius);
    readNumber(idle, "stroll_max_radius", next.strollMaxRadius);
    readNumber(idle, "stroll_destination_attempts", next.strollDestinationAttempts);
    readNumber(idle, "stroll_timeout_ticks", next.strollTimeoutTicks);
    readNumber(idle, "socialize_max_distance", next.socializeMaxDistance);
    readNumber(idle, "rest_min_ticks", next.restMinTicks);
    readNumber(idle, "rest_max_ticks", next.restMaxTicks);
    readNumber(idle, "socialize_min_ticks", next.socializeMinTicks);
    readNumber(idle, "socialize_max_ticks", next.socializeMaxTicks);
    const JsonValue& weights = idle["weights"];
    readNumber(weights, "stroll", next.strollWeight);
    readNumber(weights, "socialize", next.socializeWeight);
    readNumber(weights, "rest", next.restWeight);

    const JsonValue& camera = root["camera"];
    readNumber(camera, "min_zoom", next.minZoom);
    readNumber(camera, "max_zoom", next.maxZoom);
    readNumber(camera, "lerp_speed", next.cameraLerpSpeed);

    const JsonValue& health = root["health"];
    readNumber(health, "max", next.gnomeMaxHealth);
    readNumber(health, "recovery_per_tick", next.healthRecoveryPerTick);
    readNumber(health, "fall_damage_threshold", next.fallDamageThreshold);
    readNumber(health, "fall_damage_per_tile", next.fallDamagePerTile);

    std::string error;
    if (!next.validate(error)) {
        SETTINGS_ERROR("Invalid settings: " + error);
        return false;
    }

    *this = next;
    return true;
}

JsonValue SimConfig::toJson() const {
    JsonValue root{JsonObject{}};

    JsonArray speeds;
    for (int speed : speedMultipliers) {
        speeds.emplace_back(speed);
    }
    root["timing"]["ticks_per_second"] = JsonValue(ticksPerSecond);
    root["timing"]["max_ticks_per_frame"] = JsonValue(maxTicksPerFrame);
    root["timing"]["speed_multipliers"] = JsonValue(std::move(speeds));

    root["tasks"]["assignment_interval"] = JsonValue(static_cast<uint64_t>(taskAssignmentInterval));
    root["tasks"]["max_pathfind_attempts"] = JsonValue(maxPathfindAttemptsPerGnome);

    root["pathfinding"]["cache_size"] = JsonValue(static_cast<uint64_t>(pathCacheSize));
    root["pathfinding"]["cache_ttl_ticks"] = JsonValue(pathCacheTtlTicks);
    root["pathfinding"]["max_iterations"] = JsonValue(pathMaxIterations);

    root["physics"]["gravity"] = JsonValue(static_cast<double>(gravity));
    root["physics"]["terminal_velocity"] = JsonValue(static_cast<double>(terminalVelocity));
    root["physics"]["gnome_speed"] = JsonValue(static_cast<double>(gnomeSpeed));
    root["physics"]["gnome_idle_speed"] = JsonValue(static_cast<double>(gnomeIdleSpeed));
    root["physics"]["gnome_climb_speed"] = JsonValue(static_cast<double>(gnomeClimbSpeed));
    root["physics"]["inventory_capacity"] = JsonValue(static_cast<uint64_t>(inventoryCapacity));
    root["physics"]["climb_slip_chance"] = JsonValue(climbSlipChance);
    root["physics"]["bounds_margin"] = JsonValue(boundsMargin);

    root["logistics"]["batch_deposits"] = JsonValue(batchDeposits);

    root["idle"]["interval"] = JsonValue(static_cast<uint64_t>(idleBehaviorInterval));
    root["idle"]["stroll_min_radius"] = JsonValue(strollMinRadius);
    root["idle"]["stroll_max_radius"] = JsonValue(strollMaxRadius);
    root["idle"]["stroll_destination_attempts"] = JsonValue(strollDestinationAttempts);
    root["idle"]["stroll_timeout_ticks"] = JsonValue(strollTimeoutTicks);
    root["idle"]["socialize_max_distance"] = JsonValue(socializeMaxDistance);
    root["idle"]["rest_min_ticks"] = JsonValue(restMinTicks);
    root["idle"]["rest_max_ticks"] = JsonValue(restMaxTicks);
    root["idle"]["socialize_min_ticks"] = JsonValue(socializeMinTicks);
    root["idle"]["socialize_max_ticks"] = JsonValue(socializeMaxTicks);
    root["idle"]["weights"]["stroll"] = JsonValue(strollWeight);
    root["idle"]["weights"]["socialize"] = JsonValue(socializeWeight);
    root["idle"]["weights"]["rest"] = JsonValue(restWeight);

    root["camera"]["min_zoom"] = JsonValue(static_cast<double>(minZoom));
    root["camera"]["max_zoom"] = JsonValue(static_cast<double>(maxZoom));
    root["camera"]["lerp_speed"] = JsonValue(static_cast<double>(cameraLerpSpeed));

    root["health"]["max"] = JsonValue(gnomeMaxHealth);
    root["health"]["recovery_per_tick"] = JsonValue(healthRecoveryPerTick);
    root["health"]["fall_damage_threshold"] = JsonValue(fallDamageThreshold);
    root["health"]["fall_damage_per_tile"] = JsonValue(fallDamagePerTile);

    return root;
}

bool SimConfig::saveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        SETTINGS_ERROR("Failed to open settings file for writing: " + filepath);
        return false;
    }

    file << toJson().toPrettyString() << '\n';
    if (!file.good()) {
        SETTINGS_ERROR("Failed to write settings file: " + filepath);
        return false;
    }

    SETTINGS_INFO("Saved settings to file: " + filepath);
    return true;
}

} // namespace Delve

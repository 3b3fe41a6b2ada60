/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SIM_CONFIG_HPP
#define SIM_CONFIG_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace Delve {

class JsonValue;

/**
 * @brief Every recognized simulation tunable, with its default
 *
 * Loaded from a JSON file organised by category:
 *
 *   {
 *     "timing":      { "ticks_per_second": 60, "max_ticks_per_frame": 4,
 *                      "speed_multipliers": [1, 2, 3] },
 *     "tasks":       { "assignment_interval": 10, "max_pathfind_attempts": 10 },
 *     "pathfinding": { "cache_size": 1000, "cache_ttl_ticks": 300, "max_iterations": 1000 },
 *     "physics":     { "gravity": 0.02, "terminal_velocity": 0.5, ... },
 *     "idle":        { "interval": 10, "weights": {"stroll": 50, ...}, ... },
 *     "camera":      { "min_zoom": 0.25, "max_zoom": 4.0, "lerp_speed": 0.1 },
 *     "health":      { "max": 100, "recovery_per_tick": 1, ... }
 *   }
 *
 * Missing keys keep their defaults. A file that fails validate() is
 * rejected as a whole.
 */
struct SimConfig {
    // Timing
    int ticksPerSecond{60};
    int maxTicksPerFrame{4};
    std::vector<int> speedMultipliers{1, 2, 3};

    // Task assignment
    uint32_t taskAssignmentInterval{10};
    int maxPathfindAttemptsPerGnome{10};

    // Pathfinding
    size_t pathCacheSize{1000};
    uint64_t pathCacheTtlTicks{300};
    int pathMaxIterations{1000};

    // Physics
    float gravity{0.02f};
    float terminalVelocity{0.5f};
    float gnomeSpeed{0.1f};
    float gnomeIdleSpeed{0.03f};
    float gnomeClimbSpeed{0.03f};
    size_t inventoryCapacity{5};
    double climbSlipChance{0.001};
    int boundsMargin{10};

    // Logistics: carriers wait for a full load while collect work remains
    bool batchDeposits{false};

    // Idle behavior
    uint32_t idleBehaviorInterval{10};
    int strollMinRadius{3};
    int strollMaxRadius{10};
    int strollDestinationAttempts{10};
    uint64_t strollTimeoutTicks{3600};
    int socializeMaxDistance{5};
    int strollWeight{50};
    int socializeWeight{35};
    int restWeight{15};
    uint64_t restMinTicks{180};
    uint64_t restMaxTicks{480};
    uint64_t socializeMinTicks{300};
    uint64_t socializeMaxTicks{900};

    // Camera
    float minZoom{0.25f};
    float maxZoom{4.0f};
    float cameraLerpSpeed{0.1f};

    // Health
    int gnomeMaxHealth{100};
    int healthRecoveryPerTick{1};
    int fallDamageThreshold{3};
    int fallDamagePerTile{10};

    double msPerTick() const { return 1000.0 / static_cast<double>(ticksPerSecond); }

    bool isAllowedSpeed(int multiplier) const;

    /**
     * @brief Checks cross-field constraints
     * @param error Receives a description of the first violation
     * @return true if the configuration is usable
     */
    bool validate(std::string& error) const;

    /**
     * @brief Loads tunables from a JSON file
     * @param filepath Path to the JSON settings file
     * @return true on success; on failure this config is left unchanged
     */
    bool loadFromFile(const std::string& filepath);

    /**
     * @brief Applies tunables from an already parsed JSON document
     * @return true on success; on failure this config is left unchanged
     */
    bool loadFromJson(const JsonValue& root);

    /**
     * @brief Writes the current tunables in the same category layout
     */
    bool saveToFile(const std::string& filepath) const;

    JsonValue toJson() const;

    bool operator==(const SimConfig&) const = default;
};

} // namespace Delve

#endif // SIM_CONFIG_HPP

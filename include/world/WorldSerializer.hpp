/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef WORLD_SERIALIZER_HPP
#define WORLD_SERIALIZER_HPP

#include "utils/JsonReader.hpp"
#include "world/WorldState.hpp"
#include <string>

namespace Delve {

/**
 * @brief Converts a WorldState to and from plain JSON
 *
 * Layout:
 *   - scalars (seed, tick, speed, dimensions, ...) as top-level numbers
 *   - "tileGrid" as a flat row-major array of tile ids
 *   - each component map as an array of records, each carrying its "id"
 *   - storage contents as [type, count] pairs
 *   - optional fields are omitted when empty
 *
 * Loading is forgiving about fields that older saves did not have and
 * fills them with safe defaults. Only input that cannot describe a world at
 * all (no dimensions, a tile grid of the wrong size) is rejected.
 */
class WorldSerializer {
public:
    static JsonValue toJson(const WorldState& state);

    /**
     * @brief Rebuilds a world from JSON
     * @param json Document produced by toJson(), possibly from an older version
     * @param out Receives the world; untouched on failure
     * @param error Receives the reason on failure
     * @param gnomeMaxHealth Health given to gnomes saved without one
     * @return true on success
     */
    static bool fromJson(const JsonValue& json, WorldState& out, std::string& error,
                         int gnomeMaxHealth = 100);
};

} // namespace Delve

#endif // WORLD_SERIALIZER_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef PATH_CACHE_HPP
#define PATH_CACHE_HPP

#include <vector>
#include <unordered_map>
#include <queue>
#include <optional>
#include <cstdint>

#include "world/Components.hpp"

namespace Delve {
namespace AIInternal {

/**
 * Cached route between two tiles, stamped with the tick and the terrain
 * revision it was computed at. A negative entry records that no route
 * existed.
 */
struct CachedPath {
    TileCoord start;
    TileCoord goal;
    std::vector<TileCoord> waypoints;
    uint64_t creationTick{0};
    uint64_t terrainRevision{0};
    uint32_t useCount{0};
    bool isValid{false};

    CachedPath() = default;

    CachedPath(const TileCoord& s, const TileCoord& g, const std::vector<TileCoord>& path,
               uint64_t tick, uint64_t revision)
        : start(s), goal(g), waypoints(path), creationTick(tick),
          terrainRevision(revision), useCount(1), isValid(true) {}
};

/**
 * Statistics for monitoring PathCache hit rate.
 */
struct PathCacheStats {
    size_t totalPaths = 0;
    size_t totalQueries = 0;
    size_t totalHits = 0;
    size_t totalMisses = 0;
    size_t evictedPaths = 0;
    size_t expiredPaths = 0;
    float hitRate = 0.0f;

    void updateHitRate() {
        hitRate = (totalQueries > 0) ? (static_cast<float>(totalHits) / static_cast<float>(totalQueries)) : 0.0f;
    }
};

/**
 * Outcome of a cache lookup.
 */
enum class CacheLookup { MISS, HIT, NEGATIVE_HIT };

/**
 * PathCache - bounded, tick-limited cache of pathfinding results.
 *
 * Entries are keyed by the exact (start, goal) tile pair. An entry is only
 * served while it is younger than the TTL and its terrain revision matches
 * the current one, so a hit always equals what a fresh search would return.
 * When full, the oldest inserted entry is evicted. The eviction queue is
 * compacted once it holds more than twice the capacity, so re-stores and
 * expiries never grow it without bound.
 *
 * Simulation time only: no wall clock is consulted, so replays hit and miss
 * identically.
 */
class PathCache {
public:
    PathCache(size_t capacity, uint64_t ttlTicks);

    /**
     * Looks up a route.
     *
     * @param start Requested start tile
     * @param goal Requested goal tile
     * @param currentTick Tick of the request, used for TTL checks
     * @param terrainRevision Current terrain revision
     * @param outPath Receives the route on HIT
     * @return HIT, NEGATIVE_HIT (known unreachable) or MISS
     */
    CacheLookup lookup(const TileCoord& start, const TileCoord& goal,
                       uint64_t currentTick, uint64_t terrainRevision,
                       std::vector<TileCoord>& outPath);

    void cachePath(const TileCoord& start, const TileCoord& goal,
                   const std::vector<TileCoord>& path,
                   uint64_t currentTick, uint64_t terrainRevision);

    /**
     * Records that no route exists between start and goal.
     */
    void cacheNegative(const TileCoord& start, const TileCoord& goal,
                       uint64_t currentTick, uint64_t terrainRevision);

    /**
     * Drops every entry past its TTL or computed on older terrain.
     */
    void cleanup(uint64_t currentTick, uint64_t terrainRevision);

    PathCacheStats getStats() const;

    void clear();

    size_t size() const { return m_cachedPaths.size(); }
    size_t capacity() const { return m_capacity; }
    uint64_t ttlTicks() const { return m_ttlTicks; }
    // Eviction queue length, live entries plus not yet compacted stale ones
    size_t queuedEntries() const { return m_lruQueue.size(); }

private:
    std::unordered_map<uint64_t, CachedPath> m_cachedPaths;
    std::queue<std::pair<uint64_t, uint64_t>> m_lruQueue; // key, creation tick

    size_t m_capacity;
    uint64_t m_ttlTicks;

    size_t m_totalQueries{0};
    size_t m_totalHits{0};
    size_t m_totalMisses{0};
    size_t m_evictedPaths{0};
    size_t m_expiredPaths{0};

    uint64_t hashPath(const TileCoord& start, const TileCoord& goal) const;

    bool isFresh(const CachedPath& cached, uint64_t currentTick, uint64_t terrainRevision) const;

    void store(uint64_t key, CachedPath&& entry);

    void evictOldest();

    // Rebuilds the eviction queue from the live entries, oldest first
    void compactQueue();

    PathCache(const PathCache&) = delete;
    PathCache& operator=(const PathCache&) = delete;
};

} // namespace AIInternal
} // namespace Delve

#endif // PATH_CACHE_HPP

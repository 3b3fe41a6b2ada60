/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "PathCache.hpp"

#include <algorithm>
#include <vector>

#include "core/Logger.hpp"

namespace Delve {
namespace AIInternal {

PathCache::PathCache(size_t capacity, uint64_t ttlTicks)
    : m_capacity(std::max<size_t>(1, capacity)), m_ttlTicks(ttlTicks)
{
    m_cachedPaths.reserve(m_capacity);
}

CacheLookup PathCache::lookup(const TileCoord& start, const TileCoord& goal,
                              uint64_t currentTick, uint64_t terrainRevision,
                              std::vector<TileCoord>& outPath)
{
    ++m_totalQueries;

    uint64_t key = hashPath(start, goal);
    auto it = m_cachedPaths.find(key);
    if (it == m_cachedPaths.end() || it->second.start != start || it->second.goal != goal) {
        ++m_totalMisses;
        return CacheLookup::MISS;
    }

    CachedPath& cached = it->second;
    if (!isFresh(cached, currentTick, terrainRevision)) {
        // Never serve a stale entry
        m_cachedPaths.erase(it);
        ++m_expiredPaths;
        ++m_totalMisses;
        return CacheLookup::MISS;
    }

    cached.useCount++;
    ++m_totalHits;

    if (!cached.isValid) {
        return CacheLookup::NEGATIVE_HIT;
    }
    outPath = cached.waypoints;
    return CacheLookup::HIT;
}

void PathCache::cachePath(const TileCoord& start, const TileCoord& goal,
                          const std::vector<TileCoord>& path,
                          uint64_t currentTick, uint64_t terrainRevision)
{
    store(hashPath(start, goal), CachedPath(start, goal, path, currentTick, terrainRevision));
}

void PathCache::cacheNegative(const TileCoord& start, const TileCoord& goal,
                              uint64_t currentTick, uint64_t terrainRevision)
{
    CachedPath neg;
    neg.start = start;
    neg.goal = goal;
    neg.creationTick = currentTick;
    neg.terrainRevision = terrainRevision;
    neg.useCount = 1;
    neg.isValid = false; // marks as negative result

    store(hashPath(start, goal), std::move(neg));
}

void PathCache::cleanup(uint64_t currentTick, uint64_t terrainRevision)
{
    std::vector<uint64_t> pathsToRemove;
    for (const auto& [pathKey, cachedPath] : m_cachedPaths) {
        if (!isFresh(cachedPath, currentTick, terrainRevision)) {
            pathsToRemove.push_back(pathKey);
        }
    }

    for (uint64_t pathKey : pathsToRemove) {
        m_cachedPaths.erase(pathKey);
        ++m_expiredPaths;
    }

    compactQueue();
}

void PathCache::compactQueue()
{
    std::vector<std::pair<uint64_t, uint64_t>> ordered;
    ordered.reserve(m_cachedPaths.size());
    for (const auto& [pathKey, cachedPath] : m_cachedPaths) {
        ordered.emplace_back(pathKey, cachedPath.creationTick);
    }
    std::sort(ordered.begin(), ordered.end(),
              [](const auto& a, const auto& b) {
                  return a.second != b.second ? a.second < b.second : a.first < b.first;
              });
    std::queue<std::pair<uint64_t, uint64_t>> rebuilt;
    for (const auto& entry : ordered) {
        rebuilt.push(entry);
    }
    m_lruQueue.swap(rebuilt);
}

PathCacheStats PathCache::getStats() const
{
    PathCacheStats stats;
    stats.totalPaths = m_cachedPaths.size();
    stats.totalQueries = m_totalQueries;
    stats.totalHits = m_totalHits;
    stats.totalMisses = m_totalMisses;
    stats.evictedPaths = m_evictedPaths;
    stats.expiredPaths = m_expiredPaths;
    stats.updateHitRate();
    return stats;
}

void PathCache::clear()
{
    m_cachedPaths.clear();

    std::queue<std::pair<uint64_t, uint64_t>> emptyQueue;
    m_lruQueue.swap(emptyQueue);

    m_totalQueries = 0;
    m_totalHits = 0;
    m_totalMisses = 0;
    m_evictedPaths = 0;
    m_expiredPaths = 0;

    PATHFIND_DEBUG("PathCache: Cleared all cached paths and reset statistics");
}

uint64_t PathCache::hashPath(const TileCoord& start, const TileCoord& goal) const
{
    // FNV-1a over the four coordinates; collisions are caught by comparing the stored pair
    uint64_t hash = 14695981039346656037ULL;
    hash ^= static_cast<uint32_t>(start.x); hash *= 1099511628211ULL;
    hash ^= static_cast<uint32_t>(start.y); hash *= 1099511628211ULL;
    hash ^= static_cast<uint32_t>(goal.x); hash *= 1099511628211ULL;
    hash ^= static_cast<uint32_t>(goal.y); hash *= 1099511628211ULL;
    return hash;
}

bool PathCache::isFresh(const CachedPath& cached, uint64_t currentTick, uint64_t terrainRevision) const
{
    if (cached.terrainRevision != terrainRevision) {
        return false;
    }
    // A state loaded from an earlier save can present an older tick
    if (currentTick < cached.creationTick) {
        return false;
    }
    return currentTick - cached.creationTick < m_ttlTicks;
}

void PathCache::store(uint64_t key, CachedPath&& entry)
{
    auto existing = m_cachedPaths.find(key);
    if (existing == m_cachedPaths.end() && m_cachedPaths.size() >= m_capacity) {
        evictOldest();
    }

    const uint64_t tick = entry.creationTick;
    m_cachedPaths[key] = std::move(entry);
    m_lruQueue.emplace(key, tick);

    if (m_lruQueue.size() > 2 * m_capacity) {
        compactQueue();
    }
}

void PathCache::evictOldest()
{
    while (m_cachedPaths.size() >= m_capacity && !m_lruQueue.empty()) {
        auto [oldestKey, tick] = m_lruQueue.front();
        m_lruQueue.pop();

        // Skip queue entries superseded by a later insert under the same key
        auto it = m_cachedPaths.find(oldestKey);
        if (it != m_cachedPaths.end() && it->second.creationTick == tick) {
            m_cachedPaths.erase(it);
            ++m_evictedPaths;
        }
    }
}

} // namespace AIInternal
} // namespace Delve

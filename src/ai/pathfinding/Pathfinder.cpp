/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/pathfinding/Pathfinder.hpp"
#include "../internal/PathCache.hpp"
#include "core/Logger.hpp"
#include "core/SimConfig.hpp"
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace Delve {

namespace {

constexpr float COST_WALK = 1.0f;
constexpr float COST_FALL = 1.0f;
constexpr float COST_CLIMB = 5.0f;

} // namespace

float defaultTraversalCost(const WorldState& state, const TileCoord& from, const TileCoord& to) {
    if (!state.isPassable(to.x, to.y)) {
        return IMPASSABLE_COST;
    }

    const int dx = to.x - from.x;
    const int dy = to.y - from.y;
    if (std::abs(dx) + std::abs(dy) != 1) {
        return IMPASSABLE_COST;
    }

    const bool grip = state.hasGrip(from.x, from.y) || state.hasGrip(to.x, to.y);

    if (dy > 0) {
        // Dropping is always possible; with a wall to hold it is a controlled climb
        return grip ? COST_CLIMB : COST_FALL;
    }
    if (dy < 0) {
        return grip ? COST_CLIMB : IMPASSABLE_COST;
    }
    if (state.canHoldAt(from.x, from.y) || state.canHoldAt(to.x, to.y)) {
        return COST_WALK;
    }
    return IMPASSABLE_COST;
}

Pathfinder::Pathfinder(const SimConfig& config)
    : Pathfinder(config.pathMaxIterations, config.pathCacheSize, config.pathCacheTtlTicks) {}

Pathfinder::Pathfinder(int maxIterations, size_t cacheCapacity, uint64_t cacheTtlTicks)
    : m_cost(defaultTraversalCost),
      m_maxIterations(maxIterations),
      m_cache(std::make_unique<AIInternal::PathCache>(cacheCapacity, cacheTtlTicks)) {
    if (m_maxIterations <= 0) {
        throw std::invalid_argument("Pathfinder iteration cap must be positive: " +
                                    std::to_string(maxIterations));
    }
}

Pathfinder::~Pathfinder() = default;

void Pathfinder::setTraversalCost(TraversalCost cost) {
    m_cost = cost ? std::move(cost) : TraversalCost(defaultTraversalCost);
    // Cached routes were computed with the old cost
    m_cache->clear();
}

void Pathfinder::clearCache() {
    m_cache->clear();
}

size_t Pathfinder::cacheSize() const {
    return m_cache->size();
}

std::optional<TileCoord> Pathfinder::resolveGoal(const WorldState& state, const TileCoord& goal) const {
    if (!state.inBounds(goal.x, goal.y)) {
        return std::nullopt;
    }
    if (!state.isSolid(goal.x, goal.y)) {
        return goal;
    }

    static constexpr int OFFSETS[8][2] = {
        {-1, 0}, {1, 0}, {0, -1}, {0, 1},
        {-1, -1}, {1, -1}, {-1, 1}, {1, 1}
    };
    for (const auto& offset : OFFSETS) {
        const int nx = goal.x + offset[0];
        const int ny = goal.y + offset[1];
        if (state.canHoldAt(nx, ny)) {
            return TileCoord{nx, ny};
        }
    }
    return std::nullopt;
}

PathfindingResult Pathfinder::findPath(const WorldState& state, const TileCoord& start,
                                       const TileCoord& goal, std::vector<TileCoord>& outPath) {
    outPath.clear();

    if (state.terrainRevision != m_lastSeenRevision) {
        m_cache->cleanup(state.tick, state.terrainRevision);
        m_lastSeenRevision = state.terrainRevision;
    }

    switch (m_cache->lookup(start, goal, state.tick, state.terrainRevision, outPath)) {
        case AIInternal::CacheLookup::HIT:
            m_stats.totalRequests++;
            m_stats.cacheHits++;
            m_stats.successfulPaths++;
            return PathfindingResult::SUCCESS;
        case AIInternal::CacheLookup::NEGATIVE_HIT:
            m_stats.totalRequests++;
            m_stats.cacheHits++;
            return PathfindingResult::NO_PATH_FOUND;
        case AIInternal::CacheLookup::MISS:
            break;
    }

    PathfindingResult result = findPathUncached(state, start, goal, outPath);
    if (result == PathfindingResult::SUCCESS) {
        m_cache->cachePath(start, goal, outPath, state.tick, state.terrainRevision);
    } else {
        m_cache->cacheNegative(start, goal, state.tick, state.terrainRevision);
    }
    return result;
}

std::optional<size_t> Pathfinder::routeLength(const WorldState& state, const TileCoord& start,
                                              const TileCoord& goal) {
    std::vector<TileCoord> path;
    if (findPath(state, start, goal, path) != PathfindingResult::SUCCESS) {
        return std::nullopt;
    }
    return path.size();
}

PathfindingResult Pathfinder::findPathUncached(const WorldState& state, const TileCoord& start,
                                               const TileCoord& goal, std::vector<TileCoord>& outPath) {
    outPath.clear();
    m_stats.totalRequests++;

    if (!state.isPassable(start.x, start.y)) {
        PATHFIND_DEBUG("findPath: INVALID_START - tile (" + std::to_string(start.x) + "," +
                       std::to_string(start.y) + ") is not passable");
        m_stats.invalidStarts++;
        return PathfindingResult::INVALID_START;
    }

    std::optional<TileCoord> resolved = resolveGoal(state, goal);
    if (!resolved) {
        m_stats.invalidGoals++;
        return PathfindingResult::INVALID_GOAL;
    }
    const int gx = resolved->x;
    const int gy = resolved->y;

    if (start.x == gx && start.y == gy) {
        m_stats.successfulPaths++;
        return PathfindingResult::SUCCESS;
    }

    const int W = state.worldWidth;
    const int H = state.worldHeight;
    auto idx = [&](int x, int y) { return y * W + x; };
    auto h = [&](int x, int y) {
        // Manhattan distance at the cheapest step cost is admissible
        return static_cast<float>(std::abs(x - gx) + std::abs(y - gy));
    };

    NodePool& nodePool = m_nodePool;
    nodePool.ensureCapacity(W * H);
    nodePool.reset();

    auto& open = nodePool.openQueue;
    auto& gScore = nodePool.gScoreBuffer;
    auto& parent = nodePool.parentBuffer;
    auto& closed = nodePool.closedBuffer;

    const int sIndex = idx(start.x, start.y);
    gScore[static_cast<size_t>(sIndex)] = 0.0f;
    open.push(NodePool::Node{start.x, start.y, h(start.x, start.y), 0.0f});

    // Fixed neighbour order keeps the chosen route stable between runs
    constexpr int dx4[4] = {1, -1, 0, 0};
    constexpr int dy4[4] = {0, 0, 1, -1};

    int iterations = 0;
    while (!open.empty() && iterations < m_maxIterations) {
        ++iterations;

        NodePool::Node cur = open.top(); open.pop();

        const int cIndex = idx(cur.x, cur.y);
        if (closed[static_cast<size_t>(cIndex)]) continue;
        closed[static_cast<size_t>(cIndex)] = 1;

        if (cur.x == gx && cur.y == gy) {
            // reconstruct, excluding the start tile
            std::vector<TileCoord> rev;
            int cx = cur.x, cy = cur.y;
            while (!(cx == start.x && cy == start.y)) {
                rev.push_back(TileCoord{cx, cy});
                int p = parent[static_cast<size_t>(idx(cx, cy))];
                if (p < 0) break;
                cy = p / W; cx = p % W;
            }
            outPath.assign(rev.rbegin(), rev.rend());

            m_stats.successfulPaths++;
            m_stats.totalIterations += static_cast<uint64_t>(iterations);
            return PathfindingResult::SUCCESS;
        }

        const float gCur = gScore[static_cast<size_t>(cIndex)];
        const TileCoord from{cur.x, cur.y};

        for (int i = 0; i < 4; ++i) {
            const int nx = cur.x + dx4[i];
            const int ny = cur.y + dy4[i];
            if (nx < 0 || nx >= W || ny < 0 || ny >= H) continue;

            const size_t nIndex = static_cast<size_t>(idx(nx, ny));
            if (closed[nIndex]) continue;

            const float step = m_cost(state, from, TileCoord{nx, ny});
            if (!std::isfinite(step)) continue;

            const float tentative = gCur + step;
            if (tentative < gScore[nIndex]) {
                parent[nIndex] = cIndex;
                gScore[nIndex] = tentative;
                open.push(NodePool::Node{nx, ny, tentative + h(nx, ny), tentative});
            }
        }
    }

    m_stats.totalIterations += static_cast<uint64_t>(iterations);
    if (!open.empty()) {
        m_stats.timeouts++;
        PATHFIND_DEBUG("findPath: TIMEOUT after " + std::to_string(iterations) + " iterations");
        return PathfindingResult::TIMEOUT;
    }
    return PathfindingResult::NO_PATH_FOUND;
}

} // namespace Delve

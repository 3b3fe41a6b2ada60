/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATHFINDER_HPP
#define PATHFINDER_HPP

#include <vector>
#include <cstdint>
#include <ostream>
#include <queue>
#include <limits>
#include <algorithm>
#include <memory>
#include <optional>
#include <functional>
#include "world/WorldState.hpp"

namespace Delve {

struct SimConfig;

namespace AIInternal {
class PathCache;
}

enum class PathfindingResult { SUCCESS, NO_PATH_FOUND, INVALID_START, INVALID_GOAL, TIMEOUT };

// Stream operator for PathfindingResult to support test output
inline std::ostream& operator<<(std::ostream& os, const PathfindingResult& result) {
    switch (result) {
        case PathfindingResult::SUCCESS: return os << "SUCCESS";
        case PathfindingResult::NO_PATH_FOUND: return os << "NO_PATH_FOUND";
        case PathfindingResult::INVALID_START: return os << "INVALID_START";
        case PathfindingResult::INVALID_GOAL: return os << "INVALID_GOAL";
        case PathfindingResult::TIMEOUT: return os << "TIMEOUT";
        default: return os << "UNKNOWN";
    }
}

constexpr float IMPASSABLE_COST = std::numeric_limits<float>::infinity();

/**
 * Cost of one orthogonal step between adjacent tiles. Returning
 * IMPASSABLE_COST forbids the move. Must never return less than 1, the
 * search heuristic assumes that as the cheapest step.
 */
using TraversalCost = std::function<float(const WorldState&, const TileCoord& from, const TileCoord& to)>;

/**
 * Default movement rules:
 *  - down into any passable tile (fall 1, climb down with grip 5)
 *  - up into a passable tile when either end has grip (climb 5)
 *  - sideways when either end is holdable (walk 1)
 */
float defaultTraversalCost(const WorldState& state, const TileCoord& from, const TileCoord& to);

/**
 * Pathfinder - grid A* over the world's tiles with a bounded route cache.
 *
 * Routes exclude the start tile and end at the goal, so the route length is
 * simply the number of tiles returned. A solid goal (a dig target) is first
 * replaced by the nearest standing spot next to it.
 *
 * The cache is keyed by the requested (start, goal) pair and stamped with
 * the tick and terrain revision, which keeps cached answers identical to
 * fresh searches. The pathfinder holds no world state of its own.
 */
class Pathfinder {
public:
    explicit Pathfinder(const SimConfig& config);
    Pathfinder(int maxIterations, size_t cacheCapacity, uint64_t cacheTtlTicks);
    ~Pathfinder();

    Pathfinder(const Pathfinder&) = delete;
    Pathfinder& operator=(const Pathfinder&) = delete;

    /**
     * @brief Finds a route, consulting the cache first
     * @param state World to search
     * @param start Tile the walker occupies
     * @param goal Destination tile; solid goals resolve to an adjacent spot
     * @param outPath Receives the route (start excluded) on SUCCESS
     */
    PathfindingResult findPath(const WorldState& state, const TileCoord& start, const TileCoord& goal,
                               std::vector<TileCoord>& outPath);

    /**
     * @brief Same search without touching the cache
     */
    PathfindingResult findPathUncached(const WorldState& state, const TileCoord& start,
                                       const TileCoord& goal, std::vector<TileCoord>& outPath);

    /**
     * @return Tile count of the route, or nullopt when unreachable
     */
    std::optional<size_t> routeLength(const WorldState& state, const TileCoord& start, const TileCoord& goal);

    /**
     * @brief Maps a goal to the tile a walker should end on
     *
     * A passable goal is returned as is. A solid goal resolves to the first
     * holdable neighbour: left, right, above, below, then the diagonals.
     */
    std::optional<TileCoord> resolveGoal(const WorldState& state, const TileCoord& goal) const;

    void setTraversalCost(TraversalCost cost);
    void setMaxIterations(int maxIters) { m_maxIterations = maxIters; }
    int getMaxIterations() const { return m_maxIterations; }

    void clearCache();
    size_t cacheSize() const;

    // Statistics
    struct PathfindingStats {
        uint64_t totalRequests{0};
        uint64_t successfulPaths{0};
        uint64_t cacheHits{0};
        uint64_t timeouts{0};
        uint64_t invalidStarts{0};
        uint64_t invalidGoals{0};
        uint64_t totalIterations{0};
    };

    void resetStats() { m_stats = PathfindingStats{}; }
    const PathfindingStats& getStats() const { return m_stats; }

private:
    TraversalCost m_cost;
    int m_maxIterations;
    std::unique_ptr<AIInternal::PathCache> m_cache;
    uint64_t m_lastSeenRevision{0};
    PathfindingStats m_stats{};

    // Reusable search buffers
    struct NodePool {
        struct Node { int x; int y; float f; float g; };
        struct Cmp {
            bool operator()(const Node& a, const Node& b) const {
                // Lowest f first; among equals prefer deeper nodes, then a fixed tile order
                if (a.f != b.f) return a.f > b.f;
                if (a.g != b.g) return a.g < b.g;
                if (a.y != b.y) return a.y > b.y;
                return a.x > b.x;
            }
        };

        std::priority_queue<Node, std::vector<Node>, Cmp> openQueue;
        std::vector<float> gScoreBuffer;
        std::vector<int> parentBuffer;
        std::vector<uint8_t> closedBuffer;

        void ensureCapacity(int gridSize) {
            if (gScoreBuffer.size() < static_cast<size_t>(gridSize)) {
                gScoreBuffer.resize(gridSize);
                parentBuffer.resize(gridSize);
                closedBuffer.resize(gridSize);
            }
        }

        void reset() {
            while (!openQueue.empty()) openQueue.pop();
            std::fill(gScoreBuffer.begin(), gScoreBuffer.end(), std::numeric_limits<float>::infinity());
            std::fill(parentBuffer.begin(), parentBuffer.end(), -1);
            std::fill(closedBuffer.begin(), closedBuffer.end(), 0);
        }
    };

    NodePool m_nodePool;
};

} // namespace Delve

#endif // PATHFINDER_HPP

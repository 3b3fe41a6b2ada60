/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "systems/TaskAssignmentSystem.hpp"
#include "ai/pathfinding/Pathfinder.hpp"
#include "core/Logger.hpp"
#include "core/SimConfig.hpp"
#include <algorithm>
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace Delve {

namespace {

constexpr std::array<TaskPriority, 4> PRIORITY_ORDER = {
    TaskPriority::URGENT, TaskPriority::HIGH, TaskPriority::NORMAL, TaskPriority::LOW};

} // namespace

bool TaskAssignmentSystem::isAvailable(const Gnome& gnome) {
  if (gnome.currentTaskId || gnome.depositTargetStorage) {
    return false;
  }
  return gnome.state == GnomeState::IDLE ||
         (gnome.state == GnomeState::WALKING && gnome.isStrolling());
}

void TaskAssignmentSystem::update(WorldState& state, SystemContext& ctx) {
  if (!isThrottleTick(state.tick, ctx.config.taskAssignmentInterval)) {
    return;
  }

  bool anyUnassigned = std::any_of(state.tasks.begin(), state.tasks.end(),
                                   [](const auto& entry) { return !entry.second.assignedGnome; });
  if (!anyUnassigned) {
    return;
  }

  boost::container::flat_map<EntityID, Seen> seen;
  int assigned = 0;

  for (auto& [gnomeId, gnome] : state.gnomes) {
    if (!isAvailable(gnome)) {
      continue;
    }
    auto posIt = state.positions.find(gnomeId);
    if (posIt == state.positions.end()) {
      continue;
    }

    std::optional<Choice> choice = chooseTask(state, ctx, gnome, toTile(posIt->second), seen);
    if (choice) {
      assign(state, gnomeId, std::move(*choice));
      ++assigned;
    }
  }

  std::optional<boost::container::flat_set<EntityID>> chained;
  for (const auto& [taskId, outcome] : seen) {
    auto taskIt = state.tasks.find(taskId);
    if (taskIt == state.tasks.end()) {
      continue;
    }
    Task& task = taskIt->second;
    if (outcome == Seen::REACHABLE) {
      task.unreachableCount = 0;
      continue;
    }
    if (task.assignedGnome) {
      continue;
    }

    if (task.type == TaskType::DIG) {
      if (!chained) {
        chained = chainedToActiveDigs(state);
      }
      // Waiting behind a dig in progress, not stranded
      if (chained->count(taskId) > 0) {
        task.unreachableCount = 0;
        continue;
      }
    }
    task.unreachableCount++;
  }

  if (assigned > 0) {
    TASK_DEBUG("Assigned " + std::to_string(assigned) + " task(s) at tick " +
               std::to_string(state.tick));
  }
}

std::optional<TaskAssignmentSystem::Choice> TaskAssignmentSystem::chooseTask(
    WorldState& state, SystemContext& ctx, const Gnome& gnome,
    const TileCoord& from, boost::container::flat_map<EntityID, Seen>& seen) const {
  const bool inventoryFull = gnome.inventory.size() >= ctx.config.inventoryCapacity;
  int attempts = 0;

  for (TaskPriority priority : PRIORITY_ORDER) {
    std::vector<Candidate> candidates;
    for (const auto& [taskId, task] : state.tasks) {
      if (task.assignedGnome || task.priority != priority) {
        continue;
      }
      if (task.type == TaskType::COLLECT && inventoryFull) {
        continue;
      }
      candidates.push_back(Candidate{taskId, manhattan(from, TileCoord{task.targetX, task.targetY}),
                                     task.createdAt});
    }
    if (candidates.empty()) {
      continue;
    }

    std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
      if (a.manhattan != b.manhattan) return a.manhattan < b.manhattan;
      if (a.createdAt != b.createdAt) return a.createdAt < b.createdAt;
      return a.taskId < b.taskId;
    });

    std::optional<Choice> best;
    for (const Candidate& candidate : candidates) {
      if (attempts >= ctx.config.maxPathfindAttemptsPerGnome) {
        break;
      }
      ++attempts;

      const Task& task = state.tasks.at(candidate.taskId);
      std::vector<TileCoord> path;
      const PathfindingResult result =
          ctx.pathfinder.findPath(state, from, TileCoord{task.targetX, task.targetY}, path);

      if (result != PathfindingResult::SUCCESS) {
        seen.try_emplace(candidate.taskId, Seen::UNREACHABLE);
        continue;
      }
      seen[candidate.taskId] = Seen::REACHABLE;

      const bool better = !best || path.size() < best->path.size() ||
                          (path.size() == best->path.size() &&
                           (candidate.createdAt < best->createdAt ||
                            (candidate.createdAt == best->createdAt && candidate.taskId < best->taskId)));
      if (better) {
        best = Choice{candidate.taskId, std::move(path), candidate.createdAt};
      }
    }

    // First bucket with a reachable task wins
    if (best) {
      return best;
    }
    if (attempts >= ctx.config.maxPathfindAttemptsPerGnome) {
      break;
    }
  }
  return std::nullopt;
}

boost::container::flat_set<EntityID> TaskAssignmentSystem::chainedToActiveDigs(const WorldState& state) {
  boost::container::flat_set<EntityID> chained;
  const size_t tileCount = static_cast<size_t>(state.worldWidth) * static_cast<size_t>(state.worldHeight);
  std::vector<EntityID> digAt(tileCount, INVALID_ENTITY);
  std::vector<uint8_t> visited(tileCount, 0);
  std::vector<TileCoord> frontier;

  auto indexOf = [&state](int x, int y) {
    return static_cast<size_t>(y) * static_cast<size_t>(state.worldWidth) + static_cast<size_t>(x);
  };

  for (const auto& [taskId, task] : state.tasks) {
    if (task.type != TaskType::DIG || !state.inBounds(task.targetX, task.targetY)) {
      continue;
    }
    const size_t index = indexOf(task.targetX, task.targetY);
    digAt[index] = taskId;
    if (task.assignedGnome) {
      visited[index] = 1;
      frontier.push_back(TileCoord{task.targetX, task.targetY});
    }
  }

  // Flood out from assigned digs through neighbouring dig targets and open tiles
  constexpr std::array<std::array<int, 2>, 4> NEIGHBOURS = {{{1, 0}, {-1, 0}, {0, 1}, {0, -1}}};
  for (size_t head = 0; head < frontier.size(); ++head) {
    const TileCoord tile = frontier[head];
    for (const auto& [ox, oy] : NEIGHBOURS) {
      const int nx = tile.x + ox;
      const int ny = tile.y + oy;
      if (!state.inBounds(nx, ny)) {
        continue;
      }
      const size_t index = indexOf(nx, ny);
      if (visited[index]) {
        continue;
      }
      if (digAt[index] != INVALID_ENTITY) {
        chained.insert(digAt[index]);
      } else if (!state.isPassable(nx, ny)) {
        continue;
      }
      visited[index] = 1;
      frontier.push_back(TileCoord{nx, ny});
    }
  }
  return chained;
}

void TaskAssignmentSystem::assign(WorldState& state, EntityID gnomeId, Choice&& choice) const {
  Gnome& gnome = state.gnomes.at(gnomeId);
  Task& task = state.tasks.at(choice.taskId);

  state.clearIdleBehavior(gnomeId);

  gnome.currentTaskId = choice.taskId;
  gnome.path = std::move(choice.path);
  gnome.pathIndex = 0;
  if (gnome.path.empty()) {
    gnome.state = task.type == TaskType::DIG ? GnomeState::MINING : GnomeState::COLLECTING;
  } else {
    gnome.state = GnomeState::WALKING;
  }

  task.assignedGnome = gnomeId;
  task.unreachableCount = 0;

  TASK_DEBUG("Gnome " + std::to_string(gnomeId) + " assigned task " + std::to_string(choice.taskId) +
             " (" + std::to_string(gnome.path.size()) + " tiles away)");
}

} // namespace Delve

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "commands/Commands.hpp"
#include "core/Logger.hpp"
#include "core/SimConfig.hpp"
#include "core/Simulation.hpp"
#include "managers/SaveGameManager.hpp"
#include "world/WorldFactory.hpp"
#include <SDL3/SDL.h>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#ifndef DELVE_APP_NAME
#define DELVE_APP_NAME "Delve"
#endif

namespace {

const std::string ORG_NAME{"Hammer Forged Games"};
const std::string SETTINGS_PATH{"res/sim_settings.json"};

constexpr int WORLD_WIDTH{80};
constexpr int WORLD_HEIGHT{50};
constexpr uint32_t WORLD_SEED{20250101};
constexpr int GNOME_COUNT{4};
constexpr long DEFAULT_FRAMES{1800};  // 30s @ 60fps
constexpr double TARGET_FRAME_MS{1000.0 / 60.0};
constexpr long STATUS_INTERVAL{300};

// Queues the demonstration setup: a storage beside the spawn column, a few
// gnomes and a pit to dig out under the centre of the map.
void queueScenario(Delve::Simulation& sim) {
  const Delve::WorldState& state = sim.state();
  const int centreX = state.worldWidth / 2;

  const int storageX = centreX + 4;
  const int surface = state.surfaceY(storageX);
  if (surface > 0) {
    sim.enqueue(Delve::PlaceBuilding{Delve::BuildingType::STORAGE, storageX, surface - 1});
  }

  for (int i = 0; i < GNOME_COUNT; ++i) {
    sim.enqueue(Delve::SpawnGnome{});
  }

  const int pitTop = state.surfaceY(centreX) + 1;
  std::vector<Delve::TileCoord> pit;
  for (int y = pitTop; y < pitTop + 3; ++y) {
    for (int x = centreX - 3; x <= centreX - 1; ++x) {
      pit.push_back(Delve::TileCoord{x, y});
    }
  }
  sim.enqueue(Delve::Dig{pit, Delve::TaskPriority::NORMAL});
  sim.enqueue(Delve::Dig{{Delve::TileCoord{centreX - 2, pitTop + 3}}, Delve::TaskPriority::HIGH});
}

long parseFrameCount(int argc, char* argv[]) {
  if (argc < 2) {
    return DEFAULT_FRAMES;
  }
  char* end = nullptr;
  const long frames = std::strtol(argv[1], &end, 10);
  if (end == argv[1] || *end != '\0' || frames <= 0) {
    SIM_WARN("Ignoring frame count '" + std::string(argv[1]) + "', using " +
             std::to_string(DEFAULT_FRAMES));
    return DEFAULT_FRAMES;
  }
  return frames;
}

} // namespace

int main(int argc, char* argv[]) {
  SIM_INFO("Initializing " + std::string(DELVE_APP_NAME));

  if (!SDL_Init(0)) {
    SIM_CRITICAL("SDL_Init failed: " + std::string(SDL_GetError()));
    return -1;
  }

  // Per-user data directory for logs and saves
  std::string dataDir = "res/";
  if (char* prefPath = SDL_GetPrefPath(ORG_NAME.c_str(), DELVE_APP_NAME)) {
    dataDir = prefPath;
    SDL_free(prefPath);
  } else {
    SIM_WARN("SDL_GetPrefPath failed, writing to res/: " + std::string(SDL_GetError()));
  }
  Delve::Logger::SetLogDirectory(dataDir + "logs");

  Delve::SimConfig config;
  if (std::filesystem::exists(SETTINGS_PATH)) {
    if (!config.loadFromFile(SETTINGS_PATH)) {
      SIM_WARN("Failed to load " + SETTINGS_PATH + " - using defaults");
    }
  } else {
    SIM_INFO("No " + SETTINGS_PATH + " found - using defaults");
  }

  const long frames = parseFrameCount(argc, argv);

  try {
    Delve::Simulation sim(config, Delve::createWorld(
                                      Delve::makeLayeredTerrain(WORLD_WIDTH, WORLD_HEIGHT, WORLD_SEED)));
    queueScenario(sim);

    SIM_INFO("Running " + std::to_string(frames) + " frames");

    Uint64 lastFrameNs = SDL_GetTicksNS();
    for (long frame = 1; frame <= frames; ++frame) {
      const Uint64 frameStartNs = SDL_GetTicksNS();
      const double elapsedMs = static_cast<double>(frameStartNs - lastFrameNs) / 1000000.0;
      lastFrameNs = frameStartNs;

      Delve::RenderFrame view = sim.frame(elapsedMs);

      if (frame % STATUS_INTERVAL == 0) {
        const Delve::WorldState& state = view.state;
        int stored = 0;
        for (const auto& [id, storage] : state.storages) {
          for (const auto& [type, count] : storage.contents) {
            stored += count;
          }
        }
        SIM_INFO("Tick " + std::to_string(state.tick) + ": " + std::to_string(state.tasks.size()) +
                 " tasks, " + std::to_string(state.resources.size()) + " loose resources, " +
                 std::to_string(stored) + " stored");
      }

      // Frame pacing
      const Uint64 frameEndNs = SDL_GetTicksNS();
      const Uint64 targetNs = static_cast<Uint64>(TARGET_FRAME_MS * 1000000.0);
      if (frameEndNs - frameStartNs < targetNs) {
        SDL_DelayPrecise(targetNs - (frameEndNs - frameStartNs));
      }
    }

    if (sim.scheduler().getDroppedTicks() > 0) {
      SIM_WARN("Dropped " + std::to_string(sim.scheduler().getDroppedTicks()) +
               " ticks to stay within the per-frame budget");
    }

    Delve::SaveGameManager& saves = Delve::SaveGameManager::Instance();
    saves.setSaveDirectory(dataDir);
    if (!saves.saveToSlot(1, sim.state())) {
      SIM_ERROR("Could not save world: " + saves.getLastError());
    }
  } catch (const std::invalid_argument& e) {
    SIM_CRITICAL("Simulation setup failed: " + std::string(e.what()));
    SDL_Quit();
    return -1;
  }

  SIM_INFO(std::string(DELVE_APP_NAME) + " shutting down");
  SDL_Quit();
  return 0;
}

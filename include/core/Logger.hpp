/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

// Required includes for logging system:
// - string: Used in macro expansions for std::string() conversions
// - cstdio: Required for printf() and fflush() functions
// - cstdint: Required for uint8_t type
// - mutex: Required for thread-safe logging
// - atomic: Required for std::atomic<bool> benchmark mode flag
#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> benchmark mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for thread-safe logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace Delve {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (even in release)
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Full logging system in debug builds, console only
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;
  static std::mutex s_logMutex;

public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  // Debug builds always log to the console, the directory is ignored
  static void SetLogDirectory(const std::string &) {}

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("Delve Simulation - [%s] %s: %s\n", system, getLevelString(level),
           message);
    fflush(stdout);
  }

private:
  static const char *getLevelString(LogLevel level) {
    switch (level) {
    case LogLevel::CRITICAL:
      return "CRITICAL";
    case LogLevel::ERROR_LEVEL:
      return "ERROR";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG_LEVEL:
      return "DEBUG";
    default:
      return "UNKNOWN";
    }
  }
};

// Debug build macros - full functionality
#define DELVE_CRITICAL(system, msg)                                            \
  Delve::Logger::Log(Delve::LogLevel::CRITICAL, system, msg)
#define DELVE_ERROR(system, msg)                                               \
  Delve::Logger::Log(Delve::LogLevel::ERROR_LEVEL, system, msg)
#define DELVE_WARN(system, msg)                                                \
  Delve::Logger::Log(Delve::LogLevel::WARNING, system, msg)
#define DELVE_INFO(system, msg)                                                \
  Delve::Logger::Log(Delve::LogLevel::INFO, system, msg)
#define DELVE_DEBUG(system, msg)                                               \
  Delve::Logger::Log(Delve::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds - only CRITICAL and ERROR survive, written by Logger.cpp
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;
  static std::mutex s_logMutex;

public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  /**
   * Directory for rotating log files. Must be set before the first
   * message; without it messages go to stderr.
   */
  static void SetLogDirectory(const std::string &directory);

  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define DELVE_CRITICAL(system, msg)                                            \
  Delve::Logger::Log("CRITICAL", system, msg)

#define DELVE_ERROR(system, msg) Delve::Logger::Log("ERROR", system, msg)

#define DELVE_WARN(system, msg) ((void)0)  // Zero overhead
#define DELVE_INFO(system, msg) ((void)0)  // Zero overhead
#define DELVE_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Static member definitions - shared by both DEBUG and RELEASE builds
inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Convenience macros for each simulation system

// Core
#define SIM_CRITICAL(msg) DELVE_CRITICAL("Simulation", msg)
#define SIM_ERROR(msg) DELVE_ERROR("Simulation", msg)
#define SIM_WARN(msg) DELVE_WARN("Simulation", msg)
#define SIM_INFO(msg) DELVE_INFO("Simulation", msg)
#define SIM_DEBUG(msg) DELVE_DEBUG("Simulation", msg)

#define TICK_CRITICAL(msg) DELVE_CRITICAL("TickScheduler", msg)
#define TICK_ERROR(msg) DELVE_ERROR("TickScheduler", msg)
#define TICK_WARN(msg) DELVE_WARN("TickScheduler", msg)
#define TICK_INFO(msg) DELVE_INFO("TickScheduler", msg)
#define TICK_DEBUG(msg) DELVE_DEBUG("TickScheduler", msg)

#define COMMAND_CRITICAL(msg) DELVE_CRITICAL("CommandProcessor", msg)
#define COMMAND_ERROR(msg) DELVE_ERROR("CommandProcessor", msg)
#define COMMAND_WARN(msg) DELVE_WARN("CommandProcessor", msg)
#define COMMAND_INFO(msg) DELVE_INFO("CommandProcessor", msg)
#define COMMAND_DEBUG(msg) DELVE_DEBUG("CommandProcessor", msg)

#define WORLD_CRITICAL(msg) DELVE_CRITICAL("World", msg)
#define WORLD_ERROR(msg) DELVE_ERROR("World", msg)
#define WORLD_WARN(msg) DELVE_WARN("World", msg)
#define WORLD_INFO(msg) DELVE_INFO("World", msg)
#define WORLD_DEBUG(msg) DELVE_DEBUG("World", msg)

// Pathfinding
#define PATHFIND_CRITICAL(msg) DELVE_CRITICAL("Pathfinding", msg)
#define PATHFIND_ERROR(msg) DELVE_ERROR("Pathfinding", msg)
#define PATHFIND_WARN(msg) DELVE_WARN("Pathfinding", msg)
#define PATHFIND_INFO(msg) DELVE_INFO("Pathfinding", msg)
#define PATHFIND_DEBUG(msg) DELVE_DEBUG("Pathfinding", msg)

// Systems
#define TASK_CRITICAL(msg) DELVE_CRITICAL("TaskAssignment", msg)
#define TASK_ERROR(msg) DELVE_ERROR("TaskAssignment", msg)
#define TASK_WARN(msg) DELVE_WARN("TaskAssignment", msg)
#define TASK_INFO(msg) DELVE_INFO("TaskAssignment", msg)
#define TASK_DEBUG(msg) DELVE_DEBUG("TaskAssignment", msg)

#define PHYSICS_CRITICAL(msg) DELVE_CRITICAL("Physics", msg)
#define PHYSICS_ERROR(msg) DELVE_ERROR("Physics", msg)
#define PHYSICS_WARN(msg) DELVE_WARN("Physics", msg)
#define PHYSICS_INFO(msg) DELVE_INFO("Physics", msg)
#define PHYSICS_DEBUG(msg) DELVE_DEBUG("Physics", msg)

#define LOGISTICS_CRITICAL(msg) DELVE_CRITICAL("Logistics", msg)
#define LOGISTICS_ERROR(msg) DELVE_ERROR("Logistics", msg)
#define LOGISTICS_WARN(msg) DELVE_WARN("Logistics", msg)
#define LOGISTICS_INFO(msg) DELVE_INFO("Logistics", msg)
#define LOGISTICS_DEBUG(msg) DELVE_DEBUG("Logistics", msg)

#define IDLE_CRITICAL(msg) DELVE_CRITICAL("IdleBehavior", msg)
#define IDLE_ERROR(msg) DELVE_ERROR("IdleBehavior", msg)
#define IDLE_WARN(msg) DELVE_WARN("IdleBehavior", msg)
#define IDLE_INFO(msg) DELVE_INFO("IdleBehavior", msg)
#define IDLE_DEBUG(msg) DELVE_DEBUG("IdleBehavior", msg)

#define HEALTH_CRITICAL(msg) DELVE_CRITICAL("Health", msg)
#define HEALTH_ERROR(msg) DELVE_ERROR("Health", msg)
#define HEALTH_WARN(msg) DELVE_WARN("Health", msg)
#define HEALTH_INFO(msg) DELVE_INFO("Health", msg)
#define HEALTH_DEBUG(msg) DELVE_DEBUG("Health", msg)

// Persistence and settings
#define SAVEGAME_CRITICAL(msg) DELVE_CRITICAL("SaveGameManager", msg)
#define SAVEGAME_ERROR(msg) DELVE_ERROR("SaveGameManager", msg)
#define SAVEGAME_WARN(msg) DELVE_WARN("SaveGameManager", msg)
#define SAVEGAME_INFO(msg) DELVE_INFO("SaveGameManager", msg)
#define SAVEGAME_DEBUG(msg) DELVE_DEBUG("SaveGameManager", msg)

#define SETTINGS_CRITICAL(msg) DELVE_CRITICAL("SimConfig", msg)
#define SETTINGS_ERROR(msg) DELVE_ERROR("SimConfig", msg)
#define SETTINGS_WARNING(msg) DELVE_WARN("SimConfig", msg)
#define SETTINGS_INFO(msg) DELVE_INFO("SimConfig", msg)
#define SETTINGS_DEBUG(msg) DELVE_DEBUG("SimConfig", msg)

// Benchmark mode convenience macros
#define DELVE_ENABLE_BENCHMARK_MODE() Delve::Logger::SetBenchmarkMode(true)
#define DELVE_DISABLE_BENCHMARK_MODE() Delve::Logger::SetBenchmarkMode(false)

} // namespace Delve

#endif // LOGGER_HPP

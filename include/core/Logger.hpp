/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> quiet mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for serialized console output
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace KeeperEngine {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (even in release for crashes)
  ERROR_LEVEL = 1,  // Renamed to avoid macro conflicts
  WARNING = 2,
  INFO = 3,
  DEBUG_LEVEL = 4   // Renamed to avoid macro conflicts
};

#ifdef DEBUG
// Debug builds: everything goes to stdout
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

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }
    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("Keeper Engine - [%s] %s: %s\n", system, getLevelString(level),
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

#define KEEPER_CRITICAL(system, msg)                                           \
  KeeperEngine::Logger::Log(KeeperEngine::LogLevel::CRITICAL, system, msg)
#define KEEPER_ERROR(system, msg)                                              \
  KeeperEngine::Logger::Log(KeeperEngine::LogLevel::ERROR_LEVEL, system, msg)
#define KEEPER_WARN(system, msg)                                               \
  KeeperEngine::Logger::Log(KeeperEngine::LogLevel::WARNING, system, msg)
#define KEEPER_INFO(system, msg)                                               \
  KeeperEngine::Logger::Log(KeeperEngine::LogLevel::INFO, system, msg)
#define KEEPER_DEBUG(system, msg)                                              \
  KeeperEngine::Logger::Log(KeeperEngine::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds: file sink implemented in Logger.cpp, DEBUG level compiled out
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;

public:
  static std::mutex s_logMutex; // Public for macro access

  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define KEEPER_CRITICAL(system, msg)                                           \
  KeeperEngine::Logger::Log("CRITICAL", system, msg)
#define KEEPER_ERROR(system, msg)                                              \
  KeeperEngine::Logger::Log("ERROR", system, msg)
#define KEEPER_WARN(system, msg)                                               \
  KeeperEngine::Logger::Log("WARNING", system, msg)
#define KEEPER_INFO(system, msg)                                               \
  KeeperEngine::Logger::Log("INFO", system, msg)
#define KEEPER_DEBUG(system, msg) ((void)0)

#endif

// Static member definitions - shared by both DEBUG and RELEASE builds
inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Core Systems
#define GAMELOOP_CRITICAL(msg) KEEPER_CRITICAL("GameLoop", msg)
#define GAMELOOP_ERROR(msg) KEEPER_ERROR("GameLoop", msg)
#define GAMELOOP_WARN(msg) KEEPER_WARN("GameLoop", msg)
#define GAMELOOP_INFO(msg) KEEPER_INFO("GameLoop", msg)
#define GAMELOOP_DEBUG(msg) KEEPER_DEBUG("GameLoop", msg)

#define SIMULATION_CRITICAL(msg) KEEPER_CRITICAL("Simulation", msg)
#define SIMULATION_ERROR(msg) KEEPER_ERROR("Simulation", msg)
#define SIMULATION_WARN(msg) KEEPER_WARN("Simulation", msg)
#define SIMULATION_INFO(msg) KEEPER_INFO("Simulation", msg)
#define SIMULATION_DEBUG(msg) KEEPER_DEBUG("Simulation", msg)

#define SESSION_CRITICAL(msg) KEEPER_CRITICAL("GameSession", msg)
#define SESSION_ERROR(msg) KEEPER_ERROR("GameSession", msg)
#define SESSION_WARN(msg) KEEPER_WARN("GameSession", msg)
#define SESSION_INFO(msg) KEEPER_INFO("GameSession", msg)
#define SESSION_DEBUG(msg) KEEPER_DEBUG("GameSession", msg)

#define EVENTBUS_ERROR(msg) KEEPER_ERROR("EventBus", msg)
#define EVENTBUS_WARN(msg) KEEPER_WARN("EventBus", msg)
#define EVENTBUS_DEBUG(msg) KEEPER_DEBUG("EventBus", msg)

// Manager Systems
#define LEDGER_CRITICAL(msg) KEEPER_CRITICAL("ResourceLedger", msg)
#define LEDGER_ERROR(msg) KEEPER_ERROR("ResourceLedger", msg)
#define LEDGER_WARN(msg) KEEPER_WARN("ResourceLedger", msg)
#define LEDGER_INFO(msg) KEEPER_INFO("ResourceLedger", msg)
#define LEDGER_DEBUG(msg) KEEPER_DEBUG("ResourceLedger", msg)

#define REGISTRY_CRITICAL(msg) KEEPER_CRITICAL("EntityRegistry", msg)
#define REGISTRY_ERROR(msg) KEEPER_ERROR("EntityRegistry", msg)
#define REGISTRY_WARN(msg) KEEPER_WARN("EntityRegistry", msg)
#define REGISTRY_INFO(msg) KEEPER_INFO("EntityRegistry", msg)
#define REGISTRY_DEBUG(msg) KEEPER_DEBUG("EntityRegistry", msg)

#define COLLISION_CRITICAL(msg) KEEPER_CRITICAL("CollisionResolver", msg)
#define COLLISION_ERROR(msg) KEEPER_ERROR("CollisionResolver", msg)
#define COLLISION_WARN(msg) KEEPER_WARN("CollisionResolver", msg)
#define COLLISION_INFO(msg) KEEPER_INFO("CollisionResolver", msg)
#define COLLISION_DEBUG(msg) KEEPER_DEBUG("CollisionResolver", msg)

#define LEVEL_CRITICAL(msg) KEEPER_CRITICAL("LevelProgression", msg)
#define LEVEL_ERROR(msg) KEEPER_ERROR("LevelProgression", msg)
#define LEVEL_WARN(msg) KEEPER_WARN("LevelProgression", msg)
#define LEVEL_INFO(msg) KEEPER_INFO("LevelProgression", msg)
#define LEVEL_DEBUG(msg) KEEPER_DEBUG("LevelProgression", msg)

#define LEVELLOADER_ERROR(msg) KEEPER_ERROR("LevelLoader", msg)
#define LEVELLOADER_WARN(msg) KEEPER_WARN("LevelLoader", msg)
#define LEVELLOADER_INFO(msg) KEEPER_INFO("LevelLoader", msg)
#define LEVELLOADER_DEBUG(msg) KEEPER_DEBUG("LevelLoader", msg)

#define SETTINGS_CRITICAL(msg) KEEPER_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) KEEPER_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) KEEPER_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) KEEPER_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) KEEPER_DEBUG("SettingsManager", msg)

// Controllers
#define BOUNDS_ERROR(msg) KEEPER_ERROR("BoundingBoxController", msg)
#define BOUNDS_WARN(msg) KEEPER_WARN("BoundingBoxController", msg)
#define BOUNDS_INFO(msg) KEEPER_INFO("BoundingBoxController", msg)
#define BOUNDS_DEBUG(msg) KEEPER_DEBUG("BoundingBoxController", msg)

#define SHIP_ERROR(msg) KEEPER_ERROR("ShipController", msg)
#define SHIP_WARN(msg) KEEPER_WARN("ShipController", msg)
#define SHIP_INFO(msg) KEEPER_INFO("ShipController", msg)
#define SHIP_DEBUG(msg) KEEPER_DEBUG("ShipController", msg)

#define CANNON_DEBUG(msg) KEEPER_DEBUG("HazardCannonController", msg)

// Quiet mode convenience macros
#define KEEPER_ENABLE_BENCHMARK_MODE()                                         \
  KeeperEngine::Logger::SetBenchmarkMode(true)
#define KEEPER_DISABLE_BENCHMARK_MODE()                                        \
  KeeperEngine::Logger::SetBenchmarkMode(false)

} // namespace KeeperEngine

#endif // LOGGER_HPP

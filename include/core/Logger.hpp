/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> benchmark mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for fprintf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for thread-safe logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace OvermapAtlas {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs
  ERROR_LEVEL = 1,  // Renamed to avoid macro conflicts
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only
};

#ifdef DEBUG
// Full console logging in debug builds. Everything goes to stderr; stdout
// carries program output only.
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
    std::fprintf(stderr, "Overmap Atlas - [%s] %s: %s\n", system,
                 getLevelString(level), message);
    std::fflush(stderr);
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

#define ATLAS_CRITICAL(system, msg)                                            \
  OvermapAtlas::Logger::Log(OvermapAtlas::LogLevel::CRITICAL, system, msg)
#define ATLAS_ERROR(system, msg)                                               \
  OvermapAtlas::Logger::Log(OvermapAtlas::LogLevel::ERROR_LEVEL, system, msg)
#define ATLAS_WARN(system, msg)                                                \
  OvermapAtlas::Logger::Log(OvermapAtlas::LogLevel::WARNING, system, msg)
#define ATLAS_INFO(system, msg)                                                \
  OvermapAtlas::Logger::Log(OvermapAtlas::LogLevel::INFO, system, msg)
#define ATLAS_DEBUG(system, msg)                                               \
  OvermapAtlas::Logger::Log(OvermapAtlas::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds - errors go to a rotating log file, CRITICAL is echoed to
// stderr, the rest compiles out
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

#define ATLAS_CRITICAL(system, msg)                                            \
  OvermapAtlas::Logger::Log("CRITICAL", system, msg)

#define ATLAS_ERROR(system, msg)                                               \
  OvermapAtlas::Logger::Log("ERROR", system, msg)

#define ATLAS_WARN(system, msg) ((void)0)  // Zero overhead
#define ATLAS_INFO(system, msg) ((void)0)  // Zero overhead
#define ATLAS_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Content database
#define GAMEDATA_CRITICAL(msg) ATLAS_CRITICAL("DefinitionStore", msg)
#define GAMEDATA_ERROR(msg) ATLAS_ERROR("DefinitionStore", msg)
#define GAMEDATA_WARN(msg) ATLAS_WARN("DefinitionStore", msg)
#define GAMEDATA_INFO(msg) ATLAS_INFO("DefinitionStore", msg)
#define GAMEDATA_DEBUG(msg) ATLAS_DEBUG("DefinitionStore", msg)

// Overmap decoding and symbol resolution
#define OVERMAP_CRITICAL(msg) ATLAS_CRITICAL("OvermapTile", msg)
#define OVERMAP_ERROR(msg) ATLAS_ERROR("OvermapTile", msg)
#define OVERMAP_WARN(msg) ATLAS_WARN("OvermapTile", msg)
#define OVERMAP_INFO(msg) ATLAS_INFO("OvermapTile", msg)
#define OVERMAP_DEBUG(msg) ATLAS_DEBUG("OvermapTile", msg)

#define PROJECTOR_CRITICAL(msg) ATLAS_CRITICAL("GridProjector", msg)
#define PROJECTOR_ERROR(msg) ATLAS_ERROR("GridProjector", msg)
#define PROJECTOR_WARN(msg) ATLAS_WARN("GridProjector", msg)
#define PROJECTOR_INFO(msg) ATLAS_INFO("GridProjector", msg)
#define PROJECTOR_DEBUG(msg) ATLAS_DEBUG("GridProjector", msg)

#define SETTINGS_CRITICAL(msg) ATLAS_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) ATLAS_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) ATLAS_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) ATLAS_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) ATLAS_DEBUG("SettingsManager", msg)

#define RESOURCEPATH_ERROR(msg) ATLAS_ERROR("ResourcePath", msg)
#define RESOURCEPATH_WARN(msg) ATLAS_WARN("ResourcePath", msg)
#define RESOURCEPATH_INFO(msg) ATLAS_INFO("ResourcePath", msg)
#define RESOURCEPATH_DEBUG(msg) ATLAS_DEBUG("ResourcePath", msg)

#define ATLAS_MAIN_CRITICAL(msg) ATLAS_CRITICAL("AtlasMain", msg)
#define ATLAS_MAIN_ERROR(msg) ATLAS_ERROR("AtlasMain", msg)
#define ATLAS_MAIN_WARN(msg) ATLAS_WARN("AtlasMain", msg)
#define ATLAS_MAIN_INFO(msg) ATLAS_INFO("AtlasMain", msg)
#define ATLAS_MAIN_DEBUG(msg) ATLAS_DEBUG("AtlasMain", msg)

#define ATLAS_ENABLE_BENCHMARK_MODE()                                          \
  OvermapAtlas::Logger::SetBenchmarkMode(true)
#define ATLAS_DISABLE_BENCHMARK_MODE()                                         \
  OvermapAtlas::Logger::SetBenchmarkMode(false)

} // namespace OvermapAtlas

#endif // LOGGER_HPP

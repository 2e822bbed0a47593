/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Release builds only - debug builds log to stderr from the header
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <mutex>
#include <string>

namespace OvermapAtlas {
namespace {

namespace fs = std::filesystem;

// overmap_atlas.log plus overmap_atlas.1.log .. overmap_atlas.4.log
constexpr int KEEP_LOG_FILES = 5;
constexpr int FLUSH_INTERVAL = 50;

fs::path numberedLog(const fs::path &directory, int generation) {
  if (generation == 0) {
    return directory / std::format("{}.log", ATLAS_APP_NAME);
  }
  return directory / std::format("{}.{}.log", ATLAS_APP_NAME, generation);
}

// Shifts every previous log up one generation; the oldest falls off
void rotateLogs(const fs::path &directory) {
  std::error_code ec;
  fs::remove(numberedLog(directory, KEEP_LOG_FILES - 1), ec);
  for (int generation = KEEP_LOG_FILES - 2; generation >= 0; --generation) {
    const fs::path from = numberedLog(directory, generation);
    if (fs::exists(from, ec)) {
      fs::rename(from, numberedLog(directory, generation + 1), ec);
    }
  }
}

std::string timestamp(const char *pattern) {
  const auto now = std::chrono::system_clock::now();
  const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  std::tm local{};
#ifdef _WIN32
  localtime_s(&local, &seconds);
#else
  localtime_r(&seconds, &local);
#endif
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), pattern, &local);
  return buffer;
}

class LogFile {
public:
  static LogFile &Instance() {
    static LogFile instance;
    return instance;
  }

  void append(const char *level, const char *system, const char *message) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const bool critical = std::strcmp(level, "CRITICAL") == 0;
    const bool haveFile = openOnce();

    // Failures that end the program must reach the terminal too
    if (critical || !haveFile) {
      std::fprintf(stderr, "Overmap Atlas - [%s] %s: %s\n", system, level,
                   message);
    }
    if (!haveFile) {
      return;
    }

    m_stream << timestamp("%Y-%m-%d %H:%M:%S") << " [" << level << "] ["
             << system << "] " << message << '\n';
    if (critical || ++m_pending >= FLUSH_INTERVAL) {
      m_stream.flush();
      m_pending = 0;
    }
  }

  LogFile(const LogFile &) = delete;
  LogFile &operator=(const LogFile &) = delete;

private:
  LogFile() = default;
  ~LogFile() { m_stream.flush(); }

  // False when no log file could be opened
  bool openOnce() {
    if (m_opened) {
      return m_stream.is_open();
    }
    m_opened = true;

    // ATLAS_APP_NAME is defined via CMake from ${PROJECT_NAME}
    char *prefPath = SDL_GetPrefPath("HammerForged", ATLAS_APP_NAME);
    if (prefPath == nullptr) {
      return false;
    }
    const fs::path directory = fs::path(prefPath) / "logs";
    SDL_free(prefPath);

    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
      return false;
    }

    rotateLogs(directory);
    m_stream.open(numberedLog(directory, 0), std::ios::out | std::ios::trunc);
    if (m_stream.is_open()) {
      m_stream << "=== " << ATLAS_APP_NAME << " started "
               << timestamp("%Y-%m-%d %H:%M:%S") << " ===\n";
    }
    return m_stream.is_open();
  }

  std::mutex m_mutex;
  std::ofstream m_stream;
  bool m_opened{false};
  int m_pending{0};
};

} // namespace

void Logger::Log(const char *level, const char *system,
                 const std::string &message) {
  Log(level, system, message.c_str());
}

void Logger::Log(const char *level, const char *system, const char *message) {
  if (s_benchmarkMode.load(std::memory_order_relaxed)) {
    return;
  }
  LogFile::Instance().append(level, system, message);
}

} // namespace OvermapAtlas

#endif // DEBUG

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

// Required includes for logging system:
// - string: Used in macro expansions for std::string() conversions
// - cstdio: Required for printf() and fflush() functions
// - mutex: Required for serialized console output
// - atomic: Required for std::atomic<bool> benchmark mode flag
#include <atomic> // IWYU pragma: keep
#include <cstdint> // IWYU pragma: keep
#include <cstdio> // IWYU pragma: keep
#include <mutex> // IWYU pragma: keep
#include <string> // IWYU pragma: keep

namespace Ironclad {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs
  ERROR_LEVEL = 1,  // Always logs (file in release)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only
};

#ifdef DEBUG
// Console logging in debug builds
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
    printf("Ironclad - [%s] %s: %s\n", system, getLevelString(level), message);
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

#define IRONCLAD_CRITICAL(system, msg)                                         \
  Ironclad::Logger::Log(Ironclad::LogLevel::CRITICAL, system, msg)
#define IRONCLAD_ERROR(system, msg)                                            \
  Ironclad::Logger::Log(Ironclad::LogLevel::ERROR_LEVEL, system, msg)
#define IRONCLAD_WARN(system, msg)                                             \
  Ironclad::Logger::Log(Ironclad::LogLevel::WARNING, system, msg)
#define IRONCLAD_INFO(system, msg)                                             \
  Ironclad::Logger::Log(Ironclad::LogLevel::INFO, system, msg)
#define IRONCLAD_DEBUG(system, msg)                                            \
  Ironclad::Logger::Log(Ironclad::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds write CRITICAL and ERROR to a log file (see Logger.cpp)
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;

public:
  static std::mutex s_logMutex;

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

#define IRONCLAD_CRITICAL(system, msg)                                         \
  Ironclad::Logger::Log("CRITICAL", system, msg)

#define IRONCLAD_ERROR(system, msg)                                            \
  Ironclad::Logger::Log("ERROR", system, msg)

#define IRONCLAD_WARN(system, msg) ((void)0)
#define IRONCLAD_INFO(system, msg) ((void)0)
#define IRONCLAD_DEBUG(system, msg) ((void)0)
#endif

inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Convenience macros per subsystem

#define ARENA_CRITICAL(msg) IRONCLAD_CRITICAL("Arena", msg)
#define ARENA_ERROR(msg) IRONCLAD_ERROR("Arena", msg)
#define ARENA_WARN(msg) IRONCLAD_WARN("Arena", msg)
#define ARENA_INFO(msg) IRONCLAD_INFO("Arena", msg)
#define ARENA_DEBUG(msg) IRONCLAD_DEBUG("Arena", msg)

#define COLLISION_CRITICAL(msg) IRONCLAD_CRITICAL("CollisionManager", msg)
#define COLLISION_ERROR(msg) IRONCLAD_ERROR("CollisionManager", msg)
#define COLLISION_WARN(msg) IRONCLAD_WARN("CollisionManager", msg)
#define COLLISION_INFO(msg) IRONCLAD_INFO("CollisionManager", msg)
#define COLLISION_DEBUG(msg) IRONCLAD_DEBUG("CollisionManager", msg)

#define ENTITY_CRITICAL(msg) IRONCLAD_CRITICAL("Entity", msg)
#define ENTITY_ERROR(msg) IRONCLAD_ERROR("Entity", msg)
#define ENTITY_WARN(msg) IRONCLAD_WARN("Entity", msg)
#define ENTITY_INFO(msg) IRONCLAD_INFO("Entity", msg)
#define ENTITY_DEBUG(msg) IRONCLAD_DEBUG("Entity", msg)

#define SETTINGS_CRITICAL(msg) IRONCLAD_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) IRONCLAD_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) IRONCLAD_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) IRONCLAD_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) IRONCLAD_DEBUG("SettingsManager", msg)

} // namespace Ironclad

#endif // LOGGER_HPP

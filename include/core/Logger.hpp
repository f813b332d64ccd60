/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

/**
 * @file Logger.hpp
 * @brief Subsystem-tagged logging
 *
 * Debug builds (DEBUG defined) print every level to stdout.
 * Release builds compile WARN/INFO/DEBUG macros away entirely; CRITICAL and
 * ERROR go to a rotating log file implemented in Logger.cpp.
 */

#include <atomic> // IWYU pragma: keep - benchmark mode flag
#include <cstdint>
#include <cstdio> // IWYU pragma: keep - console sink
#include <mutex>
#include <string> // IWYU pragma: keep - std::string concatenation inside macro arguments

namespace FortressEngine {

enum class LogLevel : uint8_t {
  CRITICAL = 0,
  ERROR_LEVEL = 1, // avoids clashing with ERROR macros on some platforms
  WARNING = 2,
  INFO = 3,
  DEBUG_LEVEL = 4
};

class Logger {
public:
  // Silences every sink, e.g. while a test floods the scheduler
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }
  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static const char *LevelName(LogLevel level) {
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
    }
    return "UNKNOWN";
  }

#ifdef DEBUG
  static void Log(LogLevel level, const char *system, const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (IsBenchmarkMode()) {
      return;
    }
    std::lock_guard<std::mutex> lock(s_consoleMutex);
    std::printf("Fortress Engine - [%s] %s: %s\n", system, LevelName(level), message);
    std::fflush(stdout);
  }
#else
  // File sink, see Logger.cpp
  static void Log(const char *level, const char *system, const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
#endif

private:
  static std::atomic<bool> s_benchmarkMode;
  static std::mutex s_consoleMutex;
};

inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_consoleMutex{};

#ifdef DEBUG
#define FORTRESS_LOG(level, system, msg)                                       \
  FortressEngine::Logger::Log(FortressEngine::LogLevel::level, system, msg)
#define FORTRESS_CRITICAL(system, msg) FORTRESS_LOG(CRITICAL, system, msg)
#define FORTRESS_ERROR(system, msg) FORTRESS_LOG(ERROR_LEVEL, system, msg)
#define FORTRESS_WARN(system, msg) FORTRESS_LOG(WARNING, system, msg)
#define FORTRESS_INFO(system, msg) FORTRESS_LOG(INFO, system, msg)
#define FORTRESS_DEBUG(system, msg) FORTRESS_LOG(DEBUG_LEVEL, system, msg)
#else
#define FORTRESS_CRITICAL(system, msg)                                         \
  FortressEngine::Logger::Log("CRITICAL", system, msg)
#define FORTRESS_ERROR(system, msg)                                            \
  FortressEngine::Logger::Log("ERROR", system, msg)
#define FORTRESS_WARN(system, msg) ((void)0)
#define FORTRESS_INFO(system, msg) ((void)0)
#define FORTRESS_DEBUG(system, msg) ((void)0)
#endif

// Scheduler core
#define SCHEDULER_CRITICAL(msg) FORTRESS_CRITICAL("LifecycleScheduler", msg)
#define SCHEDULER_ERROR(msg) FORTRESS_ERROR("LifecycleScheduler", msg)
#define SCHEDULER_WARN(msg) FORTRESS_WARN("LifecycleScheduler", msg)
#define SCHEDULER_INFO(msg) FORTRESS_INFO("LifecycleScheduler", msg)
#define SCHEDULER_DEBUG(msg) FORTRESS_DEBUG("LifecycleScheduler", msg)

#define FRAMECLOCK_CRITICAL(msg) FORTRESS_CRITICAL("FrameClock", msg)
#define FRAMECLOCK_ERROR(msg) FORTRESS_ERROR("FrameClock", msg)
#define FRAMECLOCK_WARN(msg) FORTRESS_WARN("FrameClock", msg)
#define FRAMECLOCK_INFO(msg) FORTRESS_INFO("FrameClock", msg)
#define FRAMECLOCK_DEBUG(msg) FORTRESS_DEBUG("FrameClock", msg)

#define CONFIG_CRITICAL(msg) FORTRESS_CRITICAL("SchedulerConfig", msg)
#define CONFIG_ERROR(msg) FORTRESS_ERROR("SchedulerConfig", msg)
#define CONFIG_WARN(msg) FORTRESS_WARN("SchedulerConfig", msg)
#define CONFIG_INFO(msg) FORTRESS_INFO("SchedulerConfig", msg)
#define CONFIG_DEBUG(msg) FORTRESS_DEBUG("SchedulerConfig", msg)

// Entities
#define ENTITYSTORE_CRITICAL(msg) FORTRESS_CRITICAL("EntityStore", msg)
#define ENTITYSTORE_ERROR(msg) FORTRESS_ERROR("EntityStore", msg)
#define ENTITYSTORE_WARN(msg) FORTRESS_WARN("EntityStore", msg)
#define ENTITYSTORE_INFO(msg) FORTRESS_INFO("EntityStore", msg)
#define ENTITYSTORE_DEBUG(msg) FORTRESS_DEBUG("EntityStore", msg)

// World
#define LAYOUT_CRITICAL(msg) FORTRESS_CRITICAL("LayoutCalculator", msg)
#define LAYOUT_ERROR(msg) FORTRESS_ERROR("LayoutCalculator", msg)
#define LAYOUT_WARN(msg) FORTRESS_WARN("LayoutCalculator", msg)
#define LAYOUT_INFO(msg) FORTRESS_INFO("LayoutCalculator", msg)
#define LAYOUT_DEBUG(msg) FORTRESS_DEBUG("LayoutCalculator", msg)

// Host and presentation
#define HOST_CRITICAL(msg) FORTRESS_CRITICAL("VisualizerHost", msg)
#define HOST_ERROR(msg) FORTRESS_ERROR("VisualizerHost", msg)
#define HOST_WARN(msg) FORTRESS_WARN("VisualizerHost", msg)
#define HOST_INFO(msg) FORTRESS_INFO("VisualizerHost", msg)
#define HOST_DEBUG(msg) FORTRESS_DEBUG("VisualizerHost", msg)

#define RENDER_CRITICAL(msg) FORTRESS_CRITICAL("Renderer", msg)
#define RENDER_ERROR(msg) FORTRESS_ERROR("Renderer", msg)
#define RENDER_WARN(msg) FORTRESS_WARN("Renderer", msg)
#define RENDER_INFO(msg) FORTRESS_INFO("Renderer", msg)
#define RENDER_DEBUG(msg) FORTRESS_DEBUG("Renderer", msg)

#define FEED_CRITICAL(msg) FORTRESS_CRITICAL("TransactionFeed", msg)
#define FEED_ERROR(msg) FORTRESS_ERROR("TransactionFeed", msg)
#define FEED_WARN(msg) FORTRESS_WARN("TransactionFeed", msg)
#define FEED_INFO(msg) FORTRESS_INFO("TransactionFeed", msg)
#define FEED_DEBUG(msg) FORTRESS_DEBUG("TransactionFeed", msg)

#define FORTRESS_ENABLE_BENCHMARK_MODE()                                       \
  FortressEngine::Logger::SetBenchmarkMode(true)
#define FORTRESS_DISABLE_BENCHMARK_MODE()                                      \
  FortressEngine::Logger::SetBenchmarkMode(false)

} // namespace FortressEngine

#endif // LOGGER_HPP

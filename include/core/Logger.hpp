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
// - mutex: Serializes output when a test harness logs from helper threads
// - atomic: Required for std::atomic<bool> benchmark mode flag
#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> benchmark mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for serialized logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace OtterEngine {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
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
    printf("Otter Engine - [%s] %s: %s\n", system, getLevelString(level),
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

#define OTTER_CRITICAL(system, msg)                                            \
  OtterEngine::Logger::Log(OtterEngine::LogLevel::CRITICAL, system, msg)
#define OTTER_ERROR(system, msg)                                               \
  OtterEngine::Logger::Log(OtterEngine::LogLevel::ERROR_LEVEL, system, msg)
#define OTTER_WARN(system, msg)                                                \
  OtterEngine::Logger::Log(OtterEngine::LogLevel::WARNING, system, msg)
#define OTTER_INFO(system, msg)                                                \
  OtterEngine::Logger::Log(OtterEngine::LogLevel::INFO, system, msg)
#define OTTER_DEBUG(system, msg)                                               \
  OtterEngine::Logger::Log(OtterEngine::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds: only CRITICAL and ERROR reach stdout
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
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(const char *level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }
    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("Otter Engine - [%s] %s: %s\n", system, level, message);
    fflush(stdout);
  }
};

#define OTTER_CRITICAL(system, msg)                                            \
  OtterEngine::Logger::Log("CRITICAL", system, msg)

#define OTTER_ERROR(system, msg) OtterEngine::Logger::Log("ERROR", system, msg)

#define OTTER_WARN(system, msg) ((void)0)  // Zero overhead
#define OTTER_INFO(system, msg) ((void)0)  // Zero overhead
#define OTTER_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Convenience macros for each subsystem

#define THREAT_ERROR(msg) OTTER_ERROR("ThreatAssessment", msg)
#define THREAT_WARN(msg) OTTER_WARN("ThreatAssessment", msg)
#define THREAT_DEBUG(msg) OTTER_DEBUG("ThreatAssessment", msg)

#define PERCEPTION_CRITICAL(msg) OTTER_CRITICAL("Perception", msg)
#define PERCEPTION_ERROR(msg) OTTER_ERROR("Perception", msg)
#define PERCEPTION_WARN(msg) OTTER_WARN("Perception", msg)
#define PERCEPTION_INFO(msg) OTTER_INFO("Perception", msg)
#define PERCEPTION_DEBUG(msg) OTTER_DEBUG("Perception", msg)

#define SOUNDBUS_CRITICAL(msg) OTTER_CRITICAL("SoundBus", msg)
#define SOUNDBUS_ERROR(msg) OTTER_ERROR("SoundBus", msg)
#define SOUNDBUS_WARN(msg) OTTER_WARN("SoundBus", msg)
#define SOUNDBUS_INFO(msg) OTTER_INFO("SoundBus", msg)
#define SOUNDBUS_DEBUG(msg) OTTER_DEBUG("SoundBus", msg)

#define BOSS_CRITICAL(msg) OTTER_CRITICAL("BossAI", msg)
#define BOSS_ERROR(msg) OTTER_ERROR("BossAI", msg)
#define BOSS_WARN(msg) OTTER_WARN("BossAI", msg)
#define BOSS_INFO(msg) OTTER_INFO("BossAI", msg)
#define BOSS_DEBUG(msg) OTTER_DEBUG("BossAI", msg)

#define ENCOUNTER_CRITICAL(msg) OTTER_CRITICAL("BossEncounter", msg)
#define ENCOUNTER_ERROR(msg) OTTER_ERROR("BossEncounter", msg)
#define ENCOUNTER_WARN(msg) OTTER_WARN("BossEncounter", msg)
#define ENCOUNTER_INFO(msg) OTTER_INFO("BossEncounter", msg)
#define ENCOUNTER_DEBUG(msg) OTTER_DEBUG("BossEncounter", msg)

// Benchmark mode convenience macros
#define OTTER_ENABLE_BENCHMARK_MODE() OtterEngine::Logger::SetBenchmarkMode(true)
#define OTTER_DISABLE_BENCHMARK_MODE()                                         \
  OtterEngine::Logger::SetBenchmarkMode(false)

} // namespace OtterEngine

#endif // LOGGER_HPP

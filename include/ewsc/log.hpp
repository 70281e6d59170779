/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Logging utilities for EWSC (loghelper-compatible interface).
 * Provides EWSC_LOG_DEBUG, EWSC_LOG_INFO, EWSC_LOG_WARN, EWSC_LOG_ERROR macros.
 */

#ifndef EWSC_LOG_HPP_
#define EWSC_LOG_HPP_

#include <atomic>
#include <iostream>
#include <string>

namespace ewsc {

class Logger {
 public:
  // Ordered by severity; messages below the threshold are dropped.
  enum class Level { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3, kOff = 4 };

  static void set_level(Level level) {
    threshold().store(static_cast<int>(level), std::memory_order_relaxed);
  }

  static Level level() {
    return static_cast<Level>(threshold().load(std::memory_order_relaxed));
  }

  // kOff is a threshold, never a message level.
  static bool enabled(Level level) {
    return level != Level::kOff &&
           static_cast<int>(level) >= threshold().load(std::memory_order_relaxed);
  }

  static void log(Level level, const std::string& msg) {
    if (!enabled(level)) return;
    const char* prefix[] = {"[DEBUG]", "[INFO]", "[WARN]", "[ERROR]"};
    std::cerr << "[EWSC]" << prefix[static_cast<int>(level)] << " " << msg
              << std::endl;
  }

 private:
  static std::atomic<int>& threshold() {
    static std::atomic<int> value{static_cast<int>(Level::kInfo)};
    return value;
  }
};

#define EWSC_LOG_DEBUG(msg) ::ewsc::Logger::log(::ewsc::Logger::Level::kDebug, msg)
#define EWSC_LOG_INFO(msg) ::ewsc::Logger::log(::ewsc::Logger::Level::kInfo, msg)
#define EWSC_LOG_WARN(msg) ::ewsc::Logger::log(::ewsc::Logger::Level::kWarn, msg)
#define EWSC_LOG_ERROR(msg) ::ewsc::Logger::log(::ewsc::Logger::Level::kError, msg)

}  // namespace ewsc

#endif  // EWSC_LOG_HPP_

/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Logging utilities for wsshake (loghelper-compatible interface).
 * Provides WSSHAKE_LOG_INFO, WSSHAKE_LOG_WARN, WSSHAKE_LOG_ERROR,
 * WSSHAKE_LOG_DEBUG macros.
 */

#ifndef WSSHAKE_LOG_HPP_
#define WSSHAKE_LOG_HPP_

#include <atomic>
#include <iostream>
#include <string>

namespace wsshake {

class Logger {
 public:
  // Ordered by severity; messages below the current level are dropped
  enum class Level { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3, kOff = 4 };

  static void log(Level level, const std::string& msg) {
    if (static_cast<int>(level) < static_cast<int>(current_level().load(std::memory_order_relaxed))) {
      return;
    }
    const char* prefix[] = {"[DEBUG]", "[INFO]", "[WARN]", "[ERROR]"};
    std::cerr << prefix[static_cast<int>(level)] << " " << msg << std::endl;
  }

  static void set_level(Level level) { current_level().store(level, std::memory_order_relaxed); }

  static Level level() { return current_level().load(std::memory_order_relaxed); }

  static bool enabled(Level level) { return static_cast<int>(level) >= static_cast<int>(Logger::level()); }

 private:
  static std::atomic<Level>& current_level() {
    static std::atomic<Level> level{Level::kInfo};
    return level;
  }
};

// The message expression is only evaluated when the level is enabled
#define WSSHAKE_LOG_AT(level, msg)         \
  do {                                     \
    if (::wsshake::Logger::enabled(level)) \
      ::wsshake::Logger::log(level, msg);  \
  } while (0)

#define WSSHAKE_LOG_INFO(msg) WSSHAKE_LOG_AT(::wsshake::Logger::Level::kInfo, msg)
#define WSSHAKE_LOG_WARN(msg) WSSHAKE_LOG_AT(::wsshake::Logger::Level::kWarn, msg)
#define WSSHAKE_LOG_ERROR(msg) WSSHAKE_LOG_AT(::wsshake::Logger::Level::kError, msg)
#define WSSHAKE_LOG_DEBUG(msg) WSSHAKE_LOG_AT(::wsshake::Logger::Level::kDebug, msg)

}  // namespace wsshake

#endif  // WSSHAKE_LOG_HPP_

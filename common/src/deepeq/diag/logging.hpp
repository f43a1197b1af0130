#pragma once

#include <cstdlib>
#include <string>
#include <string_view>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace deepeq::diag {

enum class LogLevel {
  Off,
  Error,
  Warn,
  Info,
  Debug,
  Trace,
};

inline spdlog::level::level_enum to_spdlog_level(LogLevel level) {
  switch (level) {
  case LogLevel::Off:
    return spdlog::level::off;
  case LogLevel::Error:
    return spdlog::level::err;
  case LogLevel::Warn:
    return spdlog::level::warn;
  case LogLevel::Info:
    return spdlog::level::info;
  case LogLevel::Debug:
    return spdlog::level::debug;
  case LogLevel::Trace:
    return spdlog::level::trace;
  }
  return spdlog::level::warn;
}

// from_str maps unknown names to off, only "off" itself may disable logging.
inline spdlog::level::level_enum
level_from_env(std::string_view value, spdlog::level::level_enum fallback) {
  const spdlog::level::level_enum level =
      spdlog::level::from_str(std::string(value));
  if (level == spdlog::level::off && value != "off") {
    return fallback;
  }
  return level;
}

inline spdlog::logger &deepeq_logger() {
  // thread-safe since C++11 for function-local statics
  static spdlog::logger &ref = []() -> spdlog::logger & {
    auto lg = spdlog::get("deepeq");
    if (!lg) {
      auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      lg = std::make_shared<spdlog::logger>("deepeq", sink);
      lg->set_level(spdlog::level::warn);
      // DEEPEQ_LOG_LEVEL=trace|debug|info|warn|err|critical|off
      if (const char *env = std::getenv("DEEPEQ_LOG_LEVEL"); env != nullptr) {
        lg->set_level(level_from_env(env, spdlog::level::warn));
      }
      lg->set_pattern("[%^%-5l%$ %s:%#] %v");
      lg->flush_on(spdlog::level::warn);
      spdlog::register_logger(lg);
    }
    return *lg;
  }();
  return ref;
}

inline void set_log_level(LogLevel level) {
  deepeq_logger().set_level(to_spdlog_level(level));
}

// source locations in the pattern require the SPDLOG_LOGGER_* macros;
// SPDLOG_ACTIVE_LEVEL is set by the build so trace and debug are compiled in.
#define DEEPEQ_TRACE(...)                                                      \
  SPDLOG_LOGGER_TRACE(&::deepeq::diag::deepeq_logger(), __VA_ARGS__)
#define DEEPEQ_DEBUG(...)                                                      \
  SPDLOG_LOGGER_DEBUG(&::deepeq::diag::deepeq_logger(), __VA_ARGS__)
#define DEEPEQ_INFO(...)                                                       \
  SPDLOG_LOGGER_INFO(&::deepeq::diag::deepeq_logger(), __VA_ARGS__)
#define DEEPEQ_WARN(...)                                                       \
  SPDLOG_LOGGER_WARN(&::deepeq::diag::deepeq_logger(), __VA_ARGS__)
#define DEEPEQ_ERROR(...)                                                      \
  SPDLOG_LOGGER_ERROR(&::deepeq::diag::deepeq_logger(), __VA_ARGS__)

} // namespace deepeq::diag

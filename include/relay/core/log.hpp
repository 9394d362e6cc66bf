#pragma once
#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace relay::log {

inline constexpr const char* logger_name = "relay";
inline constexpr const char* level_env = "RELAY_LOG_LEVEL";

// Level named by RELAY_LOG_LEVEL ("debug", "info", ...), warn when unset or unknown.
inline spdlog::level::level_enum env_level() {
  const char* txt = std::getenv(level_env);
  if (!txt || !*txt) return spdlog::level::warn;
  std::string name(txt);
  auto lv = spdlog::level::from_str(name);
  // from_str maps unknown names to off
  if (lv == spdlog::level::off && name != "off") return spdlog::level::warn;
  return lv;
}

// The library-wide logger.
// Created on first use on stderr unless the application already registered a
// logger named "relay". Only this logger is configured: its level comes from
// RELAY_LOG_LEVEL, other loggers and the global spdlog levels are left alone.
inline std::shared_ptr<spdlog::logger> logger() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (!spdlog::get(logger_name)) {
      auto lg = spdlog::stderr_color_mt(logger_name);
      lg->set_level(env_level());
    }
  });
  auto lg = spdlog::get(logger_name);
  return lg ? lg : spdlog::default_logger();
}

inline void set_level(spdlog::level::level_enum lv) { logger()->set_level(lv); }

} // namespace relay::log

// codemap/basic/logging.cpp - Shared spdlog logger
#include "codemap/basic/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <string>

namespace codemap::logging
{

std::shared_ptr<spdlog::logger> logger()
{
  static std::once_flag once;
  static std::shared_ptr<spdlog::logger> instance;
  std::call_once(once, [] {
    instance = spdlog::get(k_logger_name);
    if (!instance) {
      instance = spdlog::stderr_color_mt(k_logger_name);
      instance->set_pattern("[%n] [%^%l%$] %v");
      instance->set_level(spdlog::level::warn);
    }
  });
  return instance;
}

std::optional<spdlog::level::level_enum> parse_level(std::string_view name)
{
  if (name == "trace") {
    return spdlog::level::trace;
  }
  if (name == "debug") {
    return spdlog::level::debug;
  }
  if (name == "info") {
    return spdlog::level::info;
  }
  if (name == "warn" || name == "warning") {
    return spdlog::level::warn;
  }
  if (name == "error") {
    return spdlog::level::err;
  }
  if (name == "critical") {
    return spdlog::level::critical;
  }
  if (name == "off") {
    return spdlog::level::off;
  }
  return std::nullopt;
}

void set_level(spdlog::level::level_enum level) { logger()->set_level(level); }

}  // namespace codemap::logging

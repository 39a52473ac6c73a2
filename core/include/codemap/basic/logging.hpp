// codemap/basic/logging.hpp - Shared spdlog logger
#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string_view>

namespace codemap::logging
{

inline constexpr const char * k_logger_name = "codemap";

/**
 * Process-wide "codemap" logger writing to stderr. Created on first use;
 * safe to call from analysis worker threads.
 */
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

/// Parse "trace", "debug", "info", "warn", "error", "critical" or "off".
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_level(std::string_view name);

void set_level(spdlog::level::level_enum level);

}  // namespace codemap::logging

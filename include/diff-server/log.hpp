/// @file log.hpp
/// @brief The library's spdlog logger.

#pragma once

#include <spdlog/spdlog.h>

#include <optional>
#include <string_view>

namespace diff_server {

/// The shared "diff-server" logger, writing to stderr. Created on first use.
/// If a logger of that name is already registered with spdlog (for example
/// by an embedding application), that one is used instead.
auto logger() -> spdlog::logger&;

/// Set the level of the diff-server logger.
void set_log_level(spdlog::level::level_enum level);

/// Parse a level name ("trace", "debug", "info", "warn", "error",
/// "critical", "off"). Returns nullopt for anything else.
auto parse_log_level(std::string_view name) -> std::optional<spdlog::level::level_enum>;

}  // namespace diff_server

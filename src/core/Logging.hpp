#pragma once

#include <spdlog/common.h>
#include <optional>
#include <string>

namespace mcpkit {

/**
 * @brief Logging configuration for servers speaking over stdio
 */
struct LoggingOptions {
    std::string level = "info";
    std::optional<std::string> file;  // stderr when unset
    std::string logger_name = "mcpkit";
};

/**
 * @brief Convert a level name to spdlog level
 * @param name One of trace, debug, info, warn, error, critical, off
 * @throws std::invalid_argument for unknown names
 */
spdlog::level::level_enum parse_log_level(const std::string& name);

/**
 * @brief Install the default spdlog logger
 *
 * Log output goes to stderr or to the configured file, never to stdout:
 * stdout belongs to the JSON-RPC stream when the stdio transport is used.
 */
void configure_logging(const LoggingOptions& options);

} // namespace mcpkit

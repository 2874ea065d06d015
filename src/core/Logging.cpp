#include "Logging.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <stdexcept>

namespace mcpkit {

spdlog::level::level_enum parse_log_level(const std::string& name) {
    if (name == "trace") {
        return spdlog::level::trace;
    } else if (name == "debug") {
        return spdlog::level::debug;
    } else if (name == "info") {
        return spdlog::level::info;
    } else if (name == "warn") {
        return spdlog::level::warn;
    } else if (name == "error") {
        return spdlog::level::err;
    } else if (name == "critical") {
        return spdlog::level::critical;
    } else if (name == "off") {
        return spdlog::level::off;
    }
    throw std::invalid_argument("Invalid log level: " + name);
}

void configure_logging(const LoggingOptions& options) {
    auto level = parse_log_level(options.level);

    // Replace any logger registered under the same name by an earlier call
    spdlog::drop(options.logger_name);

    std::shared_ptr<spdlog::logger> logger;
    if (options.file) {
        logger = spdlog::basic_logger_mt(options.logger_name, *options.file);
    } else {
        logger = spdlog::stderr_color_mt(options.logger_name);
    }

    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

} // namespace mcpkit

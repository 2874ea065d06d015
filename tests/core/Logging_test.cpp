#include <gtest/gtest.h>
#include "core/Logging.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace mcpkit;
namespace fs = std::filesystem;

TEST(LoggingTest, ParsesKnownLevels) {
    EXPECT_EQ(parse_log_level("trace"), spdlog::level::trace);
    EXPECT_EQ(parse_log_level("debug"), spdlog::level::debug);
    EXPECT_EQ(parse_log_level("info"), spdlog::level::info);
    EXPECT_EQ(parse_log_level("warn"), spdlog::level::warn);
    EXPECT_EQ(parse_log_level("error"), spdlog::level::err);
    EXPECT_EQ(parse_log_level("critical"), spdlog::level::critical);
    EXPECT_EQ(parse_log_level("off"), spdlog::level::off);
}

TEST(LoggingTest, RejectsUnknownLevel) {
    EXPECT_THROW(parse_log_level("verbose"), std::invalid_argument);
    EXPECT_THROW(parse_log_level(""), std::invalid_argument);
}

TEST(LoggingTest, FileSinkReceivesMessages) {
    fs::path log_path = fs::temp_directory_path() / "mcpkit_logging_test.log";
    fs::remove(log_path);

    auto previous = spdlog::default_logger();

    LoggingOptions options;
    options.level = "debug";
    options.file = log_path.string();
    options.logger_name = "mcpkit_logging_test";
    configure_logging(options);

    spdlog::debug("debug line {}", 1);
    spdlog::trace("trace line is filtered");
    spdlog::default_logger()->flush();

    std::ifstream file(log_path);
    std::stringstream content;
    content << file.rdbuf();
    EXPECT_NE(content.str().find("debug line 1"), std::string::npos);
    EXPECT_EQ(content.str().find("trace line is filtered"), std::string::npos);

    // Reconfiguring under the same name replaces the logger
    EXPECT_NO_THROW(configure_logging(options));

    spdlog::set_default_logger(previous);
    spdlog::drop("mcpkit_logging_test");
    file.close();
    fs::remove(log_path);
}

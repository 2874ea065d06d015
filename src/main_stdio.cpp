#include "core/CancellationToken.hpp"
#include "core/Logging.hpp"
#include "core/PathGuard.hpp"
#include "mcp/MCPServer.hpp"
#include "mcp/ServerBuilder.hpp"
#include "mcp/StdioTransport.hpp"
#include "tools/FileSystemTools.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {
    constexpr const char* kServerVersion = "1.0.0";

    mcpkit::CancellationSource shutdown_source;
    volatile std::sig_atomic_t received_signal = 0;

    // Only async-signal-safe work here: record the signal and flip the atomic flag
    void signal_handler(int signal) {
        received_signal = signal;
        shutdown_source.cancel();
    }

    void setup_signal_handlers() {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
    }
}

int main(int argc, char** argv) {
    // Parse command-line arguments
    CLI::App app{"MCP Stdio Server - file system tools confined to allowed directories"};

    mcpkit::LoggingOptions logging;
    app.add_option("-l,--log-level", logging.level,
                   "Log level (trace, debug, info, warn, error, critical, off)")
        ->default_val("info");

    std::string log_file;
    app.add_option("--log-file", log_file, "Write logs to this file instead of stderr");

    std::string server_name = "mcpkit-filesystem";
    app.add_option("-n,--name", server_name, "Server name reported during initialize")
        ->default_val("mcpkit-filesystem");

    std::string server_version = kServerVersion;
    app.add_option("--server-version", server_version, "Server version reported during initialize")
        ->default_val(kServerVersion);

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    std::vector<std::string> allowed_directories;
    app.add_option("directories", allowed_directories,
                   "Directories the tools may access (default: current directory)");

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << "mcpkit-fs-server version " << kServerVersion << std::endl;
        return 0;
    }

    // Configure logging; stdout is reserved for protocol messages
    if (!log_file.empty()) {
        logging.file = log_file;
    }
    try {
        mcpkit::configure_logging(logging);
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    if (allowed_directories.empty()) {
        allowed_directories.push_back(std::filesystem::current_path().string());
    }

    spdlog::info("Starting MCP Stdio Server");
    spdlog::info("Log level: {}", logging.level);

    try {
        // Setup signal handlers for graceful shutdown
        setup_signal_handlers();

        auto guard = std::make_shared<const mcpkit::PathGuard>(allowed_directories);
        for (const auto& directory : guard->allowed_directories()) {
            spdlog::info("Allowed directory: {}", directory.string());
        }

        auto server = mcpkit::ServerBuilder()
            .with_server_info(server_name, server_version)
            .add_tools(mcpkit::filesystem_tools(guard))
            .build();

        server->on_tool_executed([](const mcpkit::ToolExecutionEvent& event) {
            if (event.success) {
                spdlog::info("Tool {} succeeded in {} ms", event.tool_name, event.duration.count());
            } else {
                spdlog::warn("Tool {} failed in {} ms: {}", event.tool_name, event.duration.count(),
                             event.error_message.value_or("unknown error"));
            }
        });

        spdlog::info("All tools registered, starting server");

        // Run server (blocks until stopped)
        mcpkit::StdioTransport transport;
        server->run(transport, shutdown_source.token());

        if (received_signal != 0) {
            spdlog::info("Received signal {}, shut down gracefully", static_cast<int>(received_signal));
        }
        spdlog::info("Server stopped cleanly");
        return 0;

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}

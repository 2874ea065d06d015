#include "ServerBuilder.hpp"
#include "StdioTransport.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace mcpkit {

ServerBuilder& ServerBuilder::with_name(std::string name) {
    options_.name = std::move(name);
    return *this;
}

ServerBuilder& ServerBuilder::with_version(std::string version) {
    options_.version = std::move(version);
    return *this;
}

ServerBuilder& ServerBuilder::with_server_info(std::string name, std::string version) {
    return with_name(std::move(name)).with_version(std::move(version));
}

ServerBuilder& ServerBuilder::configure_options(const std::function<void(ServerOptions&)>& configure) {
    if (configure) {
        configure(options_);
    }
    return *this;
}

ServerBuilder& ServerBuilder::with_transport(std::unique_ptr<ITransport> transport) {
    if (!transport) {
        throw std::invalid_argument("Transport cannot be null");
    }
    transport_ = std::move(transport);
    return *this;
}

ServerBuilder& ServerBuilder::use_stdio() {
    transport_ = std::make_unique<StdioTransport>();
    return *this;
}

ServerBuilder& ServerBuilder::add_tool(std::shared_ptr<ITool> tool) {
    if (!tool) {
        throw std::invalid_argument("Tool cannot be null");
    }
    tools_.push_back(std::move(tool));
    return *this;
}

ServerBuilder& ServerBuilder::add_tools(const std::vector<std::shared_ptr<ITool>>& tools) {
    for (const auto& tool : tools) {
        add_tool(tool);
    }
    return *this;
}

std::unique_ptr<MCPServer> ServerBuilder::build() const {
    auto server = std::make_unique<MCPServer>(options_);
    for (const auto& tool : tools_) {
        server->register_tool(tool);
    }
    spdlog::debug("Built server '{}' with {} tools", options_.name, tools_.size());
    return server;
}

void ServerBuilder::build_and_run(const CancellationToken& token) {
    if (!transport_) {
        use_stdio();
    }
    auto server = build();
    auto transport = std::move(transport_);
    server->run(*transport, token);
}

} // namespace mcpkit

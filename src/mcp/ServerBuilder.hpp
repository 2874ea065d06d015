#pragma once

#include "ITool.hpp"
#include "ITransport.hpp"
#include "MCPServer.hpp"
#include "core/CancellationToken.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace mcpkit {

/**
 * @brief Fluent setup of an MCPServer and its transport
 *
 * auto server = ServerBuilder()
 *     .with_server_info("files", "1.2.0")
 *     .add_tools(filesystem_tools(guard))
 *     .build();
 */
class ServerBuilder {
public:
    ServerBuilder& with_name(std::string name);
    ServerBuilder& with_version(std::string version);
    ServerBuilder& with_server_info(std::string name, std::string version);
    ServerBuilder& configure_options(const std::function<void(ServerOptions&)>& configure);

    /**
     * @brief Transport used by build_and_run()
     */
    ServerBuilder& with_transport(std::unique_ptr<ITransport> transport);

    /**
     * @brief Use StdioTransport over std::cin / std::cout
     */
    ServerBuilder& use_stdio();

    ServerBuilder& add_tool(std::shared_ptr<ITool> tool);
    ServerBuilder& add_tools(const std::vector<std::shared_ptr<ITool>>& tools);

    const ServerOptions& options() const { return options_; }

    /**
     * @brief Create the server with all added tools registered
     * @throws std::invalid_argument on duplicate tool names
     */
    std::unique_ptr<MCPServer> build() const;

    /**
     * @brief Build and run over the configured transport (stdio if none)
     *
     * The transport is consumed; the builder cannot run a second time.
     */
    void build_and_run(const CancellationToken& token = {});

private:
    ServerOptions options_;
    std::unique_ptr<ITransport> transport_;
    std::vector<std::shared_ptr<ITool>> tools_;
};

} // namespace mcpkit

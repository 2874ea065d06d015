#pragma once

#include "ITool.hpp"
#include "ITransport.hpp"
#include "JsonRpc.hpp"
#include "McpTypes.hpp"
#include "ToolRegistry.hpp"
#include "core/CancellationToken.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpkit {

using json = nlohmann::json;

/**
 * @brief Server identity and advertised feature areas
 */
struct ServerOptions {
    std::string name = "mcpkit server";
    std::string version = "1.0.0";
    bool enable_tools = true;
    bool enable_resources = false;
    bool enable_prompts = false;
};

enum class ServerState {
    Idle,
    Running,
    Draining,
    Closed
};

struct ServerEvent {
    std::string server_name;
    std::chrono::system_clock::time_point timestamp;
};

struct ToolExecutionEvent {
    std::string tool_name;
    bool success = false;
    std::chrono::milliseconds duration{0};
    std::optional<std::string> error_message;
};

/**
 * @brief MCP Server implementing JSON-RPC 2.0 protocol
 *
 * Owns the tool registry and runs the read-dispatch-write loop over a
 * transport. Requests are handled one at a time, so responses leave in the
 * order requests arrived.
 * Supports methods: initialize, ping, tools/list, tools/call
 *
 * Lifecycle: Idle -> Running -> Draining -> Closed. A closed server cannot
 * be run again.
 */
class MCPServer {
public:
    using LifecycleListener = std::function<void(const ServerEvent&)>;
    using ToolExecutedListener = std::function<void(const ToolExecutionEvent&)>;

    explicit MCPServer(ServerOptions options = {});

    /**
     * @brief Register a tool
     * @throws std::invalid_argument on null tool or duplicate name
     */
    void register_tool(std::shared_ptr<ITool> tool);

    bool unregister_tool(const std::string& name);

    ToolRegistry& registry() { return registry_; }
    const ToolRegistry& registry() const { return registry_; }

    /**
     * @brief Subscribe to lifecycle and execution events
     *
     * Listeners run on the server thread; exceptions they throw are logged
     * and discarded.
     */
    void on_started(LifecycleListener listener);
    void on_stopped(LifecycleListener listener);
    void on_tool_executed(ToolExecutedListener listener);

    /**
     * @brief Start server main loop
     *
     * Blocks until the peer disconnects, stop() is called, the token is
     * cancelled, or the transport fails. The transport is closed on exit.
     * stop() and cancellation take effect once the current read returns.
     *
     * @throws std::logic_error if the server is running or already closed
     * @throws TransportError if the connection faulted
     */
    void run(ITransport& transport, const CancellationToken& token = {});

    /**
     * @brief Signal server to stop gracefully
     */
    void stop();

    ServerState state() const { return state_; }
    const ServerOptions& options() const { return options_; }

    /**
     * @brief Capabilities as they would be reported right now
     */
    ServerCapabilities capabilities() const;

    /**
     * @brief Dispatch one request
     * @return Response, or nullopt for notifications
     */
    std::optional<JsonRpcResponse> handle_request(const JsonRpcRequest& request,
                                                  const CancellationToken& token = {});

    /**
     * @brief Look up and execute a tool, emitting a tool-executed event
     * @throws ToolError for unknown tools and any execution failure
     */
    ToolResponse execute_tool(const std::string& name,
                              const std::optional<json>& arguments,
                              const CancellationToken& token = {});

private:
    json handle_initialize(const std::optional<json>& params);
    json handle_tools_list() const;
    json handle_tools_call(const std::optional<json>& params, const CancellationToken& token);

    void send(ITransport& transport, const JsonRpcResponse& response);
    void drain(ITransport& transport);

    void notify_started();
    void notify_stopped();
    void notify_tool_executed(const ToolExecutionEvent& event);

    ServerOptions options_;
    ToolRegistry registry_;
    std::atomic<ServerState> state_{ServerState::Idle};
    std::atomic<bool> stop_requested_{false};

    std::mutex listeners_mutex_;
    std::vector<LifecycleListener> started_listeners_;
    std::vector<LifecycleListener> stopped_listeners_;
    std::vector<ToolExecutedListener> tool_executed_listeners_;
};

} // namespace mcpkit

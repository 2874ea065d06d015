#include "MCPServer.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mcpkit {

namespace {

std::chrono::milliseconds elapsed_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

template <typename Listener, typename Event>
void dispatch_event(const std::vector<Listener>& listeners, const Event& event, const char* kind) {
    for (const auto& listener : listeners) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            spdlog::warn("{} listener failed: {}", kind, e.what());
        } catch (...) {
            spdlog::warn("{} listener failed: unknown exception", kind);
        }
    }
}

} // namespace

MCPServer::MCPServer(ServerOptions options)
    : options_(std::move(options)) {
    spdlog::info("MCPServer initialized: {} {}", options_.name, options_.version);
}

void MCPServer::register_tool(std::shared_ptr<ITool> tool) {
    registry_.register_tool(std::move(tool));
}

bool MCPServer::unregister_tool(const std::string& name) {
    return registry_.unregister_tool(name);
}

void MCPServer::on_started(LifecycleListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    started_listeners_.push_back(std::move(listener));
}

void MCPServer::on_stopped(LifecycleListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    stopped_listeners_.push_back(std::move(listener));
}

void MCPServer::on_tool_executed(ToolExecutedListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    tool_executed_listeners_.push_back(std::move(listener));
}

void MCPServer::run(ITransport& transport, const CancellationToken& token) {
    ServerState expected = ServerState::Idle;
    if (!state_.compare_exchange_strong(expected, ServerState::Running)) {
        if (expected == ServerState::Closed) {
            throw std::logic_error("Server is closed and cannot be run again");
        }
        throw std::logic_error("Server is already running");
    }

    spdlog::info("MCPServer starting main loop");
    notify_started();

    try {
        while (!stop_requested_ && !token.is_cancelled() && transport.is_connected()) {
            std::optional<JsonRpcMessage> message;
            try {
                message = transport.read_message(token);
            } catch (const TransportError& e) {
                if (e.connection_closed()) {
                    spdlog::error("Transport failed: {}", e.what());
                    throw;
                }
                spdlog::warn("Rejected malformed message: {}", e.what());
                const char* text = e.code() == JsonRpcErrorCode::ParseError ? "Parse error" : "Invalid Request";
                send(transport, JsonRpcResponse::failure(e.id(), e.code(), text, json(e.what())));
                continue;
            } catch (const OperationCancelled&) {
                spdlog::info("Read cancelled");
                break;
            }

            // nullopt indicates orderly disconnect by the peer
            if (!message) {
                spdlog::info("Input closed, stopping server");
                break;
            }

            if (const auto* response = std::get_if<JsonRpcResponse>(&*message)) {
                spdlog::debug("Ignoring response message with id={}", response->id().dump());
                continue;
            }

            auto response = handle_request(std::get<JsonRpcRequest>(*message), token);
            if (response) {
                send(transport, *response);
            }
        }
    } catch (...) {
        drain(transport);
        throw;
    }

    drain(transport);
}

void MCPServer::stop() {
    spdlog::info("MCPServer stop requested");
    stop_requested_ = true;
}

ServerCapabilities MCPServer::capabilities() const {
    ServerCapabilities capabilities;
    if (options_.enable_tools && !registry_.empty()) {
        capabilities.tools = ServerCapabilities::Tools{};
    }
    if (options_.enable_resources) {
        capabilities.resources = ServerCapabilities::Resources{};
    }
    if (options_.enable_prompts) {
        capabilities.prompts = ServerCapabilities::Prompts{};
    }
    return capabilities;
}

std::optional<JsonRpcResponse> MCPServer::handle_request(const JsonRpcRequest& request,
                                                         const CancellationToken& token) {
    json id = request.id.value_or(json());
    const std::string& method = request.method;

    spdlog::debug("Handling request: method={}, id={}", method, id.dump());

    std::optional<JsonRpcResponse> response;
    try {
        if (method == "initialize") {
            response = JsonRpcResponse::success(id, handle_initialize(request.params));
        } else if (method == "notifications/initialized") {
            spdlog::info("Client sent initialized notification, server is ready");
            response = JsonRpcResponse::success(id, json::object());
        } else if (method == "ping") {
            response = JsonRpcResponse::success(id, json::object());
        } else if (method == "tools/list") {
            response = JsonRpcResponse::success(id, handle_tools_list());
        } else if (method == "tools/call") {
            response = JsonRpcResponse::success(id, handle_tools_call(request.params, token));
        } else {
            response = JsonRpcResponse::failure(id, JsonRpcErrorCode::MethodNotFound,
                                                "Method not found: " + method);
        }
    } catch (const ProtocolError& e) {
        spdlog::warn("Invalid {} request: {}", method, e.what());
        response = JsonRpcResponse::failure(id, e.code(), e.what());
    } catch (const ToolError& e) {
        spdlog::warn("Tool error in {}: {}", method, e.what());
        std::optional<json> data;
        if (e.detail()) {
            data = *e.detail();
        }
        response = JsonRpcResponse::failure(id, JsonRpcErrorCode::InvalidRequest, e.what(), data);
    } catch (const std::exception& e) {
        spdlog::error("Error handling method {}: {}", method, e.what());
        response = JsonRpcResponse::failure(id, JsonRpcErrorCode::InternalError,
                                            "Internal error", json(e.what()));
    } catch (...) {
        spdlog::error("Error handling method {}: unknown exception", method);
        response = JsonRpcResponse::failure(id, JsonRpcErrorCode::InternalError,
                                            "Internal error", json("unknown exception"));
    }

    if (request.is_notification()) {
        return std::nullopt;
    }
    return response;
}

ToolResponse MCPServer::execute_tool(const std::string& name,
                                     const std::optional<json>& arguments,
                                     const CancellationToken& token) {
    auto tool = registry_.get(name);
    if (!tool) {
        throw ToolError(ToolError::Kind::NotFound, "Tool '" + name + "' not found");
    }

    spdlog::debug("Calling tool: {} with args: {}", name,
                  arguments ? arguments->dump() : std::string("<none>"));

    auto start = std::chrono::steady_clock::now();
    try {
        ToolResponse response = tool->execute(arguments, token);
        auto duration = elapsed_since(start);
        spdlog::debug("Tool {} completed in {} ms", name, duration.count());
        notify_tool_executed({name, true, duration, std::nullopt});
        return response;
    } catch (const ToolError& e) {
        notify_tool_executed({name, false, elapsed_since(start), std::string(e.what())});
        throw;
    } catch (const OperationCancelled& e) {
        notify_tool_executed({name, false, elapsed_since(start), std::string(e.what())});
        throw ToolError(ToolError::Kind::Cancelled, "Tool '" + name + "' was cancelled",
                        true, std::string(e.what()));
    } catch (const std::exception& e) {
        notify_tool_executed({name, false, elapsed_since(start), std::string(e.what())});
        throw ToolError(ToolError::Kind::ExecutionFailed, "Tool '" + name + "' execution failed",
                        false, std::string(e.what()));
    } catch (...) {
        notify_tool_executed({name, false, elapsed_since(start), std::string("unknown exception")});
        throw ToolError(ToolError::Kind::ExecutionFailed, "Tool '" + name + "' execution failed",
                        false, std::string("unknown exception"));
    }
}

json MCPServer::handle_initialize(const std::optional<json>& params) {
    spdlog::info("Handling initialize request");

    if (params && params->is_object() && params->contains("clientInfo")) {
        const json& client = (*params)["clientInfo"];
        if (client.is_object()) {
            spdlog::info("Client: {} version {}",
                         client.value("name", "unknown"), client.value("version", "unknown"));
        }
    }

    InitializeResult result;
    result.capabilities = capabilities();
    result.server_info = ServerInfo{options_.name, options_.version};
    return json(result);
}

json MCPServer::handle_tools_list() const {
    json tools_array = json::array();

    for (const auto& tool : registry_.list()) {
        tools_array.push_back(json(tool->descriptor()));
    }

    spdlog::debug("Returning {} tools", tools_array.size());
    return {{"tools", tools_array}};
}

json MCPServer::handle_tools_call(const std::optional<json>& params, const CancellationToken& token) {
    if (!params || !params->is_object()) {
        throw ProtocolError(JsonRpcErrorCode::InvalidParams, "Missing parameters");
    }

    auto name_it = params->find("name");
    if (name_it == params->end() || !name_it->is_string() || name_it->get<std::string>().empty()) {
        throw ProtocolError(JsonRpcErrorCode::InvalidParams, "Missing required parameter: name");
    }

    ToolCallParams call = params->get<ToolCallParams>();
    return json(execute_tool(call.name, call.arguments, token));
}

void MCPServer::send(ITransport& transport, const JsonRpcResponse& response) {
    // a computed response is delivered even if cancellation was requested meanwhile
    transport.write_message(response, CancellationToken());
}

void MCPServer::drain(ITransport& transport) {
    state_ = ServerState::Draining;

    try {
        transport.close();
    } catch (const std::exception& e) {
        spdlog::error("Error closing transport: {}", e.what());
    }

    notify_stopped();
    state_ = ServerState::Closed;
    spdlog::info("MCPServer stopped");
}

void MCPServer::notify_started() {
    std::vector<LifecycleListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners = started_listeners_;
    }
    dispatch_event(listeners, ServerEvent{options_.name, std::chrono::system_clock::now()}, "Started");
}

void MCPServer::notify_stopped() {
    std::vector<LifecycleListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners = stopped_listeners_;
    }
    dispatch_event(listeners, ServerEvent{options_.name, std::chrono::system_clock::now()}, "Stopped");
}

void MCPServer::notify_tool_executed(const ToolExecutionEvent& event) {
    std::vector<ToolExecutedListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners = tool_executed_listeners_;
    }
    dispatch_event(listeners, event, "Tool executed");
}

} // namespace mcpkit

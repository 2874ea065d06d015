#pragma once

#include "mcp/ITransport.hpp"
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <nlohmann/json.hpp>

namespace mcpkit {

/**
 * @brief Mock transport for testing MCP server
 *
 * Uses queues for simulating request/response flow without actual I/O.
 * Input lines are decoded like StdioTransport does; an exhausted input
 * queue reads as orderly disconnect.
 */
class MockTransport : public ITransport {
public:
    MockTransport() = default;

    std::optional<JsonRpcMessage> read_message(const CancellationToken& token) override;
    void write_message(const JsonRpcMessage& message, const CancellationToken& token) override;
    bool is_connected() const override;
    void close() override;

    /**
     * @brief Add a request to the input queue
     * @param request JSON-RPC request
     */
    void push_request(const json& request);

    /**
     * @brief Add a raw input line (may be malformed)
     */
    void push_line(const std::string& line);

    /**
     * @brief Make the next read fail as if the stream faulted
     */
    void push_stream_failure();

    /**
     * @brief Get and remove response from output queue
     * @return JSON-RPC response, null if none
     */
    json pop_response();

    /**
     * @brief Check if there are pending responses
     */
    bool has_responses() const;

    size_t response_count() const;

    bool was_closed() const;

private:
    mutable std::mutex mutex_;
    std::queue<std::optional<std::string>> inputs_;  // nullopt = stream failure
    std::queue<json> responses_;
    bool open_ = true;
    bool closed_ = false;
};

} // namespace mcpkit

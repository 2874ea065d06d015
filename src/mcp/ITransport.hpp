#pragma once

#include "JsonRpc.hpp"
#include "core/CancellationToken.hpp"
#include <optional>
#include <stdexcept>
#include <string>

namespace mcpkit {

/**
 * @brief Failure reading or writing the message stream
 *
 * connection_closed() == true means the underlying stream faulted and the
 * connection is gone. Otherwise only the current message was bad (code and
 * id describe the error response to send back).
 */
class TransportError : public std::runtime_error {
public:
    TransportError(const std::string& message,
                   int code = JsonRpcErrorCode::ParseError,
                   json id = nullptr,
                   bool connection_closed = false)
        : std::runtime_error(message)
        , code_(code)
        , id_(std::move(id))
        , connection_closed_(connection_closed) {}

    static TransportError closed(const std::string& message) {
        return TransportError(message, JsonRpcErrorCode::InternalError, nullptr, true);
    }

    int code() const { return code_; }
    const json& id() const { return id_; }
    bool connection_closed() const { return connection_closed_; }

private:
    int code_;
    json id_;
    bool connection_closed_;
};

/**
 * @brief Abstract interface for MCP transport mechanisms
 *
 * Implementations handle reading/writing JSON-RPC messages via different
 * transport protocols (stdio, pipes, sockets, etc.)
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Read next JSON-RPC message from transport
     * @return Message, or nullopt when the peer disconnected in an orderly way
     * @throws TransportError on malformed input or stream failure
     */
    virtual std::optional<JsonRpcMessage> read_message(const CancellationToken& token) = 0;

    /**
     * @brief Write JSON-RPC message to transport
     * @throws TransportError (connection_closed) if the stream faulted
     */
    virtual void write_message(const JsonRpcMessage& message, const CancellationToken& token) = 0;

    /**
     * @brief Check if transport is still connected
     */
    virtual bool is_connected() const = 0;

    virtual void close() = 0;
};

} // namespace mcpkit

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <nlohmann/json.hpp>

namespace mcpkit {

using json = nlohmann::json;

inline constexpr const char* kJsonRpcVersion = "2.0";

/**
 * @brief JSON-RPC 2.0 error codes used on the wire
 */
namespace JsonRpcErrorCode {
    inline constexpr int ParseError = -32700;
    inline constexpr int InvalidRequest = -32600;
    inline constexpr int MethodNotFound = -32601;
    inline constexpr int InvalidParams = -32602;
    inline constexpr int InternalError = -32603;
} // namespace JsonRpcErrorCode

/**
 * @brief Raised when a JSON value is not a structurally valid JSON-RPC message
 */
class ProtocolError : public std::runtime_error {
public:
    ProtocolError(int code, const std::string& message, json id = nullptr)
        : std::runtime_error(message), code_(code), id_(std::move(id)) {}

    int code() const { return code_; }

    /**
     * @brief Id of the offending request if it could be recovered, else null
     */
    const json& id() const { return id_; }

private:
    int code_;
    json id_;
};

struct JsonRpcError {
    int code = JsonRpcErrorCode::InternalError;
    std::string message;
    std::optional<json> data;
};

/**
 * @brief JSON-RPC request; absent or null id marks a notification
 */
struct JsonRpcRequest {
    std::string jsonrpc = kJsonRpcVersion;
    std::optional<json> id;
    std::string method;
    std::optional<json> params;

    bool is_notification() const { return !id || id->is_null(); }
};

/**
 * @brief JSON-RPC response carrying exactly one of result or error
 *
 * Build through success() / failure() to keep that invariant.
 */
class JsonRpcResponse {
public:
    static JsonRpcResponse success(json id, json result);
    static JsonRpcResponse failure(json id, JsonRpcError error);
    static JsonRpcResponse failure(json id, int code, std::string message,
                                   std::optional<json> data = std::nullopt);

    const json& id() const { return id_; }
    bool is_error() const { return error_.has_value(); }
    const std::optional<json>& result() const { return result_; }
    const std::optional<JsonRpcError>& error() const { return error_; }

private:
    JsonRpcResponse() = default;

    json id_;
    std::optional<json> result_;
    std::optional<JsonRpcError> error_;
};

using JsonRpcMessage = std::variant<JsonRpcRequest, JsonRpcResponse>;

void to_json(json& j, const JsonRpcError& error);
void from_json(const json& j, JsonRpcError& error);

void to_json(json& j, const JsonRpcRequest& request);
void to_json(json& j, const JsonRpcResponse& response);
void to_json(json& j, const JsonRpcMessage& message);

/**
 * @brief Decode a request object
 * @throws ProtocolError (-32600) if jsonrpc or method is missing or malformed
 */
JsonRpcRequest parse_request(const json& j);

/**
 * @brief Decode a response object
 * @throws ProtocolError (-32600) unless exactly one of result/error is present
 */
JsonRpcResponse parse_response(const json& j);

/**
 * @brief Decode one wire line
 *
 * Lines containing a "method" key are decoded as requests, anything else as
 * a response.
 * @throws ProtocolError (-32700) on malformed JSON, (-32600) on bad structure
 */
JsonRpcMessage parse_message(std::string_view line);

/**
 * @brief Encode a message as a single compact JSON line (no trailing newline)
 */
std::string serialize_message(const JsonRpcMessage& message);

} // namespace mcpkit

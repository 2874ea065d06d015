#include "JsonRpc.hpp"

namespace mcpkit {

JsonRpcResponse JsonRpcResponse::success(json id, json result) {
    JsonRpcResponse response;
    response.id_ = std::move(id);
    response.result_ = std::move(result);
    return response;
}

JsonRpcResponse JsonRpcResponse::failure(json id, JsonRpcError error) {
    JsonRpcResponse response;
    response.id_ = std::move(id);
    response.error_ = std::move(error);
    return response;
}

JsonRpcResponse JsonRpcResponse::failure(json id, int code, std::string message,
                                         std::optional<json> data) {
    return failure(std::move(id), JsonRpcError{code, std::move(message), std::move(data)});
}

void to_json(json& j, const JsonRpcError& error) {
    j = {
        {"code", error.code},
        {"message", error.message}
    };
    if (error.data) {
        j["data"] = *error.data;
    }
}

void from_json(const json& j, JsonRpcError& error) {
    error.code = j.at("code").get<int>();
    error.message = j.at("message").get<std::string>();
    if (j.contains("data")) {
        error.data = j["data"];
    } else {
        error.data.reset();
    }
}

void to_json(json& j, const JsonRpcRequest& request) {
    j = {
        {"jsonrpc", request.jsonrpc},
        {"method", request.method}
    };
    if (request.id) {
        j["id"] = *request.id;
    }
    if (request.params) {
        j["params"] = *request.params;
    }
}

void to_json(json& j, const JsonRpcResponse& response) {
    j = {
        {"jsonrpc", kJsonRpcVersion},
        {"id", response.id()}
    };
    if (response.error()) {
        j["error"] = *response.error();
    } else {
        j["result"] = response.result().value_or(json::object());
    }
}

void to_json(json& j, const JsonRpcMessage& message) {
    std::visit([&j](const auto& m) { to_json(j, m); }, message);
}

JsonRpcRequest parse_request(const json& j) {
    json id = j.value("id", json());

    if (!j.contains("jsonrpc") || j["jsonrpc"] != kJsonRpcVersion) {
        throw ProtocolError(JsonRpcErrorCode::InvalidRequest,
                            "Invalid Request: missing or invalid jsonrpc field", id);
    }
    if (!j.contains("method") || !j["method"].is_string()) {
        throw ProtocolError(JsonRpcErrorCode::InvalidRequest,
                            "Invalid Request: method must be a string", id);
    }

    JsonRpcRequest request;
    request.method = j["method"].get<std::string>();
    if (request.method.empty()) {
        throw ProtocolError(JsonRpcErrorCode::InvalidRequest,
                            "Invalid Request: method is empty", id);
    }
    if (j.contains("id")) {
        request.id = j["id"];
    }
    if (j.contains("params") && !j["params"].is_null()) {
        request.params = j["params"];
    }
    return request;
}

JsonRpcResponse parse_response(const json& j) {
    json id = j.value("id", json());
    bool has_result = j.contains("result");
    bool has_error = j.contains("error") && !j["error"].is_null();

    if (has_result == has_error) {
        throw ProtocolError(JsonRpcErrorCode::InvalidRequest,
                            "Invalid Response: exactly one of result or error is required", id);
    }

    if (has_result) {
        return JsonRpcResponse::success(id, j["result"]);
    }

    try {
        return JsonRpcResponse::failure(id, j["error"].get<JsonRpcError>());
    } catch (const json::exception& e) {
        throw ProtocolError(JsonRpcErrorCode::InvalidRequest,
                            std::string("Invalid Response: malformed error object: ") + e.what(), id);
    }
}

JsonRpcMessage parse_message(std::string_view line) {
    json j;
    try {
        j = json::parse(line.begin(), line.end());
    } catch (const json::parse_error& e) {
        throw ProtocolError(JsonRpcErrorCode::ParseError, std::string("Parse error: ") + e.what());
    }

    if (!j.is_object()) {
        throw ProtocolError(JsonRpcErrorCode::InvalidRequest,
                            "Invalid Request: message must be a JSON object");
    }

    if (j.contains("method")) {
        return parse_request(j);
    }
    return parse_response(j);
}

std::string serialize_message(const JsonRpcMessage& message) {
    json j;
    to_json(j, message);
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace mcpkit

#pragma once

#include "schema/SchemaNode.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpkit {

using json = nlohmann::json;

inline constexpr const char* kMcpProtocolVersion = "2024-11-05";

/**
 * @brief Feature areas advertised during initialize; unset means absent
 */
struct ServerCapabilities {
    struct Tools {};
    struct Resources {
        bool subscribe = false;
        bool list_changed = false;
    };
    struct Prompts {};

    std::optional<Tools> tools;
    std::optional<Resources> resources;
    std::optional<Prompts> prompts;
};

struct ServerInfo {
    std::string name;
    std::string version;
};

struct InitializeResult {
    std::string protocol_version = kMcpProtocolVersion;
    ServerCapabilities capabilities;
    ServerInfo server_info;
};

/**
 * @brief Wire-visible summary of a tool, as returned by tools/list
 */
struct ToolDescriptor {
    std::string name;
    std::optional<std::string> description;
    SchemaNode input_schema;
};

struct ToolCallParams {
    std::string name;
    std::optional<json> arguments;
};

struct ContentPart {
    std::string type = "text";
    std::string text;
};

/**
 * @brief Result of a tool execution
 *
 * Content order is preserved to the client. is_error: true = failure,
 * false = explicit success, unset = unspecified.
 */
struct ToolResponse {
    std::vector<ContentPart> content;
    std::optional<bool> is_error;

    /**
     * @brief Single text part, is_error unset
     */
    static ToolResponse success(std::string text);

    /**
     * @brief Single text part, is_error = true
     */
    static ToolResponse error(std::string text);
};

/**
 * @brief Fluent construction of multi-part tool responses
 */
class ToolResponseBuilder {
public:
    static ToolResponseBuilder create() { return ToolResponseBuilder(); }

    ToolResponseBuilder& with_content(std::string text);
    ToolResponseBuilder& with_contents(const std::vector<std::string>& texts);
    ToolResponseBuilder& with_typed_content(std::string type, std::string text);

    /**
     * @brief Append message and mark the response as failed
     */
    ToolResponseBuilder& with_error(std::string message);

    /**
     * @brief Append "Warning: <message>" without changing the error flag
     */
    ToolResponseBuilder& with_warning(const std::string& message);

    /**
     * @brief Append message and mark the response as explicitly successful
     */
    ToolResponseBuilder& with_success(std::string message);

    ToolResponseBuilder& clear();

    ToolResponse build() const;

    static ToolResponse success(std::string message);
    static ToolResponse error(std::string message);

private:
    std::vector<ContentPart> parts_;
    std::optional<bool> is_error_;
};

void to_json(json& j, const ServerCapabilities& capabilities);
void to_json(json& j, const ServerInfo& info);
void to_json(json& j, const InitializeResult& result);
void to_json(json& j, const ToolDescriptor& descriptor);

void from_json(const json& j, ToolCallParams& params);

void to_json(json& j, const ContentPart& part);
void from_json(const json& j, ContentPart& part);

void to_json(json& j, const ToolResponse& response);
void from_json(const json& j, ToolResponse& response);

} // namespace mcpkit

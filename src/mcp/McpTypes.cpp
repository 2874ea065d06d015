#include "McpTypes.hpp"

namespace mcpkit {

ToolResponse ToolResponse::success(std::string text) {
    return ToolResponseBuilder::create().with_content(std::move(text)).build();
}

ToolResponse ToolResponse::error(std::string text) {
    return ToolResponseBuilder::create().with_error(std::move(text)).build();
}

ToolResponseBuilder& ToolResponseBuilder::with_content(std::string text) {
    parts_.push_back({"text", std::move(text)});
    return *this;
}

ToolResponseBuilder& ToolResponseBuilder::with_contents(const std::vector<std::string>& texts) {
    for (const auto& text : texts) {
        with_content(text);
    }
    return *this;
}

ToolResponseBuilder& ToolResponseBuilder::with_typed_content(std::string type, std::string text) {
    parts_.push_back({std::move(type), std::move(text)});
    return *this;
}

ToolResponseBuilder& ToolResponseBuilder::with_error(std::string message) {
    is_error_ = true;
    return with_content(std::move(message));
}

ToolResponseBuilder& ToolResponseBuilder::with_warning(const std::string& message) {
    return with_content("Warning: " + message);
}

ToolResponseBuilder& ToolResponseBuilder::with_success(std::string message) {
    is_error_ = false;
    return with_content(std::move(message));
}

ToolResponseBuilder& ToolResponseBuilder::clear() {
    parts_.clear();
    is_error_.reset();
    return *this;
}

ToolResponse ToolResponseBuilder::build() const {
    return ToolResponse{parts_, is_error_};
}

ToolResponse ToolResponseBuilder::success(std::string message) {
    return create().with_success(std::move(message)).build();
}

ToolResponse ToolResponseBuilder::error(std::string message) {
    return create().with_error(std::move(message)).build();
}

void to_json(json& j, const ServerCapabilities& capabilities) {
    j = json::object();
    if (capabilities.tools) {
        j["tools"] = json::object();
    }
    if (capabilities.resources) {
        j["resources"] = {
            {"subscribe", capabilities.resources->subscribe},
            {"listChanged", capabilities.resources->list_changed}
        };
    }
    if (capabilities.prompts) {
        j["prompts"] = json::object();
    }
}

void to_json(json& j, const ServerInfo& info) {
    j = {
        {"name", info.name},
        {"version", info.version}
    };
}

void to_json(json& j, const InitializeResult& result) {
    j = {
        {"protocolVersion", result.protocol_version},
        {"capabilities", result.capabilities},
        {"serverInfo", result.server_info}
    };
}

void to_json(json& j, const ToolDescriptor& descriptor) {
    j = {
        {"name", descriptor.name},
        {"inputSchema", descriptor.input_schema}
    };
    if (descriptor.description) {
        j["description"] = *descriptor.description;
    }
}

void from_json(const json& j, ToolCallParams& params) {
    params.name = j.at("name").get<std::string>();
    if (j.contains("arguments") && !j["arguments"].is_null()) {
        params.arguments = j["arguments"];
    } else {
        params.arguments.reset();
    }
}

void to_json(json& j, const ContentPart& part) {
    j = {
        {"type", part.type},
        {"text", part.text}
    };
}

void from_json(const json& j, ContentPart& part) {
    part.type = j.value("type", "text");
    part.text = j.at("text").get<std::string>();
}

void to_json(json& j, const ToolResponse& response) {
    j = {{"content", response.content}};
    if (response.is_error) {
        j["isError"] = *response.is_error;
    }
}

void from_json(const json& j, ToolResponse& response) {
    response.content = j.at("content").get<std::vector<ContentPart>>();
    if (j.contains("isError") && !j["isError"].is_null()) {
        response.is_error = j["isError"].get<bool>();
    } else {
        response.is_error.reset();
    }
}

} // namespace mcpkit

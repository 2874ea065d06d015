#include "SchemaNode.hpp"

namespace mcpkit {

SchemaNode SchemaNode::empty_object() {
    SchemaNode node;
    node.type = "object";
    return node;
}

void to_json(json& j, const SchemaNode& node) {
    j = json::object();
    j["type"] = node.type;

    if (node.description) {
        j["description"] = *node.description;
    }

    if (node.type == "object") {
        json properties = json::object();
        for (const auto& [name, property] : node.properties) {
            properties[name] = property;
        }
        j["properties"] = std::move(properties);

        if (!node.required.empty()) {
            j["required"] = node.required;
        }
    }

    if (node.items) {
        j["items"] = *node.items;
    }
    if (node.min_items) {
        j["minItems"] = *node.min_items;
    }
    if (node.max_items) {
        j["maxItems"] = *node.max_items;
    }
    if (node.unique_items) {
        j["uniqueItems"] = true;
    }

    if (node.enum_values) {
        j["enum"] = *node.enum_values;
    }

    if (node.min_length) {
        j["minLength"] = *node.min_length;
    }
    if (node.max_length) {
        j["maxLength"] = *node.max_length;
    }
    if (node.pattern) {
        j["pattern"] = *node.pattern;
    }
    if (node.format) {
        j["format"] = *node.format;
    }

    if (node.minimum) {
        j["minimum"] = *node.minimum;
    }
    if (node.maximum) {
        j["maximum"] = *node.maximum;
    }
}

} // namespace mcpkit

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpkit {

using json = nlohmann::json;

/**
 * @brief One node of a generated JSON Schema
 *
 * Constraint fields are only meaningful for the matching type: string
 * constraints for "string", minimum/maximum for "integer"/"number",
 * item constraints for "array". Unset optionals are not serialized.
 */
struct SchemaNode {
    std::string type = "object";
    std::optional<std::string> description;

    // object, properties in declaration order
    std::vector<std::pair<std::string, SchemaNode>> properties;
    std::vector<std::string> required;  // omitted from JSON when empty

    // array
    std::shared_ptr<SchemaNode> items;
    std::optional<int> min_items;
    std::optional<int> max_items;
    bool unique_items = false;

    std::optional<std::vector<json>> enum_values;

    // string
    std::optional<int> min_length;
    std::optional<int> max_length;
    std::optional<std::string> pattern;
    std::optional<std::string> format;

    // number / integer
    std::optional<double> minimum;
    std::optional<double> maximum;

    /**
     * @brief Schema of an object with no properties (no-argument tools)
     */
    static SchemaNode empty_object();
};

void to_json(json& j, const SchemaNode& node);

} // namespace mcpkit

#pragma once

#include "SchemaNode.hpp"
#include "TypeShape.hpp"

namespace mcpkit {

/**
 * @brief Derives JSON Schema nodes from declared type shapes
 *
 * Mapping:
 * - String -> "string", Boolean -> "boolean"
 * - Integer -> "integer", Number -> "number"
 * - Array -> "array" with items
 * - Enum -> "string" with enum of member names
 * - Object -> "object" with properties and required
 * - Optional -> schema of the wrapped shape
 *
 * A field is required when marked required or when its shape is a
 * value kind (Integer, Number, Boolean, Enum) not wrapped in Optional.
 * Field annotations are copied onto the property node as given.
 */
class SchemaGenerator {
public:
    static SchemaNode generate(const TypeShape& shape);

    template <typename T>
    static SchemaNode generate() {
        return generate(shape_of<T>());
    }

    /**
     * @brief Whether a field must be present in the arguments object
     */
    static bool is_required(const FieldShape& field);

private:
    static SchemaNode generate_field(const FieldShape& field);
    static void apply_options(SchemaNode& node, const FieldOptions& options);
};

} // namespace mcpkit

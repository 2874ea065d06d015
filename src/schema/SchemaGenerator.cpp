#include "SchemaGenerator.hpp"
#include <stdexcept>

namespace mcpkit {

namespace {

bool is_value_kind(ShapeKind kind) {
    switch (kind) {
        case ShapeKind::Integer:
        case ShapeKind::Number:
        case ShapeKind::Boolean:
        case ShapeKind::Enum:
            return true;
        default:
            return false;
    }
}

} // namespace

SchemaNode SchemaGenerator::generate(const TypeShape& shape) {
    SchemaNode node;

    switch (shape.kind) {
        case ShapeKind::Optional:
            if (!shape.element) {
                throw std::invalid_argument("Optional shape without inner shape");
            }
            node = generate(*shape.element);
            break;

        case ShapeKind::String:
            node.type = "string";
            break;

        case ShapeKind::Boolean:
            node.type = "boolean";
            break;

        case ShapeKind::Integer:
            node.type = "integer";
            break;

        case ShapeKind::Number:
            node.type = "number";
            break;

        case ShapeKind::Array:
            if (!shape.element) {
                throw std::invalid_argument("Array shape without element shape");
            }
            node.type = "array";
            node.items = std::make_shared<SchemaNode>(generate(*shape.element));
            break;

        case ShapeKind::Enum: {
            node.type = "string";
            std::vector<json> members;
            members.reserve(shape.enum_members.size());
            for (const auto& member : shape.enum_members) {
                members.emplace_back(member);
            }
            node.enum_values = std::move(members);
            break;
        }

        case ShapeKind::Object:
            node.type = "object";
            for (const auto& field : shape.fields) {
                node.properties.emplace_back(field.name, generate_field(field));
                if (is_required(field)) {
                    node.required.push_back(field.name);
                }
            }
            break;
    }

    if (shape.description) {
        node.description = shape.description;
    }

    return node;
}

bool SchemaGenerator::is_required(const FieldShape& field) {
    if (field.options.required) {
        return true;
    }
    return field.shape && is_value_kind(field.shape->kind);
}

SchemaNode SchemaGenerator::generate_field(const FieldShape& field) {
    if (!field.shape) {
        throw std::invalid_argument("Field '" + field.name + "' has no shape");
    }
    SchemaNode node = generate(*field.shape);
    apply_options(node, field.options);
    return node;
}

void SchemaGenerator::apply_options(SchemaNode& node, const FieldOptions& options) {
    if (options.description) {
        node.description = options.description;
    }

    if (options.min_length) {
        node.min_length = options.min_length;
    }
    if (options.max_length) {
        node.max_length = options.max_length;
    }
    if (options.pattern) {
        node.pattern = options.pattern;
    }
    if (options.format) {
        node.format = options.format;
    }

    if (options.minimum) {
        node.minimum = options.minimum;
    }
    if (options.maximum) {
        node.maximum = options.maximum;
    }

    if (options.min_items) {
        node.min_items = options.min_items;
    }
    if (options.max_items) {
        node.max_items = options.max_items;
    }
    if (options.unique_items) {
        node.unique_items = true;
    }

    if (options.enum_values) {
        node.enum_values = options.enum_values;
    }
}

} // namespace mcpkit

#include "TypeShape.hpp"
#include <stdexcept>

namespace mcpkit {

TypeShape TypeShape::primitive(ShapeKind kind) {
    TypeShape shape;
    shape.kind = kind;
    return shape;
}

TypeShape TypeShape::array_of(TypeShape element) {
    TypeShape shape;
    shape.kind = ShapeKind::Array;
    shape.element = std::make_shared<const TypeShape>(std::move(element));
    return shape;
}

TypeShape TypeShape::optional_of(TypeShape inner) {
    TypeShape shape;
    shape.kind = ShapeKind::Optional;
    shape.element = std::make_shared<const TypeShape>(std::move(inner));
    return shape;
}

TypeShape TypeShape::enumeration(std::vector<std::string> members) {
    TypeShape shape;
    shape.kind = ShapeKind::Enum;
    shape.enum_members = std::move(members);
    return shape;
}

const FieldShape* TypeShape::find_field(const std::string& name) const {
    for (const auto& field : fields) {
        if (field.name == name) {
            return &field;
        }
    }
    return nullptr;
}

ObjectShape::ObjectShape(std::optional<std::string> description) {
    shape_.kind = ShapeKind::Object;
    shape_.description = std::move(description);
}

ObjectShape& ObjectShape::add_field(std::string name, TypeShape shape, FieldOptions options) {
    if (name.empty()) {
        throw std::invalid_argument("Field name cannot be empty");
    }
    if (shape_.find_field(name)) {
        throw std::invalid_argument("Duplicate field: " + name);
    }

    shape_.fields.push_back({
        std::move(name),
        std::make_shared<const TypeShape>(std::move(shape)),
        std::move(options)
    });
    return *this;
}

TypeShape ObjectShape::build() const {
    return shape_;
}

} // namespace mcpkit

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpkit {

using json = nlohmann::json;

/**
 * @brief Kind of a declared argument shape
 */
enum class ShapeKind {
    String,
    Boolean,
    Integer,
    Number,
    Array,
    Enum,
    Object,
    Optional  // nullable wrapper around element
};

/**
 * @brief Per-field schema annotations
 *
 * Everything left unset stays unset in the generated schema node.
 */
struct FieldOptions {
    bool required = false;
    std::optional<std::string> description;
    std::optional<int> min_length;
    std::optional<int> max_length;
    std::optional<std::string> pattern;
    std::optional<std::string> format;
    std::optional<double> minimum;
    std::optional<double> maximum;
    std::optional<int> min_items;
    std::optional<int> max_items;
    bool unique_items = false;
    std::optional<std::vector<json>> enum_values;

    FieldOptions& with_required(bool value = true) { required = value; return *this; }
    FieldOptions& with_description(std::string text) { description = std::move(text); return *this; }
    FieldOptions& with_min_length(int value) { min_length = value; return *this; }
    FieldOptions& with_max_length(int value) { max_length = value; return *this; }
    FieldOptions& with_pattern(std::string regex) { pattern = std::move(regex); return *this; }
    FieldOptions& with_format(std::string name) { format = std::move(name); return *this; }
    FieldOptions& with_minimum(double value) { minimum = value; return *this; }
    FieldOptions& with_maximum(double value) { maximum = value; return *this; }
    FieldOptions& with_min_items(int value) { min_items = value; return *this; }
    FieldOptions& with_max_items(int value) { max_items = value; return *this; }
    FieldOptions& with_unique_items(bool value = true) { unique_items = value; return *this; }
    FieldOptions& with_enum(std::vector<json> values) { enum_values = std::move(values); return *this; }
};

struct TypeShape;

struct FieldShape {
    std::string name;
    std::shared_ptr<const TypeShape> shape;
    FieldOptions options;
};

/**
 * @brief Static description of an argument type, consumed by SchemaGenerator
 *
 * Shapes must not be self-referential; the generator recurses without
 * cycle detection.
 */
struct TypeShape {
    ShapeKind kind = ShapeKind::Object;
    std::shared_ptr<const TypeShape> element;  // Array items / Optional inner
    std::vector<std::string> enum_members;
    std::vector<FieldShape> fields;
    std::optional<std::string> description;

    static TypeShape primitive(ShapeKind kind);
    static TypeShape array_of(TypeShape element);
    static TypeShape optional_of(TypeShape inner);
    static TypeShape enumeration(std::vector<std::string> members);

    const FieldShape* find_field(const std::string& name) const;
};

/**
 * @brief Member names of an enum, specialized by the enum's author
 *
 * template <> struct EnumNames<Color> {
 *     static std::vector<std::string> names() { return {"red", "green"}; }
 * };
 */
template <typename E>
struct EnumNames;

template <typename T, typename Enable = void>
struct ShapeTraits {
    // Record types describe themselves
    static TypeShape shape() { return T::shape(); }
};

template <typename T>
TypeShape shape_of() {
    return ShapeTraits<T>::shape();
}

template <>
struct ShapeTraits<std::string> {
    static TypeShape shape() { return TypeShape::primitive(ShapeKind::String); }
};

template <>
struct ShapeTraits<bool> {
    static TypeShape shape() { return TypeShape::primitive(ShapeKind::Boolean); }
};

template <typename T>
struct ShapeTraits<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
    static TypeShape shape() { return TypeShape::primitive(ShapeKind::Integer); }
};

template <typename T>
struct ShapeTraits<T, std::enable_if_t<std::is_floating_point_v<T>>> {
    static TypeShape shape() { return TypeShape::primitive(ShapeKind::Number); }
};

template <typename T>
struct ShapeTraits<T, std::enable_if_t<std::is_enum_v<T>>> {
    static TypeShape shape() { return TypeShape::enumeration(EnumNames<T>::names()); }
};

template <typename T>
struct ShapeTraits<std::vector<T>> {
    static TypeShape shape() { return TypeShape::array_of(shape_of<T>()); }
};

template <typename T>
struct ShapeTraits<std::optional<T>> {
    static TypeShape shape() { return TypeShape::optional_of(shape_of<T>()); }
};

/**
 * @brief Builder for record shapes
 *
 * struct ReadArgs {
 *     std::string path;
 *     static TypeShape shape() {
 *         return ObjectShape()
 *             .field("path", &ReadArgs::path, FieldOptions().with_required())
 *             .build();
 *     }
 * };
 */
class ObjectShape {
public:
    explicit ObjectShape(std::optional<std::string> description = std::nullopt);

    template <typename C, typename F>
    ObjectShape& field(std::string name, F C::*, FieldOptions options = {}) {
        return add_field(std::move(name), shape_of<F>(), std::move(options));
    }

    ObjectShape& add_field(std::string name, TypeShape shape, FieldOptions options = {});

    TypeShape build() const;

private:
    TypeShape shape_;
};

} // namespace mcpkit

#pragma once

#include "ITool.hpp"
#include "schema/SchemaGenerator.hpp"
#include "schema/TypeShape.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace mcpkit {

/**
 * @brief Adapter binding raw JSON arguments to a typed handler
 *
 * TArgs must be default constructible, describe itself through shape_of<TArgs>()
 * and be readable with nlohmann from_json (or supply a Deserializer).
 *
 * Pipeline for execute():
 *   1. absent/null arguments -> TArgs{}
 *   2. object check, required field check, deserialize -> ToolError(InvalidArguments)
 *   3. validator -> ToolError(ValidationFailed)
 *   4. handler(args, token)
 */
template <typename TArgs>
class TypedTool : public ITool {
public:
    using Handler = std::function<ToolResponse(const TArgs&, const CancellationToken&)>;
    using Validator = std::function<std::optional<std::string>(const TArgs&)>;
    using Deserializer = std::function<TArgs(const json&)>;

    TypedTool(std::string name,
              std::optional<std::string> description,
              Handler handler,
              Validator validator = nullptr,
              Deserializer deserializer = nullptr)
        : name_(std::move(name))
        , description_(std::move(description))
        , handler_(std::move(handler))
        , validator_(std::move(validator))
        , deserializer_(std::move(deserializer))
        , shape_(shape_of<TArgs>())
        , schema_(SchemaGenerator::generate(shape_)) {
        if (name_.empty()) {
            throw std::invalid_argument("Tool name cannot be empty");
        }
        if (!handler_) {
            throw std::invalid_argument("Tool handler cannot be null");
        }
        if (!deserializer_) {
            deserializer_ = [](const json& raw) { return raw.get<TArgs>(); };
        }
    }

    std::string name() const override { return name_; }
    std::optional<std::string> description() const override { return description_; }
    SchemaNode input_schema() const override { return schema_; }

    ToolResponse execute(const std::optional<json>& arguments,
                         const CancellationToken& token) override {
        TArgs args = parse_arguments(arguments);

        if (validator_) {
            if (auto error = validator_(args)) {
                throw ToolError(ToolError::Kind::ValidationFailed,
                                "Argument validation failed: " + *error);
            }
        }

        return handler_(args, token);
    }

private:
    TArgs parse_arguments(const std::optional<json>& arguments) const {
        if (!arguments || arguments->is_null()) {
            return TArgs{};
        }

        const json& raw = *arguments;
        if (!raw.is_object()) {
            invalid_arguments(std::string("expected a JSON object, got ") + raw.type_name());
        }

        for (const auto& field : shape_.fields) {
            if (!SchemaGenerator::is_required(field)) {
                continue;
            }
            auto it = raw.find(field.name);
            if (it == raw.end() || it->is_null()) {
                invalid_arguments("missing required field '" + field.name + "'");
            }
        }

        try {
            return deserializer_(raw);
        } catch (const json::exception& e) {
            invalid_arguments(e.what());
        } catch (const std::invalid_argument& e) {
            invalid_arguments(e.what());
        }
    }

    [[noreturn]] void invalid_arguments(const std::string& diagnostic) const {
        throw ToolError(ToolError::Kind::InvalidArguments,
                        "Invalid arguments for tool '" + name_ + "': " + diagnostic,
                        false, diagnostic);
    }

    std::string name_;
    std::optional<std::string> description_;
    Handler handler_;
    Validator validator_;
    Deserializer deserializer_;
    TypeShape shape_;
    SchemaNode schema_;
};

/**
 * @brief Tool taking no input; its schema is an empty object
 */
class NoArgTool : public ITool {
public:
    using Handler = std::function<ToolResponse(const CancellationToken&)>;

    NoArgTool(std::string name, std::optional<std::string> description, Handler handler)
        : name_(std::move(name))
        , description_(std::move(description))
        , handler_(std::move(handler)) {
        if (name_.empty()) {
            throw std::invalid_argument("Tool name cannot be empty");
        }
        if (!handler_) {
            throw std::invalid_argument("Tool handler cannot be null");
        }
    }

    std::string name() const override { return name_; }
    std::optional<std::string> description() const override { return description_; }
    SchemaNode input_schema() const override { return SchemaNode::empty_object(); }

    ToolResponse execute(const std::optional<json>& /*arguments*/,
                         const CancellationToken& token) override {
        return handler_(token);
    }

private:
    std::string name_;
    std::optional<std::string> description_;
    Handler handler_;
};

/**
 * @brief Convenience factory returning a shared TypedTool
 */
template <typename TArgs>
std::shared_ptr<ITool> make_typed_tool(std::string name,
                                       std::optional<std::string> description,
                                       typename TypedTool<TArgs>::Handler handler,
                                       typename TypedTool<TArgs>::Validator validator = nullptr) {
    return std::make_shared<TypedTool<TArgs>>(std::move(name), std::move(description),
                                              std::move(handler), std::move(validator));
}

} // namespace mcpkit

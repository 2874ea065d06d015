#pragma once

#include "McpTypes.hpp"
#include "core/CancellationToken.hpp"
#include "schema/SchemaNode.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace mcpkit {

using json = nlohmann::json;

/**
 * @brief Failure raised by a tool or by tool lookup
 *
 * The dispatch engine turns it into a JSON-RPC error; detail, when present,
 * becomes error.data.
 */
class ToolError : public std::runtime_error {
public:
    enum class Kind {
        NotFound,
        InvalidArguments,
        ValidationFailed,
        ExecutionFailed,
        Cancelled
    };

    ToolError(Kind kind, const std::string& message, bool retryable = false,
              std::optional<std::string> detail = std::nullopt)
        : std::runtime_error(message)
        , kind_(kind)
        , retryable_(retryable)
        , detail_(std::move(detail)) {}

    Kind kind() const { return kind_; }
    bool retryable() const { return retryable_; }
    const std::optional<std::string>& detail() const { return detail_; }

private:
    Kind kind_;
    bool retryable_;
    std::optional<std::string> detail_;
};

/**
 * @brief Contract every tool exposed by the server satisfies
 */
class ITool {
public:
    virtual ~ITool() = default;

    /**
     * @brief Unique, non-empty tool name
     */
    virtual std::string name() const = 0;

    virtual std::optional<std::string> description() const = 0;

    /**
     * @brief JSON Schema of the tool's arguments
     */
    virtual SchemaNode input_schema() const = 0;

    /**
     * @brief Execute the tool
     * @param arguments Raw arguments from tools/call, absent if not supplied
     * @param token Cancellation signal; long-running tools must observe it
     * @return Tool response (failures the client should see use is_error)
     * @throws ToolError on invalid arguments, validation or execution failure
     */
    virtual ToolResponse execute(const std::optional<json>& arguments,
                                 const CancellationToken& token) = 0;

    ToolDescriptor descriptor() const {
        return ToolDescriptor{name(), description(), input_schema()};
    }
};

} // namespace mcpkit

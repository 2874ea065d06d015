#include "mcp/TypedTool.hpp"
#include <gtest/gtest.h>

using namespace mcpkit;
using json = nlohmann::json;

namespace {

struct GreetArgs {
    std::string name;
    std::optional<std::string> greeting;

    static TypeShape shape() {
        return ObjectShape()
            .field("name", &GreetArgs::name, FieldOptions().with_required().with_min_length(1))
            .field("greeting", &GreetArgs::greeting)
            .build();
    }
};

void from_json(const json& j, GreetArgs& args) {
    if (j.contains("name")) {
        args.name = j.at("name").get<std::string>();
    }
    if (j.contains("greeting") && !j["greeting"].is_null()) {
        args.greeting = j["greeting"].get<std::string>();
    }
}

std::shared_ptr<ITool> make_greeter(int* calls = nullptr) {
    return make_typed_tool<GreetArgs>(
        "greet", "Say hello",
        [calls](const GreetArgs& args, const CancellationToken&) {
            if (calls) {
                (*calls)++;
            }
            return ToolResponse::success(args.greeting.value_or("Hello") + ", " + args.name);
        },
        [](const GreetArgs& args) -> std::optional<std::string> {
            if (args.name == "nobody") {
                return "name must identify someone";
            }
            return std::nullopt;
        });
}

ToolError expect_tool_error(ITool& tool, const std::optional<json>& arguments) {
    try {
        tool.execute(arguments, CancellationToken{});
    } catch (const ToolError& e) {
        return e;
    }
    ADD_FAILURE() << "Expected ToolError";
    return ToolError(ToolError::Kind::ExecutionFailed, "no error");
}

} // namespace

TEST(TypedToolTest, ExecutesWithTypedArguments) {
    auto tool = make_greeter();

    ToolResponse response = tool->execute(json{{"name", "Ada"}, {"greeting", "Hi"}}, CancellationToken{});

    ASSERT_EQ(response.content.size(), 1u);
    EXPECT_EQ(response.content[0].text, "Hi, Ada");
}

TEST(TypedToolTest, SchemaIsDerivedFromArgumentShape) {
    auto tool = make_greeter();
    json schema = tool->input_schema();

    EXPECT_EQ(schema["type"], "object");
    EXPECT_EQ(schema["properties"]["name"]["minLength"], 1);
    EXPECT_EQ(schema["required"], json::array({"name"}));
    EXPECT_EQ(json(tool->input_schema()), schema);

    json descriptor = tool->descriptor();
    EXPECT_EQ(descriptor["name"], "greet");
    EXPECT_EQ(descriptor["description"], "Say hello");
}

TEST(TypedToolTest, AbsentArgumentsUseDefaults) {
    int calls = 0;
    auto tool = make_greeter(&calls);

    ToolResponse absent = tool->execute(std::nullopt, CancellationToken{});
    ToolResponse null_args = tool->execute(json(nullptr), CancellationToken{});

    EXPECT_EQ(calls, 2);
    EXPECT_EQ(absent.content[0].text, "Hello, ");
    EXPECT_EQ(null_args.content[0].text, "Hello, ");
}

TEST(TypedToolTest, NonObjectArgumentsAreRejected) {
    int calls = 0;
    auto tool = make_greeter(&calls);

    ToolError error = expect_tool_error(*tool, json::array({1, 2}));

    EXPECT_EQ(error.kind(), ToolError::Kind::InvalidArguments);
    EXPECT_FALSE(error.retryable());
    EXPECT_NE(std::string(error.what()).find("Invalid arguments for tool 'greet'"), std::string::npos);
    ASSERT_TRUE(error.detail().has_value());
    EXPECT_NE(error.detail()->find("array"), std::string::npos);
    EXPECT_EQ(calls, 0);
}

TEST(TypedToolTest, MissingRequiredFieldIsRejected) {
    auto tool = make_greeter();

    ToolError missing = expect_tool_error(*tool, json{{"greeting", "Hi"}});
    EXPECT_EQ(missing.kind(), ToolError::Kind::InvalidArguments);
    EXPECT_EQ(missing.detail(), std::string("missing required field 'name'"));

    ToolError null_value = expect_tool_error(*tool, json{{"name", nullptr}});
    EXPECT_EQ(null_value.kind(), ToolError::Kind::InvalidArguments);
}

TEST(TypedToolTest, WrongFieldTypeIsRejected) {
    auto tool = make_greeter();

    ToolError error = expect_tool_error(*tool, json{{"name", 42}});
    EXPECT_EQ(error.kind(), ToolError::Kind::InvalidArguments);
    EXPECT_TRUE(error.detail().has_value());
}

TEST(TypedToolTest, ValidatorFailureIsReportedWithoutCallingHandler) {
    int calls = 0;
    auto tool = make_greeter(&calls);

    ToolError error = expect_tool_error(*tool, json{{"name", "nobody"}});

    EXPECT_EQ(error.kind(), ToolError::Kind::ValidationFailed);
    EXPECT_STREQ(error.what(), "Argument validation failed: name must identify someone");
    EXPECT_EQ(calls, 0);
}

TEST(TypedToolTest, CustomDeserializer) {
    TypedTool<GreetArgs> tool(
        "shout", std::nullopt,
        [](const GreetArgs& args, const CancellationToken&) { return ToolResponse::success(args.name); },
        nullptr,
        [](const json& raw) {
            GreetArgs args;
            args.name = raw.at("name").get<std::string>() + "!";
            return args;
        });

    EXPECT_EQ(tool.execute(json{{"name", "hey"}}, CancellationToken{}).content[0].text, "hey!");
    EXPECT_FALSE(tool.description().has_value());
}

TEST(TypedToolTest, HandlerSeesCancellationToken) {
    auto tool = make_typed_tool<GreetArgs>(
        "wait", "Waits",
        [](const GreetArgs&, const CancellationToken& token) {
            token.throw_if_cancelled();
            return ToolResponse::success("finished");
        });

    CancellationSource source;
    source.cancel();
    EXPECT_THROW(tool->execute(json{{"name", "x"}}, source.token()), OperationCancelled);
}

TEST(TypedToolTest, InvalidConstruction) {
    auto handler = [](const GreetArgs&, const CancellationToken&) { return ToolResponse::success(""); };

    EXPECT_THROW(TypedTool<GreetArgs>("", std::nullopt, handler), std::invalid_argument);
    EXPECT_THROW(TypedTool<GreetArgs>("x", std::nullopt, nullptr), std::invalid_argument);
}

TEST(NoArgToolTest, EmptyObjectSchemaAndIgnoredArguments) {
    NoArgTool tool("now", "Current state", [](const CancellationToken&) {
        return ToolResponse::success("ok");
    });

    EXPECT_EQ(json(tool.input_schema()), json({{"type", "object"}, {"properties", json::object()}}));
    EXPECT_EQ(tool.execute(json{{"extra", 1}}, CancellationToken{}).content[0].text, "ok");
    EXPECT_EQ(tool.execute(std::nullopt, CancellationToken{}).content[0].text, "ok");
}

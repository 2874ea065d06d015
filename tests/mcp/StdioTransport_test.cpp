#include "mcp/StdioTransport.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <vector>

using namespace mcpkit;
using json = nlohmann::json;

TEST(StdioTransportTest, ReadsOneMessagePerLineSkippingBlanks) {
    std::istringstream in(
        "\n"
        "   \n"
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\r\n"
        "\n"
        "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n");
    std::ostringstream out;
    StdioTransport transport(in, out);

    auto first = transport.read_message(CancellationToken{});
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(std::get<JsonRpcRequest>(*first).method, "ping");

    auto second = transport.read_message(CancellationToken{});
    ASSERT_TRUE(second.has_value());
    EXPECT_TRUE(std::get<JsonRpcRequest>(*second).is_notification());

    EXPECT_TRUE(transport.is_connected());
    EXPECT_FALSE(transport.read_message(CancellationToken{}).has_value());
    EXPECT_FALSE(transport.is_connected());
}

TEST(StdioTransportTest, LastLineWithoutNewlineIsRead) {
    std::istringstream in("{\"jsonrpc\":\"2.0\",\"id\":7,\"method\":\"ping\"}");
    std::ostringstream out;
    StdioTransport transport(in, out);

    auto message = transport.read_message(CancellationToken{});
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(*std::get<JsonRpcRequest>(*message).id, 7);
    EXPECT_FALSE(transport.read_message(CancellationToken{}).has_value());
}

TEST(StdioTransportTest, MalformedLineIsRecoverable) {
    std::istringstream in(
        "not json\n"
        "{\"jsonrpc\":\"2.0\",\"id\":9}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"ping\"}\n");
    std::ostringstream out;
    StdioTransport transport(in, out);

    try {
        transport.read_message(CancellationToken{});
        FAIL() << "Expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_FALSE(e.connection_closed());
        EXPECT_EQ(e.code(), JsonRpcErrorCode::ParseError);
    }

    try {
        transport.read_message(CancellationToken{});
        FAIL() << "Expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_FALSE(e.connection_closed());
        EXPECT_EQ(e.code(), JsonRpcErrorCode::InvalidRequest);
        EXPECT_EQ(e.id(), 9);
    }

    EXPECT_TRUE(transport.is_connected());
    auto message = transport.read_message(CancellationToken{});
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(std::get<JsonRpcRequest>(*message).method, "ping");
}

TEST(StdioTransportTest, FailedInputStreamIsFatal) {
    std::istringstream in("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n");
    in.setstate(std::ios::badbit);
    std::ostringstream out;
    StdioTransport transport(in, out);

    try {
        transport.read_message(CancellationToken{});
        FAIL() << "Expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_TRUE(e.connection_closed());
    }
    EXPECT_FALSE(transport.is_connected());
}

TEST(StdioTransportTest, CancelledTokenStopsRead) {
    std::istringstream in("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n");
    std::ostringstream out;
    StdioTransport transport(in, out);

    CancellationSource source;
    source.cancel();
    EXPECT_THROW(transport.read_message(source.token()), OperationCancelled);
}

TEST(StdioTransportTest, WritesOneLinePerMessage) {
    std::istringstream in;
    std::ostringstream out;
    StdioTransport transport(in, out);

    transport.write_message(JsonRpcResponse::success(1, json{{"text", "line1\nline2"}}), CancellationToken{});
    transport.write_message(JsonRpcResponse::failure(2, JsonRpcErrorCode::MethodNotFound, "Method not found: x"),
                            CancellationToken{});

    std::istringstream written(out.str());
    std::string line;
    std::vector<json> lines;
    while (std::getline(written, line)) {
        lines.push_back(json::parse(line));
    }

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0]["result"]["text"], "line1\nline2");
    EXPECT_EQ(lines[1]["error"]["code"], -32601);
    EXPECT_EQ(out.str().back(), '\n');
}

TEST(StdioTransportTest, WriteToFailedStreamIsFatal) {
    std::istringstream in;
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    StdioTransport transport(in, out);

    try {
        transport.write_message(JsonRpcResponse::success(1, json::object()), CancellationToken{});
        FAIL() << "Expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_TRUE(e.connection_closed());
    }
    EXPECT_FALSE(transport.is_connected());
}

TEST(StdioTransportTest, CloseMarksDisconnected) {
    std::istringstream in;
    std::ostringstream out;
    StdioTransport transport(in, out);

    transport.close();
    transport.close();
    EXPECT_FALSE(transport.is_connected());
}

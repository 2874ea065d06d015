#include "mcp/ServerBuilder.hpp"
#include "mcp/StdioTransport.hpp"
#include "tools/FileSystemTools.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>

using namespace mcpkit;
using json = nlohmann::json;
namespace fs = std::filesystem;

class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        sandbox = fs::temp_directory_path() / "mcpkit_end_to_end_test";
        fs::remove_all(sandbox);
        fs::create_directories(sandbox / "docs");
        sandbox = fs::canonical(sandbox);

        std::ofstream(sandbox / "docs" / "notes.md") << "# Notes\nremember the milk\n";

        auto guard = std::make_shared<const PathGuard>(std::vector<std::string>{sandbox.string()});
        server = ServerBuilder()
            .with_server_info("mcpkit-filesystem", "1.0.0")
            .add_tools(filesystem_tools(guard))
            .build();
    }

    void TearDown() override {
        fs::remove_all(sandbox);
    }

    static json request(int id, const std::string& method, json params = nullptr) {
        json message = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}};
        if (!params.is_null()) {
            message["params"] = std::move(params);
        }
        return message;
    }

    // Run a whole session over stream-backed stdio and collect the reply lines
    std::vector<json> run_session(const std::vector<std::string>& lines) {
        std::ostringstream input;
        for (const auto& line : lines) {
            input << line << "\n";
        }

        std::istringstream in(input.str());
        std::ostringstream out;
        StdioTransport transport(in, out);

        std::thread server_thread([&]() { server->run(transport); });
        server_thread.join();

        std::vector<json> responses;
        std::istringstream written(out.str());
        std::string line;
        while (std::getline(written, line)) {
            responses.push_back(json::parse(line));
        }
        return responses;
    }

    fs::path sandbox;
    std::unique_ptr<MCPServer> server;
};

TEST_F(EndToEndTest, CompleteSession) {
    std::string notes = (sandbox / "docs" / "notes.md").string();

    auto responses = run_session({
        request(1, "initialize", {{"protocolVersion", "2024-11-05"},
                                  {"clientInfo", {{"name", "test-client"}, {"version", "0.1"}}}}).dump(),
        json({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}).dump(),
        request(2, "tools/list", json::object()).dump(),
        request(3, "tools/call", {{"name", "read_file"}, {"arguments", {{"path", notes}}}}).dump(),
        request(4, "tools/call", {{"name", "search_files"},
                                  {"arguments", {{"path", sandbox.string()}, {"pattern", "notes"}}}}).dump(),
        request(5, "ping").dump()
    });

    ASSERT_EQ(responses.size(), 5u);

    EXPECT_EQ(responses[0]["id"], 1);
    EXPECT_EQ(responses[0]["result"]["protocolVersion"], "2024-11-05");
    EXPECT_EQ(responses[0]["result"]["serverInfo"]["name"], "mcpkit-filesystem");
    EXPECT_TRUE(responses[0]["result"]["capabilities"].contains("tools"));

    EXPECT_EQ(responses[1]["id"], 2);
    EXPECT_EQ(responses[1]["result"]["tools"].size(), 11u);

    EXPECT_EQ(responses[2]["id"], 3);
    EXPECT_EQ(responses[2]["result"]["content"][0]["text"], "# Notes\nremember the milk\n");
    EXPECT_FALSE(responses[2]["result"].contains("isError"));

    EXPECT_EQ(responses[3]["id"], 4);
    EXPECT_EQ(responses[3]["result"]["content"][0]["text"], notes);

    EXPECT_EQ(responses[4]["id"], 5);
    EXPECT_EQ(responses[4]["result"], json::object());

    EXPECT_EQ(server->state(), ServerState::Closed);
}

TEST_F(EndToEndTest, ErrorsDoNotEndSession) {
    auto responses = run_session({
        "this is not json",
        request(1, "tools/call", {{"name", "no_such_tool"}}).dump(),
        request(2, "tools/call", {{"name", "read_file"}, {"arguments", {{"path", "/etc/passwd"}}}}).dump(),
        request(3, "resources/list").dump(),
        request(4, "tools/call", {{"name", "list_directory"}, {"arguments", {{"path", sandbox.string()}}}}).dump()
    });

    ASSERT_EQ(responses.size(), 5u);

    EXPECT_TRUE(responses[0]["id"].is_null());
    EXPECT_EQ(responses[0]["error"]["code"], -32700);

    EXPECT_EQ(responses[1]["error"]["code"], -32600);

    // Access outside the sandbox is a tool-level error, not a protocol error
    EXPECT_EQ(responses[2]["result"]["isError"], true);

    EXPECT_EQ(responses[3]["error"]["code"], -32601);
    EXPECT_EQ(responses[3]["error"]["message"], "Method not found: resources/list");

    EXPECT_EQ(responses[4]["result"]["content"][0]["text"], "[DIR] docs");
}

TEST_F(EndToEndTest, WriteThenReadBack) {
    std::string target = (sandbox / "docs" / "todo.txt").string();

    auto responses = run_session({
        request(1, "tools/call", {{"name", "write_file"},
                                  {"arguments", {{"path", target}, {"content", "buy bread"}}}}).dump(),
        request(2, "tools/call", {{"name", "read_file"}, {"arguments", {{"path", target}}}}).dump()
    });

    ASSERT_EQ(responses.size(), 2u);
    EXPECT_EQ(responses[0]["result"]["content"][0]["text"], "Successfully wrote to " + target);
    EXPECT_EQ(responses[1]["result"]["content"][0]["text"], "buy bread");
}

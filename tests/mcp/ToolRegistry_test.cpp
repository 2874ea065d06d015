#include "mcp/ToolRegistry.hpp"
#include "mcp/TypedTool.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>

using namespace mcpkit;

namespace {

std::shared_ptr<ITool> make_tool(const std::string& name, const std::string& reply = "ok") {
    return std::make_shared<NoArgTool>(name, std::nullopt, [reply](const CancellationToken&) {
        return ToolResponse::success(reply);
    });
}

} // namespace

TEST(ToolRegistryTest, RegisterAndLookup) {
    ToolRegistry registry;
    EXPECT_TRUE(registry.empty());

    registry.register_tool(make_tool("alpha"));

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_TRUE(registry.contains("alpha"));
    ASSERT_NE(registry.get("alpha"), nullptr);
    EXPECT_EQ(registry.get("alpha")->name(), "alpha");
    EXPECT_EQ(registry.get("beta"), nullptr);
}

TEST(ToolRegistryTest, DuplicateLeavesExistingToolInPlace) {
    ToolRegistry registry;
    registry.register_tool(make_tool("alpha", "first"));

    EXPECT_THROW(registry.register_tool(make_tool("alpha", "second")), std::invalid_argument);

    EXPECT_EQ(registry.size(), 1u);
    auto response = registry.get("alpha")->execute(std::nullopt, CancellationToken{});
    EXPECT_EQ(response.content[0].text, "first");
}

TEST(ToolRegistryTest, RejectsNullTool) {
    ToolRegistry registry;
    EXPECT_THROW(registry.register_tool(nullptr), std::invalid_argument);
    EXPECT_TRUE(registry.empty());
}

TEST(ToolRegistryTest, UnregisterReportsPresence) {
    ToolRegistry registry;
    registry.register_tool(make_tool("alpha"));

    EXPECT_TRUE(registry.unregister_tool("alpha"));
    EXPECT_FALSE(registry.unregister_tool("alpha"));
    EXPECT_FALSE(registry.contains("alpha"));

    // Name becomes available again
    EXPECT_NO_THROW(registry.register_tool(make_tool("alpha")));
}

TEST(ToolRegistryTest, ListIsSortedSnapshot) {
    ToolRegistry registry;
    registry.register_tool(make_tool("zeta"));
    registry.register_tool(make_tool("alpha"));
    registry.register_tool(make_tool("mid"));

    auto snapshot = registry.list();
    registry.unregister_tool("mid");

    ASSERT_EQ(snapshot.size(), 3u);
    EXPECT_EQ(snapshot[0]->name(), "alpha");
    EXPECT_EQ(snapshot[1]->name(), "mid");
    EXPECT_EQ(snapshot[2]->name(), "zeta");
    EXPECT_EQ(registry.list().size(), 2u);
}

TEST(ToolRegistryTest, ToolSurvivesUnregisterWhileExecuting) {
    ToolRegistry registry;
    std::atomic<bool> started{false};
    std::atomic<bool> release{false};

    registry.register_tool(std::make_shared<NoArgTool>("slow", std::nullopt, [&](const CancellationToken&) {
        started = true;
        while (!release) {
            std::this_thread::yield();
        }
        return ToolResponse::success("done");
    }));

    std::string result;
    std::thread worker([&] {
        auto tool = registry.get("slow");
        result = tool->execute(std::nullopt, CancellationToken{}).content[0].text;
    });

    while (!started) {
        std::this_thread::yield();
    }
    EXPECT_TRUE(registry.unregister_tool("slow"));
    release = true;
    worker.join();

    EXPECT_EQ(result, "done");
    EXPECT_FALSE(registry.contains("slow"));
}

TEST(ToolRegistryTest, ConcurrentRegistration) {
    ToolRegistry registry;
    std::vector<std::thread> threads;

    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&registry, t] {
            for (int i = 0; i < 25; ++i) {
                registry.register_tool(make_tool("tool_" + std::to_string(t) + "_" + std::to_string(i)));
                registry.list();
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(registry.size(), 100u);
}

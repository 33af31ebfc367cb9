#include <gtest/gtest.h>
#include "toolhost/registry.hpp"

using namespace toolhost;

namespace {

ToolDefinition tool(const std::string& name) {
    ToolDefinition def;
    def.name = name;
    def.description = name + " tool";
    return def;
}

CallToolResult noop(const nlohmann::json&) {
    return CallToolResult::text("ok");
}

} // namespace

TEST(ToolRegistry, EmptyByDefault) {
    ToolRegistry reg;
    EXPECT_EQ(reg.size(), 0u);
    EXPECT_TRUE(reg.list().empty());
    EXPECT_EQ(reg.list_json(), nlohmann::json::array());
    EXPECT_EQ(reg.find("x"), nullptr);
}

TEST(ToolRegistry, KeepsRegistrationOrder) {
    auto reg = ToolRegistry::Builder{}
        .add(tool("zeta"), noop)
        .add(tool("alpha"), noop)
        .add(tool("mid"), noop)
        .build();

    ASSERT_EQ(reg.size(), 3u);
    EXPECT_EQ(reg.list()[0].name, "zeta");
    EXPECT_EQ(reg.list()[1].name, "alpha");
    EXPECT_EQ(reg.list()[2].name, "mid");
    EXPECT_EQ(reg.list_json()[1]["name"], "alpha");
}

TEST(ToolRegistry, FindReturnsEntry) {
    auto reg = ToolRegistry::Builder{}.add(tool("echo"), noop).build();
    const auto* entry = reg.find("echo");
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->definition.description, "echo tool");
    ASSERT_TRUE(entry->handler);
    EXPECT_FALSE(entry->async_handler);
    EXPECT_EQ(entry->handler({}).content[0].text, "ok");
}

TEST(ToolRegistry, AsyncEntry) {
    auto reg = ToolRegistry::Builder{}
        .add_async(tool("later"), [](const nlohmann::json&) {
            std::promise<CallToolResult> p;
            p.set_value(CallToolResult::text("done"));
            return p.get_future();
        })
        .build();
    const auto* entry = reg.find("later");
    ASSERT_NE(entry, nullptr);
    EXPECT_FALSE(entry->handler);
    EXPECT_EQ(entry->async_handler({}).get().content[0].text, "done");
}

TEST(ToolRegistry, DuplicateNameRejected) {
    ToolRegistry::Builder b;
    b.add(tool("echo"), noop);
    EXPECT_THROW(b.add(tool("echo"), noop), std::invalid_argument);
}

TEST(ToolRegistry, EmptyNameRejected) {
    ToolRegistry::Builder b;
    EXPECT_THROW(b.add(tool(""), noop), std::invalid_argument);
}

TEST(ToolRegistry, MissingHandlerRejected) {
    ToolRegistry::Builder b;
    EXPECT_THROW(b.add(tool("x"), ToolHandler{}), std::invalid_argument);
    EXPECT_THROW(b.add_async(tool("y"), AsyncToolHandler{}), std::invalid_argument);
}

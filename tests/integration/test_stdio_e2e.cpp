#include "pipe_harness.hpp"
#include <csignal>

using namespace toolhost;
using namespace toolhost::testing;
using json = nlohmann::json;

namespace {

ServerConfig config(int workers = 4) {
    ServerConfig cfg;
    cfg.server_info = {"e2e-server", "1.0.0"};
    cfg.worker_threads = workers;
    return cfg;
}

void add_tools(ToolServer& server) {
    PropertySchema text;
    text.name = "text";
    text.required = true;
    PropertySchema delay;
    delay.name = "delay_ms";
    delay.type = PropertyType::Integer;
    delay.default_value = 0;

    ToolDefinition echo;
    echo.name = "echo";
    echo.description = "Echo the text";
    echo.input_schema.properties = {text};
    server.add_tool(echo, [](const json& args) {
        return CallToolResult::text(args.at("text").get<std::string>());
    });

    ToolDefinition sleep_echo;
    sleep_echo.name = "sleep_echo";
    sleep_echo.description = "Echo after a delay";
    sleep_echo.input_schema.properties = {text, delay};
    server.add_tool(sleep_echo, [](const json& args) {
        std::this_thread::sleep_for(std::chrono::milliseconds(args.at("delay_ms").get<int64_t>()));
        return CallToolResult::text(args.at("text").get<std::string>());
    });

    ToolDefinition fail;
    fail.name = "fail";
    fail.description = "Always fails";
    server.add_tool(fail, [](const json&) -> CallToolResult {
        throw std::runtime_error("upstream returned HTTP 503");
    });
}

} // namespace

TEST(StdioE2E, InitializeReturnsServerName) {
    ToolServer server{config()};
    add_tools(server);
    PipeHarness h(server);

    h.send_raw("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"initialize\",\"params\":{}}\n");
    auto resp = h.read_json();
    EXPECT_EQ(resp["id"], 1);
    EXPECT_EQ(resp["result"]["serverInfo"]["name"], "e2e-server");
    EXPECT_EQ(resp["result"]["protocolVersion"], "2024-11-05");

    h.finish();
    EXPECT_TRUE(h.serve_error().empty());
}

TEST(StdioE2E, NonexistentToolIsErrorResult) {
    ToolServer server{config()};
    add_tools(server);
    PipeHarness h(server);

    h.send_raw("{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/call\","
               "\"params\":{\"name\":\"nonexistent_tool\",\"arguments\":{}}}\n");
    auto resp = h.read_json();
    EXPECT_EQ(resp["id"], 2);
    EXPECT_FALSE(resp.contains("error"));
    EXPECT_EQ(resp["result"]["isError"], true);
    EXPECT_NE(resp["result"]["content"][0]["text"].get<std::string>().find("nonexistent_tool"),
              std::string::npos);
}

TEST(StdioE2E, ParseErrorThenToolsList) {
    ToolServer server{config()};
    add_tools(server);
    PipeHarness h(server);

    h.send_raw("\"not json\"\n{\"jsonrpc\":\"2.0\",\"id\":3,\"method\":\"tools/list\"}\n");
    h.finish();

    auto first = json::parse(h.read_line());
    auto second = json::parse(h.read_line());
    EXPECT_EQ(h.read_line(std::chrono::milliseconds(100)), "");

    EXPECT_FALSE(first.contains("id"));
    EXPECT_EQ(first["error"]["code"], -32700);
    EXPECT_EQ(second["id"], 3);
    ASSERT_EQ(second["result"]["tools"].size(), 3u);
    EXPECT_EQ(second["result"]["tools"][0]["name"], "echo");
}

TEST(StdioE2E, ResponsesFollowRequestOrder) {
    ToolServer server{config(4)};
    add_tools(server);
    PipeHarness h(server);

    h.send(tool_call(1, "sleep_echo", {{"text", "slow"}, {"delay_ms", 500}}));
    h.send(tool_call(2, "sleep_echo", {{"text", "fast"}, {"delay_ms", 10}}));
    h.send(request(3, "tools/list"));

    auto r1 = h.read_json();
    auto r2 = h.read_json();
    auto r3 = h.read_json();
    EXPECT_EQ(r1["id"], 1);
    EXPECT_EQ(r1["result"]["content"][0]["text"], "slow");
    EXPECT_EQ(r2["id"], 2);
    EXPECT_EQ(r2["result"]["content"][0]["text"], "fast");
    EXPECT_EQ(r3["id"], 3);
}

TEST(StdioE2E, CallsRunConcurrently) {
    ToolServer server{config(4)};
    add_tools(server);
    PipeHarness h(server);

    auto start = std::chrono::steady_clock::now();
    for (int i = 1; i <= 4; ++i) {
        h.send(tool_call(i, "sleep_echo", {{"text", std::to_string(i)}, {"delay_ms", 300}}));
    }
    for (int i = 1; i <= 4; ++i) {
        EXPECT_EQ(h.read_json()["id"], i);
    }
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_LT(elapsed, std::chrono::milliseconds(1100));
}

TEST(StdioE2E, IdsEchoedWithTheirType) {
    ToolServer server{config()};
    add_tools(server);
    PipeHarness h(server);

    h.send({{"jsonrpc", "2.0"}, {"id", "abc"}, {"method", "tools/call"},
            {"params", {{"name", "echo"}, {"arguments", {{"text", "x"}}}}}});
    h.send(tool_call(99, "echo", {{"text", "y"}}));

    auto a = h.read_json();
    auto b = h.read_json();
    EXPECT_EQ(a["id"], "abc");
    EXPECT_EQ(b["id"], 99);
}

TEST(StdioE2E, ToolFailuresKeepSessionRunning) {
    ToolServer server{config()};
    add_tools(server);
    PipeHarness h(server);

    h.send(tool_call(1, "fail", json::object()));
    h.send(tool_call(2, "echo", json::object()));
    h.send(tool_call(3, "echo", {{"text", 5}}));
    h.send(request(4, "resources/list"));
    h.send(tool_call(5, "echo", {{"text", "still here"}}));

    auto fail = h.read_json();
    EXPECT_EQ(fail["result"]["isError"], true);
    EXPECT_EQ(fail["result"]["content"][0]["text"], "Error: upstream returned HTTP 503");

    auto missing = h.read_json();
    EXPECT_EQ(missing["result"]["content"][0]["text"], "Error: Missing required argument: text");

    auto wrong_type = h.read_json();
    EXPECT_EQ(wrong_type["result"]["isError"], true);

    auto unknown_method = h.read_json();
    EXPECT_EQ(unknown_method["id"], 4);
    EXPECT_EQ(unknown_method["error"]["code"], -32601);

    auto ok = h.read_json();
    EXPECT_EQ(ok["result"]["content"][0]["text"], "still here");
}

TEST(StdioE2E, OutOfRangeIntegerRejectedBeforeHandler) {
    ToolServer server{config()};
    add_tools(server);
    PipeHarness h(server);

    h.send_raw(R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"sleep_echo","arguments":{"text":"x","delay_ms":1e30}}})" "\n");
    auto resp = h.read_json();
    EXPECT_EQ(resp["id"], 1);
    EXPECT_EQ(resp["result"]["isError"], true);
    EXPECT_EQ(resp["result"]["content"][0]["text"],
              "Error: Invalid type for argument 'delay_ms': expected integer");
}

TEST(StdioE2E, ByteAtATimeInput) {
    ToolServer server{config()};
    add_tools(server);
    PipeHarness h(server);

    std::string frame = tool_call(1, "echo", {{"text", "香港"}}).dump() + "\n";
    for (char c : frame) {
        h.send_raw(std::string(1, c));
    }
    auto resp = h.read_json();
    EXPECT_EQ(resp["result"]["content"][0]["text"], "香港");
}

TEST(StdioE2E, EofFinishesInFlightCallsThenReturns) {
    ToolServer server{config()};
    add_tools(server);
    PipeHarness h(server);

    h.send(tool_call(1, "sleep_echo", {{"text", "late"}, {"delay_ms", 200}}));
    h.send_raw(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})");  // no newline
    h.finish();

    auto resp = h.read_json();
    EXPECT_EQ(resp["id"], 1);
    EXPECT_EQ(resp["result"]["content"][0]["text"], "late");
    EXPECT_EQ(h.read_line(std::chrono::milliseconds(100)), "");
    EXPECT_TRUE(h.serve_error().empty());
}

TEST(StdioE2E, OutputFaultEndsSessionWithError) {
    std::signal(SIGPIPE, SIG_IGN);
    ToolServer server{config()};
    add_tools(server);
    PipeHarness h(server);

    h.break_output();
    h.send(request(1, "initialize"));
    h.finish();
    EXPECT_NE(h.serve_error().find("Write error"), std::string::npos);
}

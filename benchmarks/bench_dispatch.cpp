#include <benchmark/benchmark.h>
#include "toolhost/logging.hpp"
#include "toolhost/protocol_handler.hpp"
#include <string>

using namespace toolhost;

static ToolRegistry make_registry(int n) {
    PropertySchema text;
    text.name = "text";
    text.required = true;

    ToolRegistry::Builder builder;
    for (int i = 0; i < n; ++i) {
        ToolDefinition def;
        def.name = "tool_" + std::to_string(i);
        def.input_schema.properties = {text};
        builder.add(def, [](const nlohmann::json& args) {
            return CallToolResult::text(args.at("text").get<std::string>());
        });
    }
    return builder.build();
}

static void BM_HandleToolsList(benchmark::State& state) {
    auto registry = make_registry(static_cast<int>(state.range(0)));
    WorkerPool pool(1);
    ToolDispatcher dispatcher(registry, pool);
    ProtocolHandler handler({{"bench", "1.0"}}, registry, dispatcher);
    const std::string frame = R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})";

    for (auto _ : state) {
        auto line = handler.handle_frame(frame).get();
        benchmark::DoNotOptimize(line);
    }
}
BENCHMARK(BM_HandleToolsList)->Arg(10)->Arg(100)->MinTime(1.0);

static void BM_HandleToolCall(benchmark::State& state) {
    auto registry = make_registry(100);
    WorkerPool pool(4);
    ToolDispatcher dispatcher(registry, pool);
    ProtocolHandler handler({{"bench", "1.0"}}, registry, dispatcher);
    const std::string frame =
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"tool_50","arguments":{"text":"hi"}}})";

    for (auto _ : state) {
        auto line = handler.handle_frame(frame).get();
        benchmark::DoNotOptimize(line);
    }
}
BENCHMARK(BM_HandleToolCall)->MinTime(1.0);

static void BM_InvokeDirect(benchmark::State& state) {
    auto registry = make_registry(100);
    WorkerPool pool(1);
    ToolDispatcher dispatcher(registry, pool);
    const nlohmann::json args = {{"text", "hi"}};

    for (auto _ : state) {
        auto result = dispatcher.invoke("tool_50", args);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_InvokeDirect)->MinTime(1.0);

static void BM_HandleParseError(benchmark::State& state) {
    auto registry = make_registry(1);
    WorkerPool pool(1);
    ToolDispatcher dispatcher(registry, pool);
    ProtocolHandler handler({{"bench", "1.0"}}, registry, dispatcher);
    // Every iteration would log a warning.
    logging::init("off");

    for (auto _ : state) {
        auto line = handler.handle_frame("{not json").get();
        benchmark::DoNotOptimize(line);
    }
}
BENCHMARK(BM_HandleParseError)->MinTime(1.0);

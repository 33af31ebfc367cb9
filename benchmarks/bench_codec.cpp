#include <benchmark/benchmark.h>
#include "toolhost/codec.hpp"
#include "toolhost/json_rpc.hpp"
#include "toolhost/registry.hpp"
#include <string>

using namespace toolhost;

static const std::string kSmallRequest =
    R"({"jsonrpc":"2.0","id":1,"method":"tools/list","params":{}})";

static const std::string kToolCallRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"hko_current_weather","arguments":{"language":"en"}}})";

// A tools/list result with n tools, each with two declared properties.
static nlohmann::json make_tool_list(int n) {
    ToolRegistry::Builder builder;
    for (int i = 0; i < n; ++i) {
        PropertySchema p1;
        p1.name = "param1";
        p1.description = "First parameter";
        p1.required = true;
        PropertySchema p2;
        p2.name = "param2";
        p2.type = PropertyType::Integer;
        p2.description = "Second parameter";

        ToolDefinition def;
        def.name = "tool_" + std::to_string(i);
        def.description = "A tool for doing something useful, number " + std::to_string(i);
        def.input_schema.properties = {p1, p2};
        builder.add(def, [](const nlohmann::json&) { return CallToolResult::text(""); });
    }
    auto registry = builder.build();
    return nlohmann::json{{"tools", registry.list_json()}};
}

static const std::string kLargeResponse =
    Codec::serialize(make_result(RequestId{int64_t{1}}, make_tool_list(100)));

// ---- Parse benchmarks ----

static void BM_ParseSmallRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::parse(kSmallRequest);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * kSmallRequest.size());
}
BENCHMARK(BM_ParseSmallRequest)->MinTime(1.0);

static void BM_ParseToolCallRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::parse(kToolCallRequest);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * kToolCallRequest.size());
}
BENCHMARK(BM_ParseToolCallRequest)->MinTime(1.0);

static void BM_ParseLargeJson(benchmark::State& state) {
    for (auto _ : state) {
        auto j = Codec::parse_json(kLargeResponse);
        benchmark::DoNotOptimize(j);
    }
    state.SetBytesProcessed(state.iterations() * kLargeResponse.size());
}
BENCHMARK(BM_ParseLargeJson)->MinTime(1.0);

// ---- Serialize benchmarks ----

static void BM_SerializeToolResult(benchmark::State& state) {
    nlohmann::json result = CallToolResult::text(std::string(512, 'x'));
    auto resp = make_result(RequestId{int64_t{7}}, result);
    for (auto _ : state) {
        auto s = Codec::serialize(resp);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeToolResult)->MinTime(1.0);

static void BM_SerializeToolList(benchmark::State& state) {
    auto resp = make_result(RequestId{int64_t{1}}, make_tool_list(static_cast<int>(state.range(0))));
    for (auto _ : state) {
        auto s = Codec::serialize(resp);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeToolList)->Arg(10)->Arg(100)->MinTime(1.0);

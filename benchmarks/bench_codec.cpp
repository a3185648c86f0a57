#include <benchmark/benchmark.h>
#include "opsmcp/codec.hpp"
#include "opsmcp/error.hpp"
#include "opsmcp/json_rpc.hpp"
#include "opsmcp/types.hpp"
#include <string>

using namespace opsmcp;

static const std::string kInitializeRequest =
    R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})";

static const std::string kToolCallRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"devops_capabilities","arguments":{"state":"CA"}}})";

// tools/list response carrying N definitions
static JsonRpcResponse make_list_response(int n) {
    nlohmann::json tools = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        ToolDefinition def;
        def.name = "tool_" + std::to_string(i);
        def.description = "A tool for doing something useful, number " + std::to_string(i);
        PropertySchema p;
        p.type = "string";
        p.description = "First parameter";
        def.input_schema.property("param1", p, true);
        tools.push_back(def);
    }
    return make_result(RequestId{int64_t{1}}, {{"tools", tools}});
}

// ---- Parse benchmarks ----

static void BM_ParseInitialize(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kInitializeRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kInitializeRequest.size());
}
BENCHMARK(BM_ParseInitialize)->MinTime(1.0);

static void BM_ParseToolCallRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolCallRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kToolCallRequest.size());
}
BENCHMARK(BM_ParseToolCallRequest)->MinTime(1.0);

static void BM_ParseInvalidJson(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!";
    for (auto _ : state) {
        try {
            auto msg = Codec::parse(bad);
            benchmark::DoNotOptimize(msg);
        } catch (const McpParseError& e) {
            benchmark::DoNotOptimize(e.what());
        }
    }
}
BENCHMARK(BM_ParseInvalidJson)->MinTime(1.0);

// ---- Serialize benchmarks ----

static void BM_SerializeListResponse(benchmark::State& state) {
    auto resp = make_list_response(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto s = Codec::serialize(resp);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeListResponse)->Arg(1)->Arg(100)->MinTime(1.0);

static void BM_FrameSse(benchmark::State& state) {
    auto resp = make_list_response(10);
    for (auto _ : state) {
        auto s = Codec::frame_sse(resp);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_FrameSse)->MinTime(1.0);

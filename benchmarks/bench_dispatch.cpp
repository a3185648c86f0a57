#include <benchmark/benchmark.h>
#include "opsmcp/codec.hpp"
#include "opsmcp/dispatcher.hpp"
#include "opsmcp/router.hpp"
#include "opsmcp/session.hpp"
#include "opsmcp/tools/devops_capabilities.hpp"
#include <memory>
#include <string>

using namespace opsmcp;

// Router with N methods registered
static std::unique_ptr<Router> make_router(int n_methods) {
    auto router = std::make_unique<Router>();
    for (int i = 0; i < n_methods; ++i) {
        router->on_request("method_" + std::to_string(i),
            [](const nlohmann::json&, Session&) -> HandlerResult {
                return nlohmann::json{{"result", "ok"}};
            });
    }
    return router;
}

static void BM_RouterKnownMethod(benchmark::State& state) {
    auto router = make_router(static_cast<int>(state.range(0)));
    Session session("bench");
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "method_0";

    for (auto _ : state) {
        auto resp = router->dispatch(req, session);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_RouterKnownMethod)->Arg(1)->Arg(100)->MinTime(1.0);

static void BM_RouterUnknownMethod(benchmark::State& state) {
    auto router = make_router(1);
    Session session("bench");
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "not_registered_method";

    for (auto _ : state) {
        auto resp = router->dispatch(req, session);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_RouterUnknownMethod)->MinTime(1.0);

static void BM_DispatchToolsList(benchmark::State& state) {
    ToolRegistry registry;
    tools::register_builtin_tools(registry);
    Dispatcher dispatcher(registry);
    Session session("bench");
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})");

    for (auto _ : state) {
        auto resp = dispatcher.dispatch(msg, session);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchToolsList)->MinTime(1.0);

// Includes the worker-thread hop of a blocking handler
static void BM_DispatchToolCall(benchmark::State& state) {
    ToolRegistry registry;
    tools::register_builtin_tools(registry);
    Dispatcher dispatcher(registry);
    Session session("bench");
    auto msg = Codec::parse(
        R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"devops_capabilities","arguments":{"state":"CA"}}})");

    for (auto _ : state) {
        auto resp = dispatcher.dispatch(msg, session);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchToolCall)->MinTime(1.0);

static void BM_SessionLookup(benchmark::State& state) {
    SessionStore store;
    for (int i = 0; i < state.range(0); ++i) {
        store.get_or_create("session-" + std::to_string(i));
    }
    const std::optional<std::string> id{"session-0"};
    for (auto _ : state) {
        auto s = store.get_or_create(id);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SessionLookup)->Arg(10)->Arg(10000)->MinTime(1.0);

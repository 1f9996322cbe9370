#include <benchmark/benchmark.h>
#include "mcpbridge/router.hpp"
#include <memory>
#include <string>

using namespace mcpbridge;

// Router with N extra methods besides the bridge's own
static std::unique_ptr<Router> make_router(int n_methods) {
    auto router = std::make_unique<Router>();
    for (int i = 0; i < n_methods; ++i) {
        router->on_request("method_" + std::to_string(i),
            [](const JsonRpcRequest&) -> HandlerResult {
                return nlohmann::json{{"result", "ok"}};
            });
    }
    router->on_request("ping", [](const JsonRpcRequest&) -> HandlerResult {
        return nlohmann::json::object();
    });
    router->on_request("tools/list", [](const JsonRpcRequest&) -> HandlerResult {
        return nlohmann::json{{"tools", nlohmann::json::array()}};
    });
    return router;
}

static void BM_DispatchKnownMethod(benchmark::State& state) {
    auto router = make_router(static_cast<int>(state.range(0)));

    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "ping";

    for (auto _ : state) {
        auto resp = router->dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchKnownMethod)->Arg(0)->Arg(100)->MinTime(1.0);

static void BM_DispatchUnknownMethod(benchmark::State& state) {
    auto router = make_router(0);

    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "resources/list";

    for (auto _ : state) {
        auto resp = router->dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchUnknownMethod)->MinTime(1.0);

static void BM_RouteNotification(benchmark::State& state) {
    auto router = make_router(0);
    const std::string method = "notifications/initialized";
    for (auto _ : state) {
        auto route = router->route(method);
        benchmark::DoNotOptimize(route);
    }
}
BENCHMARK(BM_RouteNotification)->MinTime(1.0);

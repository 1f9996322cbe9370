#include <benchmark/benchmark.h>
#include "mcpbridge/codec.hpp"
#include "mcpbridge/json_rpc.hpp"
#include <string>

using namespace mcpbridge;

// Small message (~50 bytes)
static const std::string kSmallRequest =
    R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})";

// Tool call request
static const std::string kToolCallRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"get_weather","arguments":{"location":"Warsaw","units":"celsius"}}})";

// tools/list result with N tools, as the bridge would emit it
static JsonRpcResponse make_tools_response(int n) {
    nlohmann::json tools = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        tools.push_back({
            {"name", "tool_" + std::to_string(i)},
            {"description", "A tool for doing something useful, number " + std::to_string(i)},
            {"inputSchema", {
                {"type", "object"},
                {"properties", {
                    {"param1", {{"type", "string"}, {"description", "First parameter"}}},
                    {"param2", {{"type", "number"}, {"description", "Second parameter"}}}
                }},
                {"required", {"param1"}}
            }}
        });
    }
    return JsonRpcResponse::success(RequestId{int64_t{1}}, nlohmann::json{{"tools", tools}});
}

// ---- Parse benchmarks ----

static void BM_ParseSmallMessage(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kSmallRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(kSmallRequest.size()));
}
BENCHMARK(BM_ParseSmallMessage)->MinTime(1.0);

static void BM_ParseToolCallRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolCallRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(kToolCallRequest.size()));
}
BENCHMARK(BM_ParseToolCallRequest)->MinTime(1.0);

static void BM_ParseMalformed(benchmark::State& state) {
    const std::string bad = "{invalid json}";
    for (auto _ : state) {
        try {
            auto msg = Codec::parse(bad);
            benchmark::DoNotOptimize(msg);
        } catch (const McpParseError& e) {
            benchmark::DoNotOptimize(e);
        }
    }
}
BENCHMARK(BM_ParseMalformed)->MinTime(1.0);

// ---- Serialize benchmarks ----

static void BM_SerializeSmallResponse(benchmark::State& state) {
    auto resp = JsonRpcResponse::success(RequestId{int64_t{1}}, nlohmann::json::object());
    for (auto _ : state) {
        auto line = Codec::serialize(resp);
        benchmark::DoNotOptimize(line);
    }
}
BENCHMARK(BM_SerializeSmallResponse)->MinTime(1.0);

static void BM_SerializeToolsList(benchmark::State& state) {
    auto resp = make_tools_response(static_cast<int>(state.range(0)));
    size_t bytes = 0;
    for (auto _ : state) {
        auto line = Codec::serialize(resp);
        bytes = line.size();
        benchmark::DoNotOptimize(line);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(bytes));
}
BENCHMARK(BM_SerializeToolsList)->Arg(10)->Arg(100)->MinTime(1.0);

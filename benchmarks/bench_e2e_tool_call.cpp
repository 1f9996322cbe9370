#include <benchmark/benchmark.h>
#include "mcpbridge/bridge.hpp"
#include "mcpbridge/codec.hpp"
#include "fake_backend.hpp"
#include <string>
#include <vector>

using namespace mcpbridge;
using mcpbridge::fake::FakeBackend;

// Full line-in, line-out cost of one request against an in-memory backend.

static void BM_ToolCallLine(benchmark::State& state) {
    FakeBackend backend;
    backend.set_responder([](const PluginRequest&) { return fake::tool_text_reply("hello benchmark"); });
    backend.set_recording(false);
    Bridge bridge(backend);

    const std::string line =
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"echo","arguments":{"text":"hello benchmark"}}})";

    for (auto _ : state) {
        auto resp = bridge.handle_line(line);
        auto out = Codec::serialize(*resp);
        benchmark::DoNotOptimize(out);
    }
    state.SetLabel("tools/call line round trip");
}
BENCHMARK(BM_ToolCallLine)->MinTime(1.0);

static void BM_ListToolsLine(benchmark::State& state) {
    std::vector<std::string> names;
    for (int i = 0; i < 100; ++i) names.push_back("tool_" + std::to_string(i));

    FakeBackend backend;
    backend.set_responder([&names](const PluginRequest&) { return fake::tool_list_reply(names); });
    backend.set_recording(false);
    Bridge bridge(backend);

    const std::string line = R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})";

    for (auto _ : state) {
        auto resp = bridge.handle_line(line);
        auto out = Codec::serialize(*resp);
        benchmark::DoNotOptimize(out);
    }
    state.SetLabel("tools/list with 100 tools");
}
BENCHMARK(BM_ListToolsLine)->MinTime(1.0);

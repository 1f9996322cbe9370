#include <benchmark/benchmark.h>
#include "mcpbridge/value_translator.hpp"
#include <string>

using namespace mcpbridge;

// Nested arguments object: `width` keys per level, `depth` levels.
static nlohmann::json make_arguments(int width, int depth) {
    nlohmann::json obj = nlohmann::json::object();
    for (int i = 0; i < width; ++i) {
        auto key = "key_" + std::to_string(i);
        if (depth > 1 && i == 0) {
            obj[key] = make_arguments(width, depth - 1);
        } else if (i % 3 == 0) {
            obj[key] = "value " + std::to_string(i);
        } else if (i % 3 == 1) {
            obj[key] = i * 1.5;
        } else {
            obj[key] = nlohmann::json::array({1, 2, 3, true, nullptr});
        }
    }
    return obj;
}

static void BM_JsonToStruct(benchmark::State& state) {
    auto args = make_arguments(static_cast<int>(state.range(0)), 3);
    for (auto _ : state) {
        auto s = ValueTranslator::to_struct(args, "arguments");
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_JsonToStruct)->Arg(4)->Arg(16)->Arg(64)->MinTime(1.0);

static void BM_StructToJson(benchmark::State& state) {
    auto s = ValueTranslator::to_struct(make_arguments(static_cast<int>(state.range(0)), 3));
    for (auto _ : state) {
        auto j = ValueTranslator::to_json(s);
        benchmark::DoNotOptimize(j);
    }
}
BENCHMARK(BM_StructToJson)->Arg(4)->Arg(16)->Arg(64)->MinTime(1.0);

#include <benchmark/benchmark.h>
#include "typetag/codec.hpp"
#include <string>

using namespace typetag;

// Generate an array of n tagged records as JSON text
static std::string make_large_text(int n) {
    Primitive records = Primitive::array();
    for (int i = 0; i < n; ++i) {
        records.push_back({
            {"id", "$uuid:152e4227-6852-4f8e-912d-bd75478c7eaa"},
            {"name", "record_" + std::to_string(i)},
            {"payload", {{"$t", "mytype"}, {"v", {i, 0.5 * i, "/$b"}}}}
        });
    }
    return Primitive{{"records", records}}.dump();
}

static const std::string kSmallText = R"({"$t":"mytype","v":["hello",3.14,["world"]]})";
static const std::string kLargeText = make_large_text(500);

static void BM_ParseSmall(benchmark::State& state) {
    for (auto _ : state) {
        auto p = JsonCodec::parse(kSmallText);
        benchmark::DoNotOptimize(p);
    }
    state.SetBytesProcessed(state.iterations() * kSmallText.size());
}
BENCHMARK(BM_ParseSmall)->MinTime(1.0);

static void BM_ParseLarge(benchmark::State& state) {
    for (auto _ : state) {
        auto p = JsonCodec::parse(kLargeText);
        benchmark::DoNotOptimize(p);
    }
    state.SetBytesProcessed(state.iterations() * kLargeText.size());
}
BENCHMARK(BM_ParseLarge)->MinTime(1.0);

static void BM_ParseInvalidJson(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!";
    for (auto _ : state) {
        try {
            auto p = JsonCodec::parse(bad);
            benchmark::DoNotOptimize(p);
        } catch (const ParseError&) {}
    }
}
BENCHMARK(BM_ParseInvalidJson)->MinTime(1.0);

static void BM_SerializeLarge(benchmark::State& state) {
    auto tree = JsonCodec::parse(kLargeText);
    for (auto _ : state) {
        auto s = JsonCodec::serialize(tree);
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * kLargeText.size());
}
BENCHMARK(BM_SerializeLarge)->MinTime(1.0);

#include <benchmark/benchmark.h>
#include "typetag/serializer.hpp"
#include "../tests/sample_types.hpp"
#include <string>
#include <vector>

using namespace typetag;

static Serializer make_serializer() {
    return Serializer({sample::uuid_codec(), sample::datetime_codec(), sample::mytype_codec()});
}

// Wide document: n records mixing tagged scalars, compounds and escaped strings
static Value make_document(int n) {
    Value::Array records;
    records.reserve(n);
    for (int i = 0; i < n; ++i) {
        records.push_back(Value::Object{
            {"id", Value::custom(sample::kUid)},
            {"created", Value::custom(sample::kDt)},
            {"name", "record_" + std::to_string(i)},
            {"path", "/var/data/" + std::to_string(i)},
            {"payload", Value::custom(sample::MyType{i, 0.5 * i, Value::Array{"a", "$b"}})},
        });
    }
    return Value::Object{{"records", std::move(records)}};
}

static const Serializer kSerializer = make_serializer();
static const Value kSmallDoc = make_document(1);
static const Value kLargeDoc = make_document(500);
static const Primitive kLargePrimitive = kSerializer.to_primitive(kLargeDoc);
static const std::string kLargeText = kSerializer.dumps(kLargeDoc);

// ---- Transformer benchmarks ----

static void BM_ToPrimitiveSmall(benchmark::State& state) {
    for (auto _ : state) {
        auto p = kSerializer.to_primitive(kSmallDoc);
        benchmark::DoNotOptimize(p);
    }
}
BENCHMARK(BM_ToPrimitiveSmall)->MinTime(1.0);

static void BM_ToPrimitiveLarge(benchmark::State& state) {
    for (auto _ : state) {
        auto p = kSerializer.to_primitive(kLargeDoc);
        benchmark::DoNotOptimize(p);
    }
}
BENCHMARK(BM_ToPrimitiveLarge)->MinTime(1.0);

static void BM_FromPrimitiveLarge(benchmark::State& state) {
    for (auto _ : state) {
        auto v = kSerializer.from_primitive(kLargePrimitive);
        benchmark::DoNotOptimize(v);
    }
}
BENCHMARK(BM_FromPrimitiveLarge)->MinTime(1.0);

// ---- Text benchmarks ----

static void BM_DumpsLarge(benchmark::State& state) {
    for (auto _ : state) {
        auto s = kSerializer.dumps(kLargeDoc);
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * kLargeText.size());
}
BENCHMARK(BM_DumpsLarge)->MinTime(1.0);

static void BM_LoadsLarge(benchmark::State& state) {
    for (auto _ : state) {
        auto v = kSerializer.loads(kLargeText);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(state.iterations() * kLargeText.size());
}
BENCHMARK(BM_LoadsLarge)->MinTime(1.0);

static void BM_LoadsUnknownTag(benchmark::State& state) {
    const std::string bad = R"({"records":[{"id":"$nope:1"}]})";
    for (auto _ : state) {
        try {
            auto v = kSerializer.loads(bad);
            benchmark::DoNotOptimize(v);
        } catch (const UnknownCodecError&) {}
    }
}
BENCHMARK(BM_LoadsUnknownTag)->MinTime(1.0);

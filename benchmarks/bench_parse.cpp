/// @file bench_parse.cpp
/// @brief Parse throughput and read-access benchmarks for rdjson.
///
/// Measured operations:
///   - Parsing (small, medium, large documents; number, string, nesting mixes)
///   - Escape decoding versus verbatim strings
///   - Object lookup below and above the index threshold
///   - Deep copy of a parsed tree
///   - Multi-threaded parse throughput

#include <rdjson/rdjson.hpp>

#include <benchmark/benchmark.h>

#include <string>

#include "testdata.hpp"

using namespace rdjson;

// ═══════════════════════════════════════════════════════════════════════════════
// Parsing
// ═══════════════════════════════════════════════════════════════════════════════

static void run_parse(benchmark::State& state, const std::string& input,
                      const ParseOptions& opts = {}) {
    for (auto _ : state) {
        auto v = parse(input, opts);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}

static void BM_ParseSmall(benchmark::State& state) {
    run_parse(state, testdata::small_json());
}
BENCHMARK(BM_ParseSmall);

static void BM_ParseMedium(benchmark::State& state) {
    run_parse(state, testdata::medium_json());
}
BENCHMARK(BM_ParseMedium);

static void BM_ParseLarge(benchmark::State& state) {
    run_parse(state, testdata::large_json());
}
BENCHMARK(BM_ParseLarge);

static void BM_ParseIntArray(benchmark::State& state) {
    run_parse(state, testdata::int_array(static_cast<int>(state.range(0))));
}
BENCHMARK(BM_ParseIntArray)->Arg(100)->Arg(1000)->Arg(10000);

static void BM_ParseFloatArray(benchmark::State& state) {
    run_parse(state, testdata::float_array(static_cast<int>(state.range(0))));
}
BENCHMARK(BM_ParseFloatArray)->Arg(100)->Arg(1000)->Arg(10000);

static void BM_ParseStringArray(benchmark::State& state) {
    run_parse(state, testdata::string_array(1000, static_cast<int>(state.range(0))));
}
BENCHMARK(BM_ParseStringArray)->Arg(8)->Arg(64)->Arg(512);

static void BM_ParseNested(benchmark::State& state) {
    run_parse(state, testdata::nested(static_cast<int>(state.range(0))));
}
BENCHMARK(BM_ParseNested)->Arg(10)->Arg(50)->Arg(200);

static void BM_ParseFlatObject(benchmark::State& state) {
    run_parse(state, testdata::flat_object(static_cast<int>(state.range(0))));
}
BENCHMARK(BM_ParseFlatObject)->Arg(10)->Arg(100)->Arg(1000);

// ─── Strings: decoded vs verbatim ───────────────────────────────────────────

static std::string escaped_strings() {
    std::string s = "[";
    for (int i = 0; i < 1000; ++i) {
        if (i) s += ',';
        s += R"("line one\nline two\ttabbed \u00e9 end)";
        s += std::to_string(i);
        s += '"';
    }
    return s + "]";
}

static void BM_ParseEscapedStrings(benchmark::State& state) {
    run_parse(state, escaped_strings());
}
BENCHMARK(BM_ParseEscapedStrings);

static void BM_ParseVerbatimStrings(benchmark::State& state) {
    run_parse(state, escaped_strings(), ParseOptions::verbatim());
}
BENCHMARK(BM_ParseVerbatimStrings);

// ═══════════════════════════════════════════════════════════════════════════════
// Access
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_ObjectLookup(benchmark::State& state) {
    const auto count = static_cast<int>(state.range(0));
    const Value v = parse(testdata::flat_object(count));

    int idx = 0;
    for (auto _ : state) {
        const Value* p = v.find("key_" + std::to_string(idx % count));
        benchmark::DoNotOptimize(p);
        ++idx;
    }
    state.counters["keys"] = static_cast<double>(count);
    state.counters["indexed"] = v.as_object().indexed() ? 1.0 : 0.0;
}
BENCHMARK(BM_ObjectLookup)->Arg(8)->Arg(15)->Arg(16)->Arg(100)->Arg(1000);

static void BM_DeepCopy(benchmark::State& state) {
    const Value v = parse(testdata::large_json());
    for (auto _ : state) {
        Value copy = v;
        benchmark::DoNotOptimize(copy);
    }
}
BENCHMARK(BM_DeepCopy);

// ═══════════════════════════════════════════════════════════════════════════════
// Multi-threaded
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_MT_Parse(benchmark::State& state) {
    const auto input = testdata::medium_json();
    for (auto _ : state) {
        auto v = parse(input);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(input.size()));
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_MT_Parse)->Threads(1)->Threads(2)->Threads(4)->Threads(8);

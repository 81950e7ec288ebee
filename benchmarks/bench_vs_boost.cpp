/// @file bench_vs_boost.cpp
/// @brief Head-to-head parse comparison: rdjson vs Boost.JSON.
///
/// Both libraries read identical input from testdata.hpp. Each scenario has
/// a *_Rdjson and a *_BoostJson variant:
///   - Parse: small, medium, large, int/float/string arrays, nesting, flat object
///   - Object key lookup (10, 100, 1000 keys)
///   - Deep copy
///   - Multi-threaded parse throughput
///
/// Built only when Boost.JSON (Boost 1.75 or newer) is found.

#include <benchmark/benchmark.h>

// ─── rdjson headers ─────────────────────────────────────────────────────────
#include <rdjson/rdjson.hpp>

// ─── Boost.JSON headers ─────────────────────────────────────────────────────
#include <boost/json.hpp>

#include <string>

#include "testdata.hpp"

// ═══════════════════════════════════════════════════════════════════════════════
// Shared drivers
// ═══════════════════════════════════════════════════════════════════════════════

static void parse_rdjson(benchmark::State& state, const std::string& input) {
    for (auto _ : state) {
        auto v = rdjson::parse(input);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(input.size()));
}

static void parse_boost(benchmark::State& state, const std::string& input,
                        const boost::json::parse_options& opts = {}) {
    for (auto _ : state) {
        auto v = boost::json::parse(input, {}, opts);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(input.size()));
}

// ═══════════════════════════════════════════════════════════════════════════════
// 1. DOCUMENTS
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_ParseSmall_Rdjson(benchmark::State& state) {
    parse_rdjson(state, testdata::small_json());
}
BENCHMARK(BM_ParseSmall_Rdjson);

static void BM_ParseSmall_BoostJson(benchmark::State& state) {
    parse_boost(state, testdata::small_json());
}
BENCHMARK(BM_ParseSmall_BoostJson);

static void BM_ParseMedium_Rdjson(benchmark::State& state) {
    parse_rdjson(state, testdata::medium_json());
}
BENCHMARK(BM_ParseMedium_Rdjson);

static void BM_ParseMedium_BoostJson(benchmark::State& state) {
    parse_boost(state, testdata::medium_json());
}
BENCHMARK(BM_ParseMedium_BoostJson);

static void BM_ParseLarge_Rdjson(benchmark::State& state) {
    parse_rdjson(state, testdata::large_json());
}
BENCHMARK(BM_ParseLarge_Rdjson);

static void BM_ParseLarge_BoostJson(benchmark::State& state) {
    parse_boost(state, testdata::large_json());
}
BENCHMARK(BM_ParseLarge_BoostJson);

// ═══════════════════════════════════════════════════════════════════════════════
// 2. HOMOGENEOUS ARRAYS
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_ParseIntArray_Rdjson(benchmark::State& state) {
    parse_rdjson(state, testdata::int_array(static_cast<int>(state.range(0))));
}
BENCHMARK(BM_ParseIntArray_Rdjson)->Arg(100)->Arg(1000)->Arg(10000);

static void BM_ParseIntArray_BoostJson(benchmark::State& state) {
    parse_boost(state, testdata::int_array(static_cast<int>(state.range(0))));
}
BENCHMARK(BM_ParseIntArray_BoostJson)->Arg(100)->Arg(1000)->Arg(10000);

static void BM_ParseFloatArray_Rdjson(benchmark::State& state) {
    parse_rdjson(state, testdata::float_array(static_cast<int>(state.range(0))));
}
BENCHMARK(BM_ParseFloatArray_Rdjson)->Arg(1000);

static void BM_ParseFloatArray_BoostJson(benchmark::State& state) {
    parse_boost(state, testdata::float_array(static_cast<int>(state.range(0))));
}
BENCHMARK(BM_ParseFloatArray_BoostJson)->Arg(1000);

static void BM_ParseStringArray_Rdjson(benchmark::State& state) {
    parse_rdjson(state, testdata::string_array(1000, static_cast<int>(state.range(0))));
}
BENCHMARK(BM_ParseStringArray_Rdjson)->Arg(8)->Arg(64)->Arg(512);

static void BM_ParseStringArray_BoostJson(benchmark::State& state) {
    parse_boost(state, testdata::string_array(1000, static_cast<int>(state.range(0))));
}
BENCHMARK(BM_ParseStringArray_BoostJson)->Arg(8)->Arg(64)->Arg(512);

// ═══════════════════════════════════════════════════════════════════════════════
// 3. STRUCTURE
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_ParseNested_Rdjson(benchmark::State& state) {
    parse_rdjson(state, testdata::nested(static_cast<int>(state.range(0))));
}
BENCHMARK(BM_ParseNested_Rdjson)->Arg(10)->Arg(50)->Arg(200);

static void BM_ParseNested_BoostJson(benchmark::State& state) {
    boost::json::parse_options opts;
    opts.max_depth = 512;
    parse_boost(state, testdata::nested(static_cast<int>(state.range(0))), opts);
}
BENCHMARK(BM_ParseNested_BoostJson)->Arg(10)->Arg(50)->Arg(200);

static void BM_ParseFlatObj_Rdjson(benchmark::State& state) {
    parse_rdjson(state, testdata::flat_object(static_cast<int>(state.range(0))));
}
BENCHMARK(BM_ParseFlatObj_Rdjson)->Arg(10)->Arg(100)->Arg(1000);

static void BM_ParseFlatObj_BoostJson(benchmark::State& state) {
    parse_boost(state, testdata::flat_object(static_cast<int>(state.range(0))));
}
BENCHMARK(BM_ParseFlatObj_BoostJson)->Arg(10)->Arg(100)->Arg(1000);

// ═══════════════════════════════════════════════════════════════════════════════
// 4. OBJECT KEY LOOKUP
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_ObjectLookup_Rdjson(benchmark::State& state) {
    const auto count = static_cast<int>(state.range(0));
    const auto v = rdjson::parse(testdata::flat_object(count));

    int idx = 0;
    for (auto _ : state) {
        const auto* p = v.find("key_" + std::to_string(idx % count));
        benchmark::DoNotOptimize(p);
        ++idx;
    }
    state.counters["keys"] = static_cast<double>(count);
}
BENCHMARK(BM_ObjectLookup_Rdjson)->Arg(10)->Arg(100)->Arg(1000);

static void BM_ObjectLookup_BoostJson(benchmark::State& state) {
    const auto count = static_cast<int>(state.range(0));
    const auto v = boost::json::parse(testdata::flat_object(count));
    const auto& obj = v.as_object();

    int idx = 0;
    for (auto _ : state) {
        auto it = obj.find("key_" + std::to_string(idx % count));
        benchmark::DoNotOptimize(it);
        ++idx;
    }
    state.counters["keys"] = static_cast<double>(count);
}
BENCHMARK(BM_ObjectLookup_BoostJson)->Arg(10)->Arg(100)->Arg(1000);

// ═══════════════════════════════════════════════════════════════════════════════
// 5. DEEP COPY
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_DeepCopy_Rdjson(benchmark::State& state) {
    const auto v = rdjson::parse(testdata::large_json());
    for (auto _ : state) {
        rdjson::Value copy = v;
        benchmark::DoNotOptimize(copy);
    }
}
BENCHMARK(BM_DeepCopy_Rdjson);

static void BM_DeepCopy_BoostJson(benchmark::State& state) {
    const auto v = boost::json::parse(testdata::large_json());
    for (auto _ : state) {
        boost::json::value copy = v;
        benchmark::DoNotOptimize(copy);
    }
}
BENCHMARK(BM_DeepCopy_BoostJson);

// ═══════════════════════════════════════════════════════════════════════════════
// 6. MULTI-THREADED PARSE
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_MT_Parse_Rdjson(benchmark::State& state) {
    parse_rdjson(state, testdata::medium_json());
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_MT_Parse_Rdjson)->Threads(1)->Threads(2)->Threads(4);

static void BM_MT_Parse_BoostJson(benchmark::State& state) {
    parse_boost(state, testdata::medium_json());
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_MT_Parse_BoostJson)->Threads(1)->Threads(2)->Threads(4);

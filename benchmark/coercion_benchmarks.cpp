/**
 * @file coercion_benchmarks.cpp
 * @brief Benchmarks for number and date parsing during coercion.
 */

#include <benchmark/benchmark.h>
#include <random>
#include <string>
#include <vector>

#include "tabload/clickhouse_destination.h"
#include "tabload/value_coercer.h"

using namespace tabload;

namespace {

constexpr size_t NUM_VALUES = 10000;

std::vector<std::string> generate_integer_strings(size_t count) {
    std::vector<std::string> result;
    result.reserve(count);
    std::mt19937 gen(42);
    std::uniform_int_distribution<int64_t> dist(-1000000, 1000000);
    for (size_t i = 0; i < count; ++i)
        result.push_back(std::to_string(dist(gen)));
    return result;
}

std::vector<std::string> generate_float_strings(size_t count) {
    std::vector<std::string> result;
    result.reserve(count);
    std::mt19937 gen(42);
    std::uniform_real_distribution<double> dist(-1000.0, 1000.0);
    char buffer[32];
    for (size_t i = 0; i < count; ++i) {
        snprintf(buffer, sizeof(buffer), "%.6f", dist(gen));
        result.push_back(buffer);
    }
    return result;
}

std::vector<std::string> generate_date_strings(size_t count, const char* pattern) {
    std::vector<std::string> result;
    result.reserve(count);
    std::mt19937 gen(42);
    std::uniform_int_distribution<int> year(1950, 2049);
    std::uniform_int_distribution<int> month(1, 12);
    std::uniform_int_distribution<int> day(1, 28);
    char buffer[32];
    for (size_t i = 0; i < count; ++i) {
        snprintf(buffer, sizeof(buffer), pattern, year(gen), month(gen), day(gen));
        result.push_back(buffer);
    }
    return result;
}

TableSchema typed_schema() {
    auto builder = SchemaBuilder::from_names({"n", "x", "when", "label"});
    builder.apply_type_tokens({"i", "f", "d", "s"});
    return builder.build();
}

}  // namespace

static void BM_ParseInt64(benchmark::State& state) {
    const auto values = generate_integer_strings(NUM_VALUES);
    for (auto _ : state) {
        for (const auto& v : values)
            benchmark::DoNotOptimize(parse_int64(v));
    }
    state.SetItemsProcessed(state.iterations() * NUM_VALUES);
}
BENCHMARK(BM_ParseInt64);

static void BM_ParseFloat64(benchmark::State& state) {
    const auto values = generate_float_strings(NUM_VALUES);
    for (auto _ : state) {
        for (const auto& v : values)
            benchmark::DoNotOptimize(parse_float64(v));
    }
    state.SetItemsProcessed(state.iterations() * NUM_VALUES);
}
BENCHMARK(BM_ParseFloat64);

// ISO dates hit the first default pattern; US dates fall through to the fourth
static void BM_DateParserIso(benchmark::State& state) {
    const auto values = generate_date_strings(NUM_VALUES, "%04d-%02d-%02d");
    DateParser dates;
    for (auto _ : state) {
        for (const auto& v : values)
            benchmark::DoNotOptimize(dates.parse(v));
    }
    state.SetItemsProcessed(state.iterations() * NUM_VALUES);
}
BENCHMARK(BM_DateParserIso);

static void BM_DateParserUs(benchmark::State& state) {
    std::vector<std::string> values;
    for (const auto& v : generate_date_strings(NUM_VALUES, "%04d/%02d/%02d")) {
        // yyyy/mm/dd -> mm/dd/yyyy
        values.push_back(v.substr(5, 2) + "/" + v.substr(8, 2) + "/" + v.substr(0, 4));
    }
    DateParser dates;
    for (auto _ : state) {
        for (const auto& v : values)
            benchmark::DoNotOptimize(dates.parse(v));
    }
    state.SetItemsProcessed(state.iterations() * NUM_VALUES);
}
BENCHMARK(BM_DateParserUs);

static void BM_CoerceAndEncodeRow(benchmark::State& state) {
    const TableSchema schema = typed_schema();
    DateParser dates;
    ValueCoercer coercer(schema, dates);
    const auto ints = generate_integer_strings(NUM_VALUES);
    const auto floats = generate_float_strings(NUM_VALUES);
    const auto days = generate_date_strings(NUM_VALUES, "%04d-%02d-%02d");

    std::string out;
    for (auto _ : state) {
        out.clear();
        for (size_t i = 0; i < NUM_VALUES; ++i) {
            CoercedRow row = coercer.coerce({ints[i], floats[i], days[i], "label\twith tab"});
            append_tab_separated(out, row);
        }
        benchmark::DoNotOptimize(out.data());
    }
    state.SetItemsProcessed(state.iterations() * NUM_VALUES);
}
BENCHMARK(BM_CoerceAndEncodeRow);

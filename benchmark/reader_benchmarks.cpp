/**
 * @file reader_benchmarks.cpp
 * @brief Benchmarks for delimited reading and worksheet decoding.
 */

#include <benchmark/benchmark.h>
#include <memory>
#include <random>
#include <sstream>
#include <string>

#include "tabload/delimited_reader.h"
#include "tabload/spreadsheet_reader.h"
#include "tabload/type_inference.h"

using namespace tabload;

namespace {

// Deterministic CSV with an id, a label, a decimal and a date column
std::string generate_csv(size_t rows, bool quoted) {
    std::mt19937 gen(42);  // Fixed seed for reproducibility
    std::uniform_real_distribution<double> price(0.0, 1000.0);
    std::uniform_int_distribution<int> day(1, 28);

    std::string out = "id,label,price,date\n";
    char buffer[128];
    for (size_t i = 0; i < rows; ++i) {
        if (quoted) {
            snprintf(buffer, sizeof(buffer), "%zu,\"item, %zu\",%.2f,2023-06-%02d\n", i, i % 97,
                     price(gen), day(gen));
        } else {
            snprintf(buffer, sizeof(buffer), "%zu,item%zu,%.2f,2023-06-%02d\n", i, i % 97,
                     price(gen), day(gen));
        }
        out += buffer;
    }
    return out;
}

size_t drain(RowReader& reader) {
    size_t rows = 0;
    while (auto row = reader.next()) {
        benchmark::DoNotOptimize(row->data());
        ++rows;
    }
    return rows;
}

}  // namespace

static void BM_DelimitedReader(benchmark::State& state) {
    const std::string csv = generate_csv(static_cast<size_t>(state.range(0)), false);
    for (auto _ : state) {
        DelimitedOptions options;
        DelimitedReader reader(std::make_unique<std::istringstream>(csv), options);
        benchmark::DoNotOptimize(drain(reader));
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * csv.size()));
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_DelimitedReader)->Arg(1000)->Arg(100000);

static void BM_DelimitedReaderQuoted(benchmark::State& state) {
    const std::string csv = generate_csv(static_cast<size_t>(state.range(0)), true);
    for (auto _ : state) {
        DelimitedOptions options;
        DelimitedReader reader(std::make_unique<std::istringstream>(csv), options);
        benchmark::DoNotOptimize(drain(reader));
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * csv.size()));
}
BENCHMARK(BM_DelimitedReaderQuoted)->Arg(100000);

static void BM_TypeInferenceScan(benchmark::State& state) {
    const std::string csv = generate_csv(static_cast<size_t>(state.range(0)), false);
    DateParser dates;
    for (auto _ : state) {
        DelimitedOptions options;
        DelimitedReader reader(std::make_unique<std::istringstream>(csv), options);
        reader.read_header();
        TypeInference inference(dates);
        auto stats = inference.scan(reader, 4);
        benchmark::DoNotOptimize(stats.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_TypeInferenceScan)->Arg(10000);

static void BM_SpreadsheetReader(benchmark::State& state) {
    const size_t rows = static_cast<size_t>(state.range(0));
    SheetGrid grid;
    for (size_t r = 0; r < rows; ++r)
        for (size_t c = 0; c < 8; ++c)
            grid.set(r, c, std::to_string(r * 8 + c));

    for (auto _ : state) {
        SpreadsheetReader reader(grid, CellRange{});
        benchmark::DoNotOptimize(drain(reader));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_SpreadsheetReader)->Arg(10000);

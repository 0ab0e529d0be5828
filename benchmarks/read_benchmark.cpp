/**
 * @file read_benchmark.cpp
 * @brief Benchmarks for paging through a SQLite table
 */

#include <benchmark/benchmark.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <pagewise/pagewise.hpp>

#include "bench_utils.hpp"

namespace {

void SkipWithStatus(benchmark::State &state, const pagewise::Status &status) {
    const std::string message = status.to_string();
    state.SkipWithError(message.c_str());
}

pagewise::Status Populate(pagewise::SqliteQueryExecutor &executor, int64_t rows) {
    auto status = executor.exec(
        "CREATE TABLE bench (id INTEGER PRIMARY KEY, value INTEGER)");
    if (!status.ok()) {
        return status;
    }

    std::string sql = "BEGIN;";
    for (int64_t i = 0; i < rows; ++i) {
        sql += "INSERT INTO bench VALUES (" + std::to_string(i) + ", " +
               std::to_string(i * 7) + ");";
    }
    sql += "COMMIT;";
    status = executor.exec(sql);
    if (!status.ok()) {
        return status;
    }

    return executor.register_query(
        "bench_page",
        "SELECT id, value FROM bench ORDER BY id LIMIT :_pagesize OFFSET :_skiprows");
}

static void BM_Pagewise_ReadAll(benchmark::State &state) {
    const int64_t rows = state.range(0);
    const auto page_size = static_cast<size_t>(state.range(1));

    pagewise::bench::TempDbFile db_file("pagewise_read");
    auto executor = std::make_shared<pagewise::SqliteQueryExecutor>(db_file.path());
    auto status = executor->open();
    if (status.ok()) {
        status = Populate(*executor, rows);
    }
    if (!status.ok()) {
        SkipWithStatus(state, status);
        return;
    }

    for (auto _ : state) {
        pagewise::PagingItemReader reader;
        status = reader.set_query_id("bench_page");
        if (status.ok()) status = reader.set_query_executor(executor);
        if (status.ok()) status = reader.set_page_size(page_size);
        if (status.ok()) status = reader.initialize();
        if (!status.ok()) {
            SkipWithStatus(state, status);
            return;
        }

        std::optional<pagewise::Row> row;
        int64_t sum = 0;
        while (true) {
            status = reader.read_next(&row);
            if (!status.ok()) {
                SkipWithStatus(state, status);
                return;
            }
            if (!row.has_value()) {
                break;
            }
            sum += (*row)[1].as_int64();
        }
        benchmark::DoNotOptimize(sum);
    }

    state.SetItemsProcessed(state.iterations() * rows);
}

}  // namespace

BENCHMARK(BM_Pagewise_ReadAll)
    ->Args({10000, 10})
    ->Args({10000, 100})
    ->Args({10000, 1000})
    ->Unit(benchmark::kMillisecond);

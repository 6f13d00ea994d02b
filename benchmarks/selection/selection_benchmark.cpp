/**
 * @file selection_benchmark.cpp
 * @brief Benchmarks for filtering, sorting and date extraction over large listings
 */

#include <benchmark/benchmark.h>

#include <kcenon/fetcher/core/date_pattern.h>
#include <kcenon/fetcher/pipeline/filter_engine.h>
#include <kcenon/fetcher/pipeline/sort_engine.h>

#include <chrono>
#include <cstdio>
#include <random>
#include <string>

namespace kcenon::fetcher::benchmark {

namespace {

/**
 * @brief Listing of @p count dated report files with shuffled names and times
 */
auto make_listing(std::size_t count) -> file_list {
    std::mt19937 rng(42);
    std::uniform_int_distribution<int> day(1, 28);
    std::uniform_int_distribution<int> month(1, 12);
    std::uniform_int_distribution<int> minutes(0, 60 * 24 * 365);
    std::uniform_int_distribution<uint64_t> size(100, 10 * 1024 * 1024);

    auto base = std::chrono::system_clock::now() - std::chrono::hours(24 * 365);

    file_list files;
    files.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        char name[64];
        std::snprintf(name, sizeof(name), "report_%04d-%02d-%02d_%zu.%s", 2024, month(rng),
                      day(rng), i, (i % 4 == 0) ? "tmp" : "csv");

        file_entry entry;
        entry.name = name;
        entry.path = "/exports/daily/" + entry.name;
        entry.size = size(rng);
        entry.mtime = base + std::chrono::minutes(minutes(rng));
        files.push_back(std::move(entry));
    }
    return files;
}

}  // namespace

/**
 * @brief Include, exclude and skip patterns plus a size bound
 */
static void BM_Filter_Patterns(::benchmark::State& state) {
    auto files = make_listing(static_cast<std::size_t>(state.range(0)));

    transfer_config config;
    config.selection.pattern = R"(^report_\d{4}-\d{2}-\d{2}_\d+\.csv$)";
    config.selection.exclude_pattern = "_0\\.";
    config.selection.skip_patterns = {R"(\.tmp$)", "~$"};
    config.selection.min_size = "1KB";
    filter_engine engine(config);

    for (auto _ : state) {
        auto out = engine.apply(files);
        ::benchmark::DoNotOptimize(out.files.data());
    }

    state.SetItemsProcessed(static_cast<int64_t>(files.size()) *
                           static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Window over dates extracted from file names
 */
static void BM_Filter_ExtractedDateWindow(::benchmark::State& state) {
    auto files = make_listing(static_cast<std::size_t>(state.range(0)));

    transfer_config config;
    config.sorting.sort_by_date_in_filename = true;
    config.date_window.start = "2024-03-01";
    config.date_window.end = "2024-09-30";
    filter_engine engine(config);

    for (auto _ : state) {
        auto out = engine.apply(files);
        ::benchmark::DoNotOptimize(out.files.data());
    }

    state.SetItemsProcessed(static_cast<int64_t>(files.size()) *
                           static_cast<int64_t>(state.iterations()));
}

static void BM_Sort_ModifiedTime(::benchmark::State& state) {
    auto files = make_listing(static_cast<std::size_t>(state.range(0)));

    sort_settings settings;
    settings.sort_by_date = false;
    settings.sort_files_by_modified_time = true;
    settings.sort_descending = true;
    sort_engine engine(settings);

    for (auto _ : state) {
        auto sorted = engine.sort(files);
        ::benchmark::DoNotOptimize(sorted.data());
    }

    state.SetItemsProcessed(static_cast<int64_t>(files.size()) *
                           static_cast<int64_t>(state.iterations()));
}

static void BM_Sort_DateInFilename(::benchmark::State& state) {
    auto files = make_listing(static_cast<std::size_t>(state.range(0)));

    sort_settings settings;
    settings.sort_by_date_in_filename = true;
    sort_engine engine(settings);

    for (auto _ : state) {
        auto sorted = engine.sort(files);
        ::benchmark::DoNotOptimize(sorted.data());
    }

    state.SetItemsProcessed(static_cast<int64_t>(files.size()) *
                           static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Date auto-detection over the whole listing
 */
static void BM_Sort_AutoDetect(::benchmark::State& state) {
    auto files = make_listing(static_cast<std::size_t>(state.range(0)));
    sort_engine engine(sort_settings{});

    for (auto _ : state) {
        auto plan = engine.plan(files);
        ::benchmark::DoNotOptimize(plan);
    }
}

static void BM_DatePattern_Search(::benchmark::State& state) {
    auto compiled = compile_date_format("%Y-%m-%d");
    if (!compiled) {
        state.SkipWithError("Failed to compile date format");
        return;
    }
    const auto& pattern = compiled.value();
    const std::string name = "export_region_eu_2024-06-17_final_v2.csv";

    for (auto _ : state) {
        auto found = pattern.search(name);
        ::benchmark::DoNotOptimize(found);
    }
}

BENCHMARK(BM_Filter_Patterns)
    ->Arg(1000)
    ->Arg(10000)
    ->Arg(100000)
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Filter_ExtractedDateWindow)
    ->Arg(1000)
    ->Arg(10000)
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Sort_ModifiedTime)
    ->Arg(1000)
    ->Arg(10000)
    ->Arg(100000)
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Sort_DateInFilename)
    ->Arg(1000)
    ->Arg(10000)
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Sort_AutoDetect)
    ->Arg(1000)
    ->Arg(10000)
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_DatePattern_Search)->Unit(::benchmark::kMicrosecond);

}  // namespace kcenon::fetcher::benchmark

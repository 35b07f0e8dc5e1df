/**
 * @file bench_filter_discovery.cpp
 * @brief Benchmarks for filter evaluation and local discovery
 */

#include <benchmark/benchmark.h>

#include <kcenon/log_collector/core/filter_engine.h>
#include <kcenon/log_collector/core/logging.h>
#include <kcenon/log_collector/discovery/discovery_engine.h>

#include "utils/benchmark_helpers.h"

namespace kcenon::log_collector::benchmark {

/**
 * @brief Filter chains of increasing cost over an in-memory listing
 */
static void BM_FilterEngine_Apply(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    const auto mode = state.range(1);
    auto entries = test_data_generator::generate_entries(count, 42);

    filter_chain chain;
    if (mode >= 1) {
        chain.push_back(filter_config::extensions({".log", ".txt"}).value());
    }
    if (mode >= 2) {
        chain.push_back(filter_config::date_since(std::chrono::system_clock::now() -
                                                  std::chrono::hours(24 * 7)));
    }
    if (mode >= 3) {
        auto pattern = filter_config::pattern(R"(^(syslog|kern|server).*)");
        if (!pattern) {
            state.SkipWithError("Failed to compile pattern");
            return;
        }
        chain.push_back(std::move(pattern.value()));
    }

    for (auto _ : state) {
        auto matched = filter_engine::apply(entries, chain);
        ::benchmark::DoNotOptimize(matched);
    }

    state.SetItemsProcessed(static_cast<int64_t>(count) *
                            static_cast<int64_t>(state.iterations()));
}

static void BM_FilterEngine_Sort(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    const auto entries = test_data_generator::generate_entries(count, 42);

    for (auto _ : state) {
        state.PauseTiming();
        auto copy = entries;
        state.ResumeTiming();

        filter_engine::sort_entries(copy, sort_key::modified, true);
        ::benchmark::DoNotOptimize(copy);
    }

    state.SetItemsProcessed(static_cast<int64_t>(count) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Walk a local tree to exhaustion
 *
 * The listing target is stated for 10K files; compare the 10000 case
 * against targets::listing_10k_files_ms.
 */
static void BM_Discovery_LocalTree(::benchmark::State& state) {
    get_logger().set_level(log_level::warn);

    const auto files = static_cast<std::size_t>(state.range(0));
    temp_tree_manager trees;
    auto root = trees.create_log_tree(files, 100, 64);
    source_spec source{source_kind::local, root.string(), "bench"};

    for (auto _ : state) {
        auto stream = discovery_engine::discover(source, {}, nullptr);
        if (!stream) {
            state.SkipWithError("Failed to start discovery");
            return;
        }
        std::size_t seen = 0;
        for (;;) {
            auto next = stream.value().next();
            if (!next) {
                state.SkipWithError("Discovery failed");
                return;
            }
            if (!next.value()) {
                break;
            }
            ++seen;
        }
        ::benchmark::DoNotOptimize(seen);
    }

    state.SetItemsProcessed(static_cast<int64_t>(files) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_FilterEngine_Apply)
    ->ArgsProduct({{1000, 10000, 100000}, {0, 1, 2, 3}})
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_FilterEngine_Sort)
    ->Arg(1000)
    ->Arg(10000)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Discovery_LocalTree)
    ->Arg(1000)
    ->Arg(10000)
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::log_collector::benchmark

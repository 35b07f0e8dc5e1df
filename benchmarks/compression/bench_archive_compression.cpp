/**
 * @file bench_archive_compression.cpp
 * @brief Benchmarks for local zip and tar.gz archiving of log files
 */

#include <benchmark/benchmark.h>

#include <kcenon/log_collector/compression/compression_handler.h>
#include <kcenon/log_collector/core/logging.h>

#include "utils/benchmark_helpers.h"

#include <chrono>

namespace kcenon::log_collector::benchmark {

namespace {

auto entries_for(const std::filesystem::path& root) -> std::vector<file_entry> {
    std::vector<file_entry> entries;
    for (const auto& item : std::filesystem::recursive_directory_iterator(root)) {
        if (!item.is_regular_file()) {
            continue;
        }
        file_entry entry;
        entry.path = std::filesystem::relative(item.path(), root).generic_string();
        entry.absolute_path = item.path().string();
        entry.size = item.file_size();
        entries.push_back(std::move(entry));
    }
    return entries;
}

}  // namespace

/**
 * @brief Archive a tree of log files
 * @param range(0) total input size, range(1) format, range(2) level
 */
static void BM_CompressLocal(::benchmark::State& state) {
    get_logger().set_level(log_level::warn);

    const auto total = static_cast<std::size_t>(state.range(0));
    const auto format = state.range(1) == 0 ? archive_format::zip : archive_format::tar_gz;
    const auto level = static_cast<int>(state.range(2));

    temp_tree_manager trees;
    auto root = trees.create_log_tree(16, 8, total / 16);
    auto entries = entries_for(root);

    compression_handler handler(compression_settings{level});
    const auto archive = trees.base_dir() / (std::string("bench.") + to_string(format));

    uint64_t archive_size = 0;
    double seconds = 0.0;
    for (auto _ : state) {
        auto start = std::chrono::steady_clock::now();
        auto written = handler.compress_local(entries, archive, format);
        seconds += std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        if (!written) {
            state.SkipWithError(written.error().message.c_str());
            return;
        }
        archive_size = written.value().archive_size;

        state.PauseTiming();
        std::error_code ec;
        std::filesystem::remove(archive, ec);
        state.ResumeTiming();
    }

    state.SetBytesProcessed(static_cast<int64_t>(total) *
                            static_cast<int64_t>(state.iterations()));
    state.counters["ratio"] =
        archive_size == 0 ? 0.0 : static_cast<double>(total) / static_cast<double>(archive_size);
    if (seconds > 0.0) {
        state.SetLabel(format_throughput(static_cast<double>(total) *
                                         static_cast<double>(state.iterations()) / seconds));
    }
}

static void BM_VerifyArchive(::benchmark::State& state) {
    get_logger().set_level(log_level::warn);

    const auto total = static_cast<std::size_t>(state.range(0));
    temp_tree_manager trees;
    auto root = trees.create_log_tree(16, 8, total / 16);
    auto entries = entries_for(root);

    compression_handler handler;
    const auto archive = trees.base_dir() / "verify.tar.gz";
    auto written = handler.compress_local(entries, archive, archive_format::tar_gz);
    if (!written) {
        state.SkipWithError(written.error().message.c_str());
        return;
    }

    for (auto _ : state) {
        auto members = compression_handler::verify_archive(archive);
        if (!members) {
            state.SkipWithError(members.error().message.c_str());
            return;
        }
        ::benchmark::DoNotOptimize(members);
    }

    state.SetBytesProcessed(static_cast<int64_t>(total) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_CompressLocal)
    ->ArgsProduct({{static_cast<int64_t>(sizes::medium_log), static_cast<int64_t>(sizes::large_log)},
                   {0, 1},
                   {1, 6, 9}})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_VerifyArchive)
    ->Arg(static_cast<int64_t>(sizes::medium_log))
    ->Arg(static_cast<int64_t>(sizes::large_log))
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::log_collector::benchmark

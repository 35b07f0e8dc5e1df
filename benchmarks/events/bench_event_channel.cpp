/**
 * @file bench_event_channel.cpp
 * @brief Benchmarks for event publication under contention
 */

#include <benchmark/benchmark.h>

#include <kcenon/log_collector/orchestrator/event_channel.h>

#include "utils/benchmark_helpers.h"

#include <atomic>
#include <thread>

namespace kcenon::log_collector::benchmark {

static void BM_EventChannel_PublishDrain(::benchmark::State& state) {
    const auto batch = static_cast<std::size_t>(state.range(0));
    event_channel channel(targets::event_queue_capacity);

    for (auto _ : state) {
        for (std::size_t i = 0; i < batch; ++i) {
            channel.publish(job_progress{job_id(1), i, batch, "syslog", job_phase::downloading});
        }
        auto events = channel.drain();
        ::benchmark::DoNotOptimize(events);
    }

    state.SetItemsProcessed(static_cast<int64_t>(batch) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Progress flood while a consumer drains, as during a fast download
 */
static void BM_EventChannel_ProducerConsumer(::benchmark::State& state) {
    const auto events_per_iteration = static_cast<std::size_t>(state.range(0));

    for (auto _ : state) {
        event_channel channel(targets::event_queue_capacity);
        std::atomic<bool> done{false};
        std::size_t received = 0;

        std::thread consumer([&] {
            while (!done.load() || channel.size() > 0) {
                if (channel.wait_pop(std::chrono::milliseconds(1))) {
                    ++received;
                }
            }
        });

        for (std::size_t i = 0; i < events_per_iteration; ++i) {
            channel.publish(job_progress{job_id(1), i, events_per_iteration, {}, std::nullopt});
        }
        channel.publish(job_completed{});
        done.store(true);
        consumer.join();

        ::benchmark::DoNotOptimize(received);
        state.counters["dropped"] = static_cast<double>(channel.dropped_count());
    }

    state.SetItemsProcessed(static_cast<int64_t>(events_per_iteration) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_EventChannel_PublishDrain)
    ->Arg(64)
    ->Arg(1024)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_EventChannel_ProducerConsumer)
    ->Arg(10000)
    ->Arg(100000)
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

}  // namespace kcenon::log_collector::benchmark

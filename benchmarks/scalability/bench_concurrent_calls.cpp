/**
 * @file bench_concurrent_calls.cpp
 * @brief Benchmarks for many calls sharing one block pool
 *
 * Blocks finish immediately, so these measure the orchestration cost of a
 * call: checks, splitting, pool hand-off, classification and notification.
 */

#include <benchmark/benchmark.h>

#include "unit/call/call_fixtures.h"

#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

namespace kcenon::segment_transfer::benchmark {

using test::call_harness;

/**
 * @brief Benchmark for one call at a time with a varying block count
 */
static void BM_SingleCall(::benchmark::State& state) {
    get_logger().set_level(log_level::fatal);
    const auto blocks = static_cast<int>(state.range(0));

    call_harness harness;
    auto task = download_task::builder(1, "https://example.com/bench.bin")
                    .with_connection_count(blocks)
                    .with_listener(harness.listener)
                    .build();
    if (!task) {
        state.SkipWithError("Failed to build task");
        return;
    }

    for (auto _ : state) {
        auto call = download_call::create(task.value(), harness.env);
        if (!call->execute()) {
            state.SkipWithError("Call abandoned");
            return;
        }
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
    state.counters["workers"] = static_cast<double>(harness.pool.worker_count());
}

/**
 * @brief Benchmark for N calls running concurrently on one pool
 */
static void BM_ConcurrentCalls(::benchmark::State& state) {
    get_logger().set_level(log_level::fatal);
    const auto call_count = static_cast<int32_t>(state.range(0));

    call_harness harness;

    for (auto _ : state) {
        std::vector<std::shared_ptr<download_call>> calls;
        calls.reserve(static_cast<std::size_t>(call_count));
        for (int32_t id = 0; id < call_count; ++id) {
            calls.push_back(download_call::create(harness.make_task(id), harness.env));
        }

        std::vector<std::thread> threads;
        threads.reserve(calls.size());
        for (auto& call : calls) {
            threads.emplace_back([call] { call->run(); });
        }
        for (auto& thread : threads) {
            thread.join();
        }
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * call_count);
    state.counters["workers"] = static_cast<double>(harness.pool.worker_count());
}

BENCHMARK(BM_SingleCall)->Arg(1)->Arg(4)->Arg(16)->UseRealTime();

BENCHMARK(BM_ConcurrentCalls)->Arg(8)->Arg(64)->Arg(256)->UseRealTime();

}  // namespace kcenon::segment_transfer::benchmark

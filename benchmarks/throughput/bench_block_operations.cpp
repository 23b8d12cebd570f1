/**
 * @file bench_block_operations.cpp
 * @brief Benchmarks for block assembly and breakpoint bookkeeping
 */

#include <benchmark/benchmark.h>

#include <kcenon/segment_transfer/breakpoint/breakpoint_info.h>
#include <kcenon/segment_transfer/breakpoint/breakpoint_store.h>
#include <kcenon/segment_transfer/core/download_task.h>
#include <kcenon/segment_transfer/strategy/download_strategy.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::segment_transfer::benchmark {

/**
 * @brief Benchmark for assemble_blocks over transfer sizes and block counts
 */
static void BM_AssembleBlocks(::benchmark::State& state) {
    const auto instance_length = state.range(0);
    const auto connections = static_cast<int>(state.range(1));

    auto task = download_task::builder(1, "https://example.com/bench.bin")
                    .with_connection_count(connections)
                    .build();
    if (!task) {
        state.SkipWithError("Failed to build task");
        return;
    }

    download_strategy strategy;
    breakpoint_info info(1, "https://example.com/bench.bin", "bench.bin");

    for (auto _ : state) {
        strategy.assemble_blocks(*task.value(), info, instance_length, true);
        ::benchmark::DoNotOptimize(info.total_length());
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * connections);
}

/**
 * @brief Benchmark for scanning blocks the way an attempt does before dispatch
 */
static void BM_ScanBlocksForDispatch(::benchmark::State& state) {
    const auto block_count = state.range(0);

    breakpoint_info info(1, "https://example.com/bench.bin", "bench.bin");
    for (int64_t i = 0; i < block_count; ++i) {
        // every other block is finished, every third overran its range
        int64_t current = (i % 2 == 0) ? 1024 : (i % 3 == 0 ? 2048 : 512);
        info.add_block({i * 1024, 1024, current});
    }

    for (auto _ : state) {
        std::size_t pending = 0;
        for (std::size_t i = 0; i < info.block_count(); ++i) {
            auto block = info.block(i);
            if (block.is_complete()) {
                continue;
            }
            reset_block_if_dirty(block);
            ++pending;
        }
        ::benchmark::DoNotOptimize(pending);
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * block_count);
}

/**
 * @brief Benchmark for the store's create, start and end cycle
 */
static void BM_BreakpointStoreCycle(::benchmark::State& state) {
    memory_breakpoint_store store;
    std::vector<std::shared_ptr<const download_task>> tasks;
    for (int32_t id = 0; id < 64; ++id) {
        auto task = download_task::builder(id, "https://example.com/" + std::to_string(id))
                        .build();
        if (!task) {
            state.SkipWithError("Failed to build task");
            return;
        }
        tasks.push_back(task.value());
    }

    for (auto _ : state) {
        for (const auto& task : tasks) {
            auto created = store.create_and_insert(*task);
            if (!created) {
                state.SkipWithError("Failed to create breakpoint info");
                return;
            }
            store.on_task_start(task->id());
            store.on_task_end(task->id(), end_cause::completed, std::nullopt);
        }
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(tasks.size()));
}

BENCHMARK(BM_AssembleBlocks)
    ->Args({512 * 1024, 1})
    ->Args({64 * 1024 * 1024, 4})
    ->Args({int64_t{4} * 1024 * 1024 * 1024, 5})
    ->Args({int64_t{4} * 1024 * 1024 * 1024, 32});

BENCHMARK(BM_ScanBlocksForDispatch)->Arg(4)->Arg(32)->Arg(256);

BENCHMARK(BM_BreakpointStoreCycle);

}  // namespace kcenon::segment_transfer::benchmark

/**
 * @file download_strategy.cpp
 * @brief Implementation of block splitting
 */

#include <kcenon/segment_transfer/strategy/download_strategy.h>

#include <kcenon/segment_transfer/breakpoint/breakpoint_info.h>
#include <kcenon/segment_transfer/core/download_task.h>
#include <kcenon/segment_transfer/core/logging.h>

#include <algorithm>

namespace kcenon::segment_transfer {

download_strategy::download_strategy() = default;

download_strategy::download_strategy(download_strategy_config config)
    : config_(config) {}

auto download_strategy::is_use_multi_block(bool accept_range) const -> bool {
    return accept_range;
}

auto download_strategy::determine_block_count(const download_task& task,
                                               int64_t instance_length) const -> int {
    if (auto forced = task.connection_count()) {
        return *forced;
    }

    if (instance_length < config_.one_connection_limit) return 1;
    if (instance_length < config_.two_connection_limit) return std::min(2, config_.max_block_count);
    if (instance_length < config_.three_connection_limit) return std::min(3, config_.max_block_count);
    if (instance_length < config_.four_connection_limit) return std::min(4, config_.max_block_count);
    return config_.max_block_count;
}

auto download_strategy::inspect_another_same_info(const download_task& /*task*/,
                                                  breakpoint_info& /*info*/,
                                                  int64_t /*instance_length*/)
    -> result<void> {
    return {};
}

void download_strategy::assemble_blocks(const download_task& task,
                                        breakpoint_info& info,
                                        int64_t instance_length,
                                        bool accept_range) const {
    info.reset_blocks();

    if (instance_length < 0) {
        info.set_chunked(true);
        info.add_block(block_info(0, -1));
        ST_LOG_DEBUG(log_category::breakpoint,
            "Task " + std::to_string(task.id()) + " assembled as chunked single block");
        return;
    }
    info.set_chunked(false);

    int block_count = 1;
    if (is_use_multi_block(accept_range)) {
        block_count = determine_block_count(task, instance_length);
    }
    if (block_count < 1) {
        ST_LOG_WARN(log_category::breakpoint,
            "Task " + std::to_string(task.id()) + " got block count " +
            std::to_string(block_count) + ", using one block");
        block_count = 1;
    }
    // every block carries at least one byte
    if (instance_length > 0) {
        block_count = static_cast<int>(
            std::min<int64_t>(block_count, instance_length));
    } else {
        block_count = 1;
    }

    const int64_t each_length = instance_length / block_count;
    int64_t start_offset = 0;
    int64_t content_length = 0;
    for (int i = 0; i < block_count; ++i) {
        start_offset += content_length;
        if (i == 0) {
            content_length = each_length + instance_length % block_count;
        } else {
            content_length = each_length;
        }
        info.add_block(block_info(start_offset, content_length));
    }

    task_log_context ctx;
    ctx.task_id = task.id();
    ctx.block_count = static_cast<std::size_t>(block_count);
    ctx.instance_length = instance_length;
    ST_LOG_DEBUG_CTX(log_category::breakpoint, "Assembled blocks", ctx);
}

}  // namespace kcenon::segment_transfer

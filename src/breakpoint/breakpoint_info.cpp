/**
 * @file breakpoint_info.cpp
 * @brief Implementation of block and breakpoint bookkeeping
 */

#include <kcenon/segment_transfer/breakpoint/breakpoint_info.h>
#include <kcenon/segment_transfer/core/logging.h>

#include <numeric>

namespace kcenon::segment_transfer {

auto reset_block_if_dirty(block_info& block) -> bool {
    if (!block.is_dirty()) {
        return false;
    }

    ST_LOG_WARN(log_category::breakpoint,
        "Resetting dirty block at " + std::to_string(block.start_offset) +
        " (current " + std::to_string(block.current_offset) + "/" +
        std::to_string(block.content_length) + ")");
    block.reset();
    return true;
}

breakpoint_info::breakpoint_info(int32_t task_id, std::string url, std::string filename)
    : task_id_(task_id)
    , url_(std::move(url))
    , filename_(std::move(filename)) {
}

auto breakpoint_info::total_length() const -> int64_t {
    if (chunked_) {
        return -1;
    }
    return std::accumulate(blocks_.begin(), blocks_.end(), int64_t{0},
        [](int64_t sum, const block_info& b) { return sum + b.content_length; });
}

auto breakpoint_info::total_offset() const -> int64_t {
    return std::accumulate(blocks_.begin(), blocks_.end(), int64_t{0},
        [](int64_t sum, const block_info& b) { return sum + b.current_offset; });
}

}  // namespace kcenon::segment_transfer

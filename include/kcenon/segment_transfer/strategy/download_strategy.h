/**
 * @file download_strategy.h
 * @brief Block splitting and breakpoint reuse decisions
 */

#ifndef KCENON_SEGMENT_TRANSFER_STRATEGY_DOWNLOAD_STRATEGY_H
#define KCENON_SEGMENT_TRANSFER_STRATEGY_DOWNLOAD_STRATEGY_H

#include <kcenon/segment_transfer/core/config.h>
#include <kcenon/segment_transfer/core/types.h>

#include <cstdint>

namespace kcenon::segment_transfer {

class breakpoint_info;
class download_task;

/**
 * @brief Decides how a fresh transfer is split into blocks
 *
 * The virtual members are the extension points; assemble_blocks() is the
 * fixed algorithm built on top of them.
 */
class download_strategy {
public:
    download_strategy();
    explicit download_strategy(download_strategy_config config);
    virtual ~download_strategy() = default;

    /**
     * @brief Whether the transfer may be split at all
     * @param accept_range Remote supports range requests
     */
    [[nodiscard]] virtual auto is_use_multi_block(bool accept_range) const -> bool;

    /**
     * @brief Number of blocks for a fresh transfer
     *
     * The task's connection count wins; otherwise the configured size
     * thresholds decide.
     */
    [[nodiscard]] virtual auto determine_block_count(const download_task& task,
                                                     int64_t instance_length) const -> int;

    /**
     * @brief Hook letting another idle breakpoint with the same remote
     *        identity be reused for this task
     * @return Success, or reuse_rejected to abandon the attempt
     */
    [[nodiscard]] virtual auto inspect_another_same_info(const download_task& task,
                                                         breakpoint_info& info,
                                                         int64_t instance_length)
        -> result<void>;

    /**
     * @brief Replace the blocks of @p info with a fresh split
     *
     * The first block absorbs the remainder of the division. A negative
     * instance length marks the info chunked and produces one block of
     * unknown length. A block count below one is treated as one.
     */
    void assemble_blocks(const download_task& task,
                         breakpoint_info& info,
                         int64_t instance_length,
                         bool accept_range) const;

    [[nodiscard]] auto config() const -> const download_strategy_config& { return config_; }

private:
    download_strategy_config config_;
};

}  // namespace kcenon::segment_transfer

#endif  // KCENON_SEGMENT_TRANSFER_STRATEGY_DOWNLOAD_STRATEGY_H

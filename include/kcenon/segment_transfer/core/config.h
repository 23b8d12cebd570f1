/**
 * @file config.h
 * @brief Configuration for segment_transfer
 */

#ifndef KCENON_SEGMENT_TRANSFER_CORE_CONFIG_H
#define KCENON_SEGMENT_TRANSFER_CORE_CONFIG_H

#include <kcenon/segment_transfer/core/logging.h>
#include <kcenon/segment_transfer/core/types.h>

#include <chrono>
#include <cstdint>
#include <string>

namespace kcenon::segment_transfer {

/**
 * @brief Worker pool configuration
 */
struct pool_config {
    std::string name = "segment_transfer block";
    std::chrono::milliseconds idle_timeout{60000};  ///< Idle worker lifetime

    [[nodiscard]] auto validate() const -> result<void>;
};

/**
 * @brief Block splitting thresholds
 *
 * A transfer shorter than one_connection_limit uses one block, shorter
 * than two_connection_limit uses two, and so on; anything longer uses
 * max_block_count blocks.
 */
struct download_strategy_config {
    int64_t one_connection_limit = 1024 * 1024;             // 1MB
    int64_t two_connection_limit = 5 * 1024 * 1024;         // 5MB
    int64_t three_connection_limit = 50 * 1024 * 1024;      // 50MB
    int64_t four_connection_limit = 100 * 1024 * 1024;      // 100MB
    int max_block_count = 5;

    [[nodiscard]] auto validate() const -> result<void>;
};

/**
 * @brief Top-level configuration
 */
struct segment_transfer_config {
    pool_config pool;
    download_strategy_config strategy;
    log_level level = log_level::info;

    class builder;
};

/**
 * @brief Builder for segment_transfer_config
 */
class segment_transfer_config::builder {
public:
    builder();

    auto with_pool_name(std::string name) -> builder&;

    /**
     * @brief Set how long an idle pool worker lives
     * @param timeout Idle timeout (default: 60s)
     * @return Reference to builder for chaining
     */
    auto with_idle_timeout(std::chrono::milliseconds timeout) -> builder&;

    auto with_strategy(const download_strategy_config& strategy) -> builder&;

    auto with_max_block_count(int count) -> builder&;

    auto with_log_level(log_level level) -> builder&;

    /**
     * @brief Validate and build the configuration
     * @return Configuration or invalid_argument error
     */
    [[nodiscard]] auto build() -> result<segment_transfer_config>;

private:
    segment_transfer_config config_;
};

}  // namespace kcenon::segment_transfer

#endif  // KCENON_SEGMENT_TRANSFER_CORE_CONFIG_H

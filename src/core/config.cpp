/**
 * @file config.cpp
 * @brief Configuration validation and builder
 */

#include <kcenon/segment_transfer/core/config.h>

namespace kcenon::segment_transfer {

auto pool_config::validate() const -> result<void> {
    if (name.empty()) {
        return unexpected(error(error_code::invalid_argument,
            "pool name must not be empty"));
    }
    if (idle_timeout.count() <= 0) {
        return unexpected(error(error_code::invalid_argument,
            "idle timeout must be positive"));
    }
    return {};
}

auto download_strategy_config::validate() const -> result<void> {
    if (one_connection_limit <= 0 ||
        one_connection_limit > two_connection_limit ||
        two_connection_limit > three_connection_limit ||
        three_connection_limit > four_connection_limit) {
        return unexpected(error(error_code::invalid_argument,
            "block thresholds must be positive and ascending"));
    }
    if (max_block_count < 1) {
        return unexpected(error(error_code::invalid_argument,
            "max block count must be at least 1"));
    }
    return {};
}

// builder

segment_transfer_config::builder::builder() = default;

auto segment_transfer_config::builder::with_pool_name(std::string name) -> builder& {
    config_.pool.name = std::move(name);
    return *this;
}

auto segment_transfer_config::builder::with_idle_timeout(
    std::chrono::milliseconds timeout) -> builder& {
    config_.pool.idle_timeout = timeout;
    return *this;
}

auto segment_transfer_config::builder::with_strategy(
    const download_strategy_config& strategy) -> builder& {
    config_.strategy = strategy;
    return *this;
}

auto segment_transfer_config::builder::with_max_block_count(int count) -> builder& {
    config_.strategy.max_block_count = count;
    return *this;
}

auto segment_transfer_config::builder::with_log_level(log_level level) -> builder& {
    config_.level = level;
    return *this;
}

auto segment_transfer_config::builder::build() -> result<segment_transfer_config> {
    if (auto valid = config_.pool.validate(); !valid) {
        return unexpected(valid.error());
    }
    if (auto valid = config_.strategy.validate(); !valid) {
        return unexpected(valid.error());
    }
    return config_;
}

}  // namespace kcenon::segment_transfer

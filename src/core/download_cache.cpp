/**
 * @file download_cache.cpp
 * @brief Implementation of the per-attempt status aggregator
 */

#include <kcenon/segment_transfer/core/download_cache.h>
#include <kcenon/segment_transfer/core/logging.h>
#include <kcenon/segment_transfer/file/process_file_strategy.h>

namespace kcenon::segment_transfer {

download_cache::download_cache(std::shared_ptr<output_sink> sink)
    : sink_(std::move(sink)) {}

auto download_cache::pre_error(error err) -> std::shared_ptr<download_cache> {
    auto cache = std::make_shared<download_cache>(nullptr);
    cache->set_unknown_error(std::move(err));
    return cache;
}

void download_cache::catch_error(const error& err) {
    if (user_canceled_.load()) {
        ST_LOG_DEBUG(log_category::call,
            "Ignoring error after user cancel: " + err.message);
        return;
    }

    switch (err.code) {
        case error_code::precondition_failed:
            set_precondition_failed(err);
            break;
        case error_code::server_canceled:
            set_server_canceled(err);
            break;
        case error_code::file_busy_after_run:
            set_file_busy_after_run();
            break;
        case error_code::pre_allocate_failed:
            set_pre_allocate_failed(err);
            break;
        case error_code::interrupted:
            break;
        default:
            set_unknown_error(err);
            ST_LOG_WARN(log_category::call,
                std::string("Unknown transfer error: ") + to_string(err.code) +
                " (" + err.message + ")");
            break;
    }
}

void download_cache::set_precondition_failed(error err) {
    precondition_failed_.store(true);
    record(std::move(err));
}

void download_cache::set_server_canceled(error err) {
    server_canceled_.store(true);
    record(std::move(err));
}

void download_cache::set_file_busy_after_run() {
    file_busy_after_run_.store(true);
}

void download_cache::set_pre_allocate_failed(error err) {
    pre_allocate_failed_.store(true);
    record(std::move(err));
}

void download_cache::set_unknown_error(error err) {
    unknown_error_.store(true);
    record(std::move(err));
}

void download_cache::set_user_canceled() {
    user_canceled_.store(true);
}

auto download_cache::is_interrupt() const noexcept -> bool {
    return precondition_failed_.load() || server_canceled_.load() ||
           file_busy_after_run_.load() || pre_allocate_failed_.load() ||
           unknown_error_.load() || user_canceled_.load();
}

auto download_cache::real_cause() const -> std::optional<error> {
    std::lock_guard lock(cause_mutex_);
    return real_cause_;
}

void download_cache::record(error err) {
    std::lock_guard lock(cause_mutex_);
    real_cause_ = std::move(err);
}

}  // namespace kcenon::segment_transfer

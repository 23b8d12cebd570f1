/**
 * @file download_cache.h
 * @brief Per-attempt status aggregator shared by every block chain
 *
 * Block chains report failures into the cache from worker threads; the
 * call reads the flags once all chains have returned and derives the
 * terminal end_cause from them.
 */

#ifndef KCENON_SEGMENT_TRANSFER_CORE_DOWNLOAD_CACHE_H
#define KCENON_SEGMENT_TRANSFER_CORE_DOWNLOAD_CACHE_H

#include <kcenon/segment_transfer/core/types.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>

namespace kcenon::segment_transfer {

class output_sink;

/**
 * @brief Thread-safe status flags of one attempt
 */
class download_cache {
public:
    explicit download_cache(std::shared_ptr<output_sink> sink);
    virtual ~download_cache() = default;

    download_cache(const download_cache&) = delete;
    auto operator=(const download_cache&) -> download_cache& = delete;

    /**
     * @brief Cache for an attempt that failed before any sink existed
     *
     * The unknown error flag is already set with @p err as the cause.
     */
    [[nodiscard]] static auto pre_error(error err) -> std::shared_ptr<download_cache>;

    [[nodiscard]] auto sink() const -> std::shared_ptr<output_sink> { return sink_; }

    /**
     * @brief Classify a failure raised by a chain or a validator
     *
     * Ignored once the user canceled. Interruptions are not recorded.
     */
    void catch_error(const error& err);

    void set_precondition_failed(error err);
    void set_server_canceled(error err);
    void set_file_busy_after_run();
    void set_pre_allocate_failed(error err);
    void set_unknown_error(error err);
    void set_user_canceled();

    [[nodiscard]] auto is_precondition_failed() const noexcept -> bool {
        return precondition_failed_.load();
    }
    [[nodiscard]] auto is_server_canceled() const noexcept -> bool {
        return server_canceled_.load();
    }
    [[nodiscard]] auto is_file_busy_after_run() const noexcept -> bool {
        return file_busy_after_run_.load();
    }
    [[nodiscard]] auto is_pre_allocate_failed() const noexcept -> bool {
        return pre_allocate_failed_.load();
    }
    [[nodiscard]] auto is_unknown_error() const noexcept -> bool {
        return unknown_error_.load();
    }
    [[nodiscard]] auto is_user_canceled() const noexcept -> bool {
        return user_canceled_.load();
    }

    /**
     * @brief Any flag that makes the attempt unusable is set
     */
    [[nodiscard]] auto is_interrupt() const noexcept -> bool;

    /**
     * @brief Error recorded by the last failing setter
     */
    [[nodiscard]] auto real_cause() const -> std::optional<error>;

private:
    void record(error err);

    std::shared_ptr<output_sink> sink_;

    std::atomic<bool> precondition_failed_{false};
    std::atomic<bool> server_canceled_{false};
    std::atomic<bool> file_busy_after_run_{false};
    std::atomic<bool> pre_allocate_failed_{false};
    std::atomic<bool> unknown_error_{false};
    std::atomic<bool> user_canceled_{false};

    mutable std::mutex cause_mutex_;
    std::optional<error> real_cause_;
};

}  // namespace kcenon::segment_transfer

#endif  // KCENON_SEGMENT_TRANSFER_CORE_DOWNLOAD_CACHE_H

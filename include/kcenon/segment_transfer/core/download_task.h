/**
 * @file download_task.h
 * @brief Immutable descriptor of one segmented download
 */

#ifndef KCENON_SEGMENT_TRANSFER_CORE_DOWNLOAD_TASK_H
#define KCENON_SEGMENT_TRANSFER_CORE_DOWNLOAD_TASK_H

#include <kcenon/segment_transfer/core/types.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace kcenon::segment_transfer {

class download_listener;

/**
 * @brief Immutable download task
 *
 * Identity, destination, scheduling priority and the listener that
 * receives lifecycle notifications. Built with download_task::builder.
 *
 * @code
 * auto task = download_task::builder(42, "https://example.com/a.bin")
 *     .with_filename("a.bin")
 *     .with_priority(10)
 *     .with_listener(listener)
 *     .build();
 * @endcode
 */
class download_task {
public:
    class builder;

    [[nodiscard]] auto id() const noexcept -> int32_t { return id_; }
    [[nodiscard]] auto url() const -> const std::string& { return url_; }
    [[nodiscard]] auto filename() const -> const std::string& { return filename_; }
    [[nodiscard]] auto parent_path() const -> const std::filesystem::path& {
        return parent_path_;
    }
    [[nodiscard]] auto priority() const noexcept -> int { return priority_; }

    /**
     * @brief Connection count forced by the caller, if any
     */
    [[nodiscard]] auto connection_count() const -> std::optional<int> {
        return connection_count_;
    }

    /**
     * @brief Registered listener, may be null
     */
    [[nodiscard]] auto listener() const -> download_listener* { return listener_.get(); }

private:
    download_task() = default;

    int32_t id_ = 0;
    std::string url_;
    std::string filename_;
    std::filesystem::path parent_path_;
    int priority_ = 0;
    std::optional<int> connection_count_;
    std::shared_ptr<download_listener> listener_;
};

/**
 * @brief Builder for download_task
 */
class download_task::builder {
public:
    builder(int32_t id, std::string url);

    auto with_filename(std::string filename) -> builder&;
    auto with_parent_path(std::filesystem::path path) -> builder&;
    auto with_priority(int priority) -> builder&;

    /**
     * @brief Force the number of blocks used for a fresh transfer
     * @param count Block count, must be at least 1
     * @return Reference to builder for chaining
     */
    auto with_connection_count(int count) -> builder&;

    auto with_listener(std::shared_ptr<download_listener> listener) -> builder&;

    /**
     * @brief Build the task
     * @return Task or invalid_argument error
     */
    [[nodiscard]] auto build() -> result<std::shared_ptr<const download_task>>;

private:
    download_task task_;
};

}  // namespace kcenon::segment_transfer

#endif  // KCENON_SEGMENT_TRANSFER_CORE_DOWNLOAD_TASK_H

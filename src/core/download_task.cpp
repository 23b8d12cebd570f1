/**
 * @file download_task.cpp
 * @brief Implementation of download_task::builder
 */

#include <kcenon/segment_transfer/core/download_task.h>

namespace kcenon::segment_transfer {

download_task::builder::builder(int32_t id, std::string url) {
    task_.id_ = id;
    task_.url_ = std::move(url);
}

auto download_task::builder::with_filename(std::string filename) -> builder& {
    task_.filename_ = std::move(filename);
    return *this;
}

auto download_task::builder::with_parent_path(std::filesystem::path path) -> builder& {
    task_.parent_path_ = std::move(path);
    return *this;
}

auto download_task::builder::with_priority(int priority) -> builder& {
    task_.priority_ = priority;
    return *this;
}

auto download_task::builder::with_connection_count(int count) -> builder& {
    task_.connection_count_ = count;
    return *this;
}

auto download_task::builder::with_listener(
    std::shared_ptr<download_listener> listener) -> builder& {
    task_.listener_ = std::move(listener);
    return *this;
}

auto download_task::builder::build() -> result<std::shared_ptr<const download_task>> {
    if (task_.url_.empty()) {
        return unexpected(error(error_code::invalid_argument, "url must not be empty"));
    }
    if (task_.connection_count_ && *task_.connection_count_ < 1) {
        return unexpected(error(error_code::invalid_argument,
            "connection count must be at least 1"));
    }

    return std::make_shared<const download_task>(task_);
}

}  // namespace kcenon::segment_transfer

/**
 * @file breakpoint_store.cpp
 * @brief Implementation of memory_breakpoint_store
 */

#include <kcenon/segment_transfer/breakpoint/breakpoint_store.h>
#include <kcenon/segment_transfer/core/download_task.h>
#include <kcenon/segment_transfer/core/logging.h>

#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>

namespace kcenon::segment_transfer {

class memory_breakpoint_store::impl {
public:
    auto get(int32_t task_id) -> std::shared_ptr<breakpoint_info> {
        std::shared_lock lock(mutex_);
        auto it = infos_.find(task_id);
        if (it == infos_.end()) {
            ST_LOG_TRACE(log_category::breakpoint,
                "No breakpoint for task " + std::to_string(task_id));
            return nullptr;
        }
        return it->second;
    }

    auto create_and_insert(const download_task& task)
        -> result<std::shared_ptr<breakpoint_info>> {
        std::unique_lock lock(mutex_);

        auto it = infos_.find(task.id());
        if (it != infos_.end()) {
            return it->second;
        }

        auto info = std::make_shared<breakpoint_info>(task.id(), task.url(), task.filename());
        infos_.emplace(task.id(), info);

        ST_LOG_DEBUG(log_category::breakpoint,
            "Created breakpoint for task " + std::to_string(task.id()));
        return info;
    }

    void on_task_start(int32_t task_id) {
        std::unique_lock lock(mutex_);
        running_.insert(task_id);
    }

    void on_task_end(int32_t task_id, end_cause cause,
                     const std::optional<error>& real_cause) {
        std::unique_lock lock(mutex_);
        running_.erase(task_id);
        end_causes_[task_id] = cause;

        if (cause == end_cause::completed) {
            infos_.erase(task_id);
        }

        ST_LOG_DEBUG(log_category::breakpoint,
            "Task " + std::to_string(task_id) + " ended: " + to_string(cause) +
            (real_cause ? " (" + real_cause->message + ")" : std::string{}));
    }

    void discard(int32_t task_id) {
        std::unique_lock lock(mutex_);
        infos_.erase(task_id);

        ST_LOG_DEBUG(log_category::breakpoint,
            "Discarded breakpoint for task " + std::to_string(task_id));
    }

    auto running_tasks() const -> std::vector<int32_t> {
        std::shared_lock lock(mutex_);
        return {running_.begin(), running_.end()};
    }

    auto last_end_cause(int32_t task_id) const -> std::optional<end_cause> {
        std::shared_lock lock(mutex_);
        auto it = end_causes_.find(task_id);
        if (it == end_causes_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    auto size() const -> std::size_t {
        std::shared_lock lock(mutex_);
        return infos_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<int32_t, std::shared_ptr<breakpoint_info>> infos_;
    std::unordered_map<int32_t, end_cause> end_causes_;
    std::unordered_set<int32_t> running_;
};

memory_breakpoint_store::memory_breakpoint_store()
    : impl_(std::make_unique<impl>()) {}

memory_breakpoint_store::~memory_breakpoint_store() = default;

auto memory_breakpoint_store::get(int32_t task_id) -> std::shared_ptr<breakpoint_info> {
    return impl_->get(task_id);
}

auto memory_breakpoint_store::create_and_insert(const download_task& task)
    -> result<std::shared_ptr<breakpoint_info>> {
    return impl_->create_and_insert(task);
}

void memory_breakpoint_store::on_task_start(int32_t task_id) {
    impl_->on_task_start(task_id);
}

void memory_breakpoint_store::on_task_end(int32_t task_id, end_cause cause,
                                          const std::optional<error>& real_cause) {
    impl_->on_task_end(task_id, cause, real_cause);
}

void memory_breakpoint_store::discard(int32_t task_id) {
    impl_->discard(task_id);
}

auto memory_breakpoint_store::running_tasks() const -> std::vector<int32_t> {
    return impl_->running_tasks();
}

auto memory_breakpoint_store::last_end_cause(int32_t task_id) const
    -> std::optional<end_cause> {
    return impl_->last_end_cause(task_id);
}

auto memory_breakpoint_store::size() const -> std::size_t {
    return impl_->size();
}

}  // namespace kcenon::segment_transfer

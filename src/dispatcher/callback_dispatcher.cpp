/**
 * @file callback_dispatcher.cpp
 * @brief Implementation of the lifecycle dispatcher
 */

#include <kcenon/segment_transfer/dispatcher/callback_dispatcher.h>

#include <kcenon/segment_transfer/core/download_task.h>
#include <kcenon/segment_transfer/core/logging.h>

namespace kcenon::segment_transfer {

class callback_dispatcher::forwarding_listener : public download_listener {
public:
    void task_start(const download_task& task) override {
        ST_LOG_TRACE(log_category::dispatcher,
            "task_start " + std::to_string(task.id()));
        if (auto* listener = task.listener()) {
            listener->task_start(task);
        }
    }

    void connect_trial_start(const download_task& task,
                             header_fields& request_fields) override {
        if (auto* listener = task.listener()) {
            listener->connect_trial_start(task, request_fields);
        }
    }

    void connect_trial_end(const download_task& task,
                           int response_code,
                           header_fields& response_fields) override {
        if (auto* listener = task.listener()) {
            listener->connect_trial_end(task, response_code, response_fields);
        }
    }

    void download_from_beginning(const download_task& task,
                                 breakpoint_info& info,
                                 resume_failed_cause cause) override {
        ST_LOG_TRACE(log_category::dispatcher,
            "download_from_beginning " + std::to_string(task.id()) + " " + to_string(cause));
        if (auto* listener = task.listener()) {
            listener->download_from_beginning(task, info, cause);
        }
    }

    void download_from_breakpoint(const download_task& task,
                                  breakpoint_info& info) override {
        ST_LOG_TRACE(log_category::dispatcher,
            "download_from_breakpoint " + std::to_string(task.id()));
        if (auto* listener = task.listener()) {
            listener->download_from_breakpoint(task, info);
        }
    }

    void connect_start(const download_task& task,
                       std::size_t block_index,
                       header_fields& request_fields) override {
        if (auto* listener = task.listener()) {
            listener->connect_start(task, block_index, request_fields);
        }
    }

    void connect_end(const download_task& task,
                     std::size_t block_index,
                     int response_code,
                     header_fields& response_fields) override {
        if (auto* listener = task.listener()) {
            listener->connect_end(task, block_index, response_code, response_fields);
        }
    }

    void fetch_start(const download_task& task,
                     std::size_t block_index,
                     int64_t content_length) override {
        if (auto* listener = task.listener()) {
            listener->fetch_start(task, block_index, content_length);
        }
    }

    void fetch_progress(const download_task& task,
                        std::size_t block_index,
                        int64_t increase_bytes) override {
        if (auto* listener = task.listener()) {
            listener->fetch_progress(task, block_index, increase_bytes);
        }
    }

    void fetch_end(const download_task& task,
                   std::size_t block_index,
                   int64_t content_length) override {
        if (auto* listener = task.listener()) {
            listener->fetch_end(task, block_index, content_length);
        }
    }

    void task_end(const download_task& task,
                  end_cause cause,
                  const std::optional<error>& real_cause) override {
        ST_LOG_TRACE(log_category::dispatcher,
            "task_end " + std::to_string(task.id()) + " " + to_string(cause));
        if (auto* listener = task.listener()) {
            listener->task_end(task, cause, real_cause);
        }
    }
};

callback_dispatcher::callback_dispatcher()
    : transmit_(std::make_unique<forwarding_listener>()) {}

callback_dispatcher::~callback_dispatcher() = default;

auto callback_dispatcher::dispatch() -> download_listener& {
    return *transmit_;
}

}  // namespace kcenon::segment_transfer

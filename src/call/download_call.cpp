/**
 * @file download_call.cpp
 * @brief Implementation of the download call orchestrator
 */

#include <kcenon/segment_transfer/call/download_call.h>

#include <kcenon/segment_transfer/adapters/thread_pool_adapter.h>
#include <kcenon/segment_transfer/breakpoint/breakpoint_info.h>
#include <kcenon/segment_transfer/breakpoint/breakpoint_store.h>
#include <kcenon/segment_transfer/call/call_registry.h>
#include <kcenon/segment_transfer/check/resume_checks.h>
#include <kcenon/segment_transfer/core/download_cache.h>
#include <kcenon/segment_transfer/core/download_task.h>
#include <kcenon/segment_transfer/core/logging.h>
#include <kcenon/segment_transfer/dispatcher/callback_dispatcher.h>
#include <kcenon/segment_transfer/file/process_file_strategy.h>
#include <kcenon/segment_transfer/strategy/download_strategy.h>

#include <algorithm>
#include <future>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>

namespace kcenon::segment_transfer {

class download_call::impl {
public:
    impl(download_call& owner,
         std::shared_ptr<const download_task> task,
         const download_environment& env)
        : owner_(owner), task_(std::move(task)), env_(env) {}

    auto cancel() -> bool {
        {
            std::lock_guard lock(state_mutex_);
            if (state_ != call_state::running) {
                return false;
            }
            state_ = call_state::canceled;
        }

        auto ctx = log_context();
        ST_LOG_INFO_CTX(log_category::call, "Call canceled", ctx);

        if (env_.registry != nullptr) {
            env_.registry->flying_canceled(owner_);
        }

        if (auto cache = current_cache()) {
            cache->set_user_canceled();
        }

        auto chains = snapshot_chains();
        for (auto& chain : chains) {
            chain->cancel();
        }
        ST_LOG_DEBUG(log_category::call,
            "Canceled " + std::to_string(chains.size()) + " running block(s) of task " +
            std::to_string(task_->id()));
        return true;
    }

    [[nodiscard]] auto state() const -> call_state {
        std::lock_guard lock(state_mutex_);
        return state_;
    }

    [[nodiscard]] auto is_canceled() const -> bool { return state() == call_state::canceled; }

    [[nodiscard]] auto is_finishing() const -> bool {
        auto current = state();
        return current == call_state::finishing || current == call_state::done;
    }

    auto execute() -> result<void> {
        const auto& task = *task_;

        env_.store.on_task_start(task.id());
        env_.dispatcher.dispatch().task_start(task);
        auto start_ctx = log_context();
        ST_LOG_INFO_CTX(log_category::call, "Call started", start_ctx);

        int retry_count = 0;
        while (true) {
            if (is_canceled()) break;

            auto info = env_.store.get(task.id());
            if (!info) {
                auto created = env_.store.create_and_insert(task);
                if (!created) {
                    ST_LOG_ERROR(log_category::call,
                        "Cannot create breakpoint info for task " + std::to_string(task.id()) +
                        ": " + created.error().message);
                    publish_cache(download_cache::pre_error(created.error()));
                    break;
                }
                info = created.value();
            }

            if (is_canceled()) break;

            auto cache = std::make_shared<download_cache>(
                env_.file_strategy.create_output_sink(task, *info));
            publish_cache(cache);

            auto remote = env_.make_remote_check(task, info, cache);
            if (auto checked = remote->check(); !checked) {
                ST_LOG_WARN(log_category::call,
                    "Remote check failed for task " + std::to_string(task.id()) + ": " +
                    checked.error().message);
                cache->catch_error(checked.error());
                break;
            }

            const int64_t instance_length = remote->instance_length();
            if (auto inspected =
                    env_.strategy.inspect_another_same_info(task, *info, instance_length);
                !inspected) {
                cache->catch_error(inspected.error());
                break;
            }

            if (!prepare_blocks(*remote, info, instance_length, *cache)) {
                break;
            }

            if (auto started = start(info, cache); !started) {
                finish_loop();
                return started;
            }

            if (is_canceled()) break;

            if (cache->is_precondition_failed() &&
                retry_count++ < max_retry_for_precondition_failed) {
                ST_LOG_INFO(log_category::call,
                    "Precondition failed for task " + std::to_string(task.id()) +
                    ", retrying from scratch");
                env_.store.discard(task.id());
                if (auto discarded = env_.file_strategy.discard_process(task); !discarded) {
                    cache->set_unknown_error(discarded.error());
                    break;
                }
                continue;
            }
            break;
        }

        finish_loop();

        auto cache = current_cache();
        if (is_canceled() || !cache) {
            return {};
        }

        auto [cause, real_cause] = classify(*cache);
        inspect_task_end(*cache, cause, std::move(real_cause));
        return {};
    }

    void run() {
        auto executed = execute();
        if (!executed) {
            ST_LOG_ERROR(log_category::call,
                "Task " + std::to_string(task_->id()) + " abandoned: " +
                executed.error().message);
        }
        if (env_.registry != nullptr) {
            env_.registry->finish(owner_);
        }
    }

    [[nodiscard]] auto task() const -> const download_task& { return *task_; }

    [[nodiscard]] auto current_cache() const -> std::shared_ptr<download_cache> {
        std::lock_guard lock(cache_mutex_);
        return cache_;
    }

    [[nodiscard]] auto running_chain_count() const -> std::size_t {
        std::lock_guard lock(chains_mutex_);
        return chains_.size();
    }

private:
    void publish_cache(std::shared_ptr<download_cache> cache) {
        std::lock_guard lock(cache_mutex_);
        cache_ = std::move(cache);
    }

    auto snapshot_chains() const -> std::vector<std::shared_ptr<download_chain>> {
        std::lock_guard lock(chains_mutex_);
        return chains_;
    }

    /**
     * @brief Decide between resuming and restarting, notify the listener
     * @return false if the attempt cannot continue
     */
    auto prepare_blocks(remote_check& remote,
                        const std::shared_ptr<breakpoint_info>& info,
                        int64_t instance_length,
                        download_cache& cache) -> bool {
        const auto& task = *task_;
        auto& listener = env_.dispatcher.dispatch();

        std::optional<resume_failed_cause> restart_cause;
        if (remote.is_resumable()) {
            auto local = env_.make_local_check(task, info, instance_length);
            local->check();
            if (local->is_dirty()) {
                auto cause = local->cause();
                if (!cause) {
                    cache.set_unknown_error(cause.error());
                    return false;
                }
                restart_cause = cause.value();
            }
        } else {
            auto cause = remote.cause();
            if (!cause) {
                cache.set_unknown_error(cause.error());
                return false;
            }
            restart_cause = cause.value();
        }

        if (restart_cause) {
            env_.strategy.assemble_blocks(task, *info, instance_length, remote.is_accept_range());
            auto ctx = log_context();
            ctx.block_count = info->block_count();
            ctx.instance_length = instance_length;
            ctx.cause = to_string(*restart_cause);
            ST_LOG_INFO_CTX(log_category::call, "Downloading from beginning", ctx);
            listener.download_from_beginning(task, *info, *restart_cause);
        } else {
            ST_LOG_INFO(log_category::call,
                "Resuming task " + std::to_string(task.id()) + " at " +
                std::to_string(info->total_offset()) + " bytes");
            listener.download_from_breakpoint(task, *info);
        }
        return true;
    }

    auto start(const std::shared_ptr<breakpoint_info>& info,
               const std::shared_ptr<download_cache>& cache) -> result<void> {
        std::vector<std::shared_ptr<download_chain>> chains;
        for (std::size_t i = 0; i < info->block_count(); ++i) {
            auto& block = info->block(i);
            if (block.is_complete()) {
                continue;
            }
            reset_block_if_dirty(block);
            chains.push_back(env_.make_chain(i, *task_, info, cache));
        }

        if (is_canceled()) {
            return {};
        }
        return start_blocks(chains);
    }

    auto start_blocks(const std::vector<std::shared_ptr<download_chain>>& chains)
        -> result<void> {
        std::vector<std::future<void>> futures;
        futures.reserve(chains.size());

        try {
            for (const auto& chain : chains) {
                futures.push_back(env_.pool.submit(adapters::pool_job{
                    "segment_transfer block " + std::to_string(task_->id()) + "#" +
                        std::to_string(chain->block_index()),
                    [chain] { chain->run(); }}));
            }
        } catch (const std::exception& e) {
            ST_LOG_ERROR(log_category::call,
                "Cannot schedule blocks of task " + std::to_string(task_->id()) + ": " +
                e.what());
            for (const auto& chain : chains) {
                chain->cancel();
            }
            return unexpected(error(error_code::pool_submit_failed, e.what()));
        }

        {
            std::lock_guard lock(chains_mutex_);
            chains_.insert(chains_.end(), chains.begin(), chains.end());
        }
        // a cancel() between submission and registration saw no chains
        if (is_canceled()) {
            for (const auto& chain : chains) {
                chain->cancel();
            }
        }

        for (std::size_t i = 0; i < futures.size(); ++i) {
            try {
                futures[i].get();
            } catch (const std::exception& e) {
                task_log_context ctx = log_context();
                ctx.block_index = chains[i]->block_index();
                ctx.error_message = e.what();
                ST_LOG_WARN_CTX(log_category::chain, "Block chain failed", ctx);
            }
        }

        {
            std::lock_guard lock(chains_mutex_);
            chains_.erase(
                std::remove_if(chains_.begin(), chains_.end(),
                    [&chains](const std::shared_ptr<download_chain>& live) {
                        return std::find(chains.begin(), chains.end(), live) != chains.end();
                    }),
                chains_.end());
        }
        return {};
    }

    void finish_loop() {
        {
            std::lock_guard lock(state_mutex_);
            if (state_ == call_state::running) {
                state_ = call_state::finishing;
                ST_LOG_DEBUG(log_category::call,
                    "Task " + std::to_string(task_->id()) + " finishing");
            }
        }
        std::lock_guard lock(chains_mutex_);
        chains_.clear();
    }

    static auto classify(const download_cache& cache)
        -> std::pair<end_cause, std::optional<error>> {
        if (cache.is_server_canceled() || cache.is_unknown_error() ||
            cache.is_precondition_failed()) {
            return {end_cause::error, cache.real_cause()};
        }
        if (cache.is_file_busy_after_run()) {
            return {end_cause::file_busy, std::nullopt};
        }
        if (cache.is_pre_allocate_failed()) {
            return {end_cause::pre_allocate_failed, cache.real_cause()};
        }
        return {end_cause::completed, std::nullopt};
    }

    // The store hears the classified cause before the file is committed.
    // A failed commit turns completed into error for the listener only, so
    // a store may record completed for a task whose listener got error.
    void inspect_task_end(download_cache& cache,
                          end_cause cause,
                          std::optional<error> real_cause) {
        {
            std::lock_guard lock(state_mutex_);
            if (state_ == call_state::canceled) {
                return;
            }
        }

        const auto& task = *task_;
        env_.store.on_task_end(task.id(), cause, real_cause);

        if (cause == end_cause::completed) {
            if (auto committed = env_.file_strategy.complete_process_stream(cache.sink(), task);
                !committed) {
                ST_LOG_ERROR(log_category::call,
                    "Cannot commit output of task " + std::to_string(task.id()) + ": " +
                    committed.error().message);
                cause = end_cause::error;
                real_cause = committed.error();
            }
        }

        auto ctx = log_context();
        ctx.cause = to_string(cause);
        if (real_cause) {
            ctx.error_message = real_cause->message;
        }
        if (cause == end_cause::completed) {
            ST_LOG_INFO_CTX(log_category::call, "Call ended", ctx);
        } else {
            ST_LOG_WARN_CTX(log_category::call, "Call ended", ctx);
        }

        env_.dispatcher.dispatch().task_end(task, cause, real_cause);

        std::lock_guard lock(state_mutex_);
        state_ = call_state::done;
    }

    [[nodiscard]] auto log_context() const -> task_log_context {
        task_log_context ctx;
        ctx.task_id = task_->id();
        return ctx;
    }

    download_call& owner_;
    std::shared_ptr<const download_task> task_;
    const download_environment& env_;

    mutable std::mutex state_mutex_;
    call_state state_{call_state::running};

    mutable std::mutex cache_mutex_;
    std::shared_ptr<download_cache> cache_;

    mutable std::mutex chains_mutex_;
    std::vector<std::shared_ptr<download_chain>> chains_;
};

// ============================================================================
// download_call
// ============================================================================

auto download_call::create(std::shared_ptr<const download_task> task,
                           const download_environment& env)
    -> std::shared_ptr<download_call> {
    if (!task) {
        ST_LOG_ERROR(log_category::call, "download_call requires a task");
        return nullptr;
    }
    return std::shared_ptr<download_call>(new download_call(std::move(task), env));
}

download_call::download_call(std::shared_ptr<const download_task> task,
                             const download_environment& env)
    : impl_(std::make_unique<impl>(*this, std::move(task), env)) {}

download_call::~download_call() = default;

auto download_call::cancel() -> bool {
    return impl_->cancel();
}

auto download_call::is_canceled() const -> bool {
    return impl_->is_canceled();
}

auto download_call::is_finishing() const -> bool {
    return impl_->is_finishing();
}

auto download_call::state() const -> call_state {
    return impl_->state();
}

auto download_call::execute() -> result<void> {
    return impl_->execute();
}

void download_call::run() {
    impl_->run();
}

auto download_call::priority() const -> int {
    return impl_->task().priority();
}

auto download_call::task() const -> const download_task& {
    return impl_->task();
}

auto download_call::cache() const -> std::shared_ptr<download_cache> {
    return impl_->current_cache();
}

auto download_call::running_chain_count() const -> std::size_t {
    return impl_->running_chain_count();
}

}  // namespace kcenon::segment_transfer

/**
 * @file download_call.h
 * @brief Orchestrates the attempts of one segmented download
 * @version 0.1.0
 *
 * A download_call owns the attempt sequence of a single task: it decides
 * whether stored progress can be resumed, splits the remaining work into
 * blocks, runs the blocks on the shared pool, and reports exactly one
 * terminal end_cause unless it is canceled first.
 */

#ifndef KCENON_SEGMENT_TRANSFER_CALL_DOWNLOAD_CALL_H
#define KCENON_SEGMENT_TRANSFER_CALL_DOWNLOAD_CALL_H

#include <kcenon/segment_transfer/call/download_environment.h>
#include <kcenon/segment_transfer/core/types.h>

#include <cstddef>
#include <memory>

namespace kcenon::segment_transfer {

class download_cache;
class download_task;

/**
 * @brief Lifecycle of a call
 *
 * running -> canceled is terminal and never reverts. running -> finishing
 * -> done is the normal path; once finishing, cancel() has no effect.
 */
enum class call_state {
    running,
    canceled,
    finishing,
    done,
};

[[nodiscard]] constexpr auto to_string(call_state state) noexcept -> const char* {
    switch (state) {
        case call_state::running:
            return "running";
        case call_state::canceled:
            return "canceled";
        case call_state::finishing:
            return "finishing";
        case call_state::done:
            return "done";
        default:
            return "unknown";
    }
}

/**
 * @brief Attempt sequence of one task
 *
 * execute() runs on a thread supplied by the outer scheduler and blocks
 * until every block chain returned. cancel() may be called from any
 * thread.
 *
 * @code
 * auto call = download_call::create(task, env);
 * std::thread worker([call] { call->run(); });
 * // ...
 * call->cancel();
 * worker.join();
 * @endcode
 */
class download_call {
public:
    /// Retries allowed after the remote reported a precondition failure
    static constexpr int max_retry_for_precondition_failed = 1;

    /**
     * @brief Create a call for @p task
     * @param task Task to download
     * @param env Collaborators, must outlive the call
     * @return The call, or nullptr when @p task is null
     */
    [[nodiscard]] static auto create(std::shared_ptr<const download_task> task,
                                     const download_environment& env)
        -> std::shared_ptr<download_call>;

    ~download_call();

    download_call(const download_call&) = delete;
    auto operator=(const download_call&) -> download_call& = delete;

    /**
     * @brief Cancel the call and every running block
     *
     * Does not wait for blocks to stop. No task_end is reported for a
     * canceled call.
     *
     * @return true if this invocation canceled the call, false if it was
     *         already canceled or is finishing
     */
    auto cancel() -> bool;

    [[nodiscard]] auto is_canceled() const -> bool;

    /**
     * @brief The attempt loop has ended; true for finishing and done
     */
    [[nodiscard]] auto is_finishing() const -> bool;

    [[nodiscard]] auto state() const -> call_state;

    /**
     * @brief Run the attempt sequence to completion
     *
     * Outcomes are reported through the listener's task_end.
     *
     * @return Success, or pool_submit_failed when blocks could not be
     *         scheduled; no task_end is reported in that case
     */
    auto execute() -> result<void>;

    /**
     * @brief Scheduler entry point: execute() then registry finish()
     */
    void run();

    [[nodiscard]] auto priority() const -> int;
    [[nodiscard]] auto task() const -> const download_task&;

    /**
     * @brief Status aggregator of the current attempt, may be null
     */
    [[nodiscard]] auto cache() const -> std::shared_ptr<download_cache>;

    /**
     * @brief Number of block chains currently running
     */
    [[nodiscard]] auto running_chain_count() const -> std::size_t;

private:
    download_call(std::shared_ptr<const download_task> task,
                  const download_environment& env);

    class impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Orders calls so that higher priorities come first
 *
 * Usable with std::sort; std::priority_queue needs the inverse.
 */
struct higher_priority_first {
    auto operator()(const std::shared_ptr<download_call>& lhs,
                    const std::shared_ptr<download_call>& rhs) const -> bool {
        return lhs->priority() > rhs->priority();
    }
};

}  // namespace kcenon::segment_transfer

#endif  // KCENON_SEGMENT_TRANSFER_CALL_DOWNLOAD_CALL_H

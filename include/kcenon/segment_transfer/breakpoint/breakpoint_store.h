/**
 * @file breakpoint_store.h
 * @brief Storage of breakpoint_info records keyed by task id
 * @version 0.1.0
 */

#ifndef KCENON_SEGMENT_TRANSFER_BREAKPOINT_BREAKPOINT_STORE_H
#define KCENON_SEGMENT_TRANSFER_BREAKPOINT_BREAKPOINT_STORE_H

#include <kcenon/segment_transfer/breakpoint/breakpoint_info.h>
#include <kcenon/segment_transfer/core/causes.h>
#include <kcenon/segment_transfer/core/types.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace kcenon::segment_transfer {

class download_task;

/**
 * @brief Resumption store contract
 *
 * Implementations keep at most one live breakpoint_info per task id and
 * are safe to call from several download calls at once.
 */
class breakpoint_store {
public:
    virtual ~breakpoint_store() = default;

    /**
     * @brief Look up the stored info of a task
     * @return Info, or nullptr when nothing is stored
     */
    [[nodiscard]] virtual auto get(int32_t task_id) -> std::shared_ptr<breakpoint_info> = 0;

    /**
     * @brief Create an empty info for the task and store it
     * @return Stored info or breakpoint_create_failed
     */
    [[nodiscard]] virtual auto create_and_insert(const download_task& task)
        -> result<std::shared_ptr<breakpoint_info>> = 0;

    virtual void on_task_start(int32_t task_id) = 0;

    /**
     * @brief Record the terminal outcome of an attempt sequence
     * @param task_id Task identifier
     * @param cause Classified end cause
     * @param real_cause Underlying error, if any
     *
     * Called before the output is committed. When the commit then fails the
     * listener receives end_cause::error, while the store has already seen
     * end_cause::completed and may have dropped the resume state.
     */
    virtual void on_task_end(int32_t task_id, end_cause cause,
                             const std::optional<error>& real_cause) = 0;

    virtual void discard(int32_t task_id) = 0;
};

/**
 * @brief Thread-safe in-process breakpoint store
 *
 * Keeps infos in memory only. A completed task's info is removed; any
 * other end cause keeps it for the next attempt.
 */
class memory_breakpoint_store : public breakpoint_store {
public:
    memory_breakpoint_store();
    ~memory_breakpoint_store() override;

    memory_breakpoint_store(const memory_breakpoint_store&) = delete;
    auto operator=(const memory_breakpoint_store&) -> memory_breakpoint_store& = delete;

    [[nodiscard]] auto get(int32_t task_id) -> std::shared_ptr<breakpoint_info> override;
    [[nodiscard]] auto create_and_insert(const download_task& task)
        -> result<std::shared_ptr<breakpoint_info>> override;
    void on_task_start(int32_t task_id) override;
    void on_task_end(int32_t task_id, end_cause cause,
                     const std::optional<error>& real_cause) override;
    void discard(int32_t task_id) override;

    /**
     * @brief Ids of tasks whose attempt started and has not ended
     */
    [[nodiscard]] auto running_tasks() const -> std::vector<int32_t>;

    /**
     * @brief Last end cause recorded for a task
     */
    [[nodiscard]] auto last_end_cause(int32_t task_id) const -> std::optional<end_cause>;

    [[nodiscard]] auto size() const -> std::size_t;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::segment_transfer

#endif  // KCENON_SEGMENT_TRANSFER_BREAKPOINT_BREAKPOINT_STORE_H

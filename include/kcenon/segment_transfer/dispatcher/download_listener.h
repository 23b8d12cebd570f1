/**
 * @file download_listener.h
 * @brief Lifecycle notifications of a download task
 */

#ifndef KCENON_SEGMENT_TRANSFER_DISPATCHER_DOWNLOAD_LISTENER_H
#define KCENON_SEGMENT_TRANSFER_DISPATCHER_DOWNLOAD_LISTENER_H

#include <kcenon/segment_transfer/core/causes.h>
#include <kcenon/segment_transfer/core/types.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::segment_transfer {

class breakpoint_info;
class download_task;

/**
 * @brief Request or response header fields, one name to many values
 */
using header_fields = std::map<std::string, std::vector<std::string>>;

/**
 * @brief Receiver of lifecycle events for one task
 *
 * Called synchronously on the thread that produced the event, which may
 * be a pool worker. Header mappings are passed by reference so a listener
 * can amend request headers before they are sent.
 */
class download_listener {
public:
    virtual ~download_listener() = default;

    virtual void task_start(const download_task& task) = 0;

    /**
     * @brief Before the trial connection that inspects the remote
     */
    virtual void connect_trial_start(const download_task& task,
                                     header_fields& request_fields) = 0;

    virtual void connect_trial_end(const download_task& task,
                                   int response_code,
                                   header_fields& response_fields) = 0;

    /**
     * @brief Prior progress is discarded and blocks were reassembled
     */
    virtual void download_from_beginning(const download_task& task,
                                         breakpoint_info& info,
                                         resume_failed_cause cause) = 0;

    /**
     * @brief Transfer resumes from the stored block offsets
     */
    virtual void download_from_breakpoint(const download_task& task,
                                          breakpoint_info& info) = 0;

    virtual void connect_start(const download_task& task,
                               std::size_t block_index,
                               header_fields& request_fields) = 0;

    virtual void connect_end(const download_task& task,
                             std::size_t block_index,
                             int response_code,
                             header_fields& response_fields) = 0;

    virtual void fetch_start(const download_task& task,
                             std::size_t block_index,
                             int64_t content_length) = 0;

    virtual void fetch_progress(const download_task& task,
                                std::size_t block_index,
                                int64_t increase_bytes) = 0;

    virtual void fetch_end(const download_task& task,
                           std::size_t block_index,
                           int64_t content_length) = 0;

    /**
     * @brief Terminal notification, at most once per call
     * @param cause Classification of the outcome
     * @param real_cause Error behind a non-completed cause, if recorded
     */
    virtual void task_end(const download_task& task,
                          end_cause cause,
                          const std::optional<error>& real_cause) = 0;
};

}  // namespace kcenon::segment_transfer

#endif  // KCENON_SEGMENT_TRANSFER_DISPATCHER_DOWNLOAD_LISTENER_H

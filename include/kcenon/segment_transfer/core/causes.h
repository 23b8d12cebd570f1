/**
 * @file causes.h
 * @brief Terminal and resume-failure causes for segmented transfers
 */

#ifndef KCENON_SEGMENT_TRANSFER_CORE_CAUSES_H
#define KCENON_SEGMENT_TRANSFER_CORE_CAUSES_H

namespace kcenon::segment_transfer {

/**
 * @brief Terminal classification of an attempt sequence
 *
 * A call produces exactly one of completed, error, file_busy or
 * pre_allocate_failed. canceled and same_task_busy are reported by the
 * scheduler that owns the call.
 */
enum class end_cause {
    completed,
    canceled,
    error,
    file_busy,
    same_task_busy,
    pre_allocate_failed
};

[[nodiscard]] constexpr auto to_string(end_cause cause) noexcept -> const char* {
    switch (cause) {
        case end_cause::completed: return "completed";
        case end_cause::canceled: return "canceled";
        case end_cause::error: return "error";
        case end_cause::file_busy: return "file_busy";
        case end_cause::same_task_busy: return "same_task_busy";
        case end_cause::pre_allocate_failed: return "pre_allocate_failed";
        default: return "unknown";
    }
}

/**
 * @brief Reason a stored breakpoint could not be resumed
 */
enum class resume_failed_cause {
    info_dirty,
    file_not_exist,
    output_stream_not_support,
    response_etag_changed,
    response_precondition_failed,
    response_created_range_not_from_0,
    response_reset_range_not_from_0,
    content_length_changed
};

[[nodiscard]] constexpr auto to_string(resume_failed_cause cause) noexcept
    -> const char* {
    switch (cause) {
        case resume_failed_cause::info_dirty: return "info_dirty";
        case resume_failed_cause::file_not_exist: return "file_not_exist";
        case resume_failed_cause::output_stream_not_support:
            return "output_stream_not_support";
        case resume_failed_cause::response_etag_changed:
            return "response_etag_changed";
        case resume_failed_cause::response_precondition_failed:
            return "response_precondition_failed";
        case resume_failed_cause::response_created_range_not_from_0:
            return "response_created_range_not_from_0";
        case resume_failed_cause::response_reset_range_not_from_0:
            return "response_reset_range_not_from_0";
        case resume_failed_cause::content_length_changed:
            return "content_length_changed";
        default: return "unknown";
    }
}

}  // namespace kcenon::segment_transfer

#endif  // KCENON_SEGMENT_TRANSFER_CORE_CAUSES_H

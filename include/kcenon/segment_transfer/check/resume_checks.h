/**
 * @file resume_checks.h
 * @brief Remote and local resumability checks
 */

#ifndef KCENON_SEGMENT_TRANSFER_CHECK_RESUME_CHECKS_H
#define KCENON_SEGMENT_TRANSFER_CHECK_RESUME_CHECKS_H

#include <kcenon/segment_transfer/core/causes.h>
#include <kcenon/segment_transfer/core/types.h>

#include <cstdint>

namespace kcenon::segment_transfer {

/**
 * @brief Checks the remote resource against the stored breakpoint
 *
 * After a successful check(), the accessors describe the remote
 * resource. cause() only has a value when the transfer is not
 * resumable.
 */
class remote_check {
public:
    virtual ~remote_check() = default;

    /**
     * @brief Check the remote resource
     * @return Success, or the network/IO error that stopped the check
     */
    [[nodiscard]] virtual auto check() -> result<void> = 0;

    [[nodiscard]] virtual auto is_resumable() const -> bool = 0;

    /**
     * @brief Total length reported by the remote, negative when unknown
     */
    [[nodiscard]] virtual auto instance_length() const -> int64_t = 0;

    [[nodiscard]] virtual auto is_accept_range() const -> bool = 0;

    /**
     * @brief Why the stored breakpoint cannot be resumed
     * @return Cause, or not_applicable when resumable
     */
    [[nodiscard]] virtual auto cause() const -> result<resume_failed_cause> = 0;
};

/**
 * @brief Compares the stored breakpoint with what is on disk
 *
 * cause() only has a value when the local state is dirty.
 */
class local_check {
public:
    virtual ~local_check() = default;

    virtual void check() = 0;

    [[nodiscard]] virtual auto is_dirty() const -> bool = 0;

    /**
     * @brief Why the local state is unusable
     * @return Cause, or not_applicable when not dirty
     */
    [[nodiscard]] virtual auto cause() const -> result<resume_failed_cause> = 0;
};

}  // namespace kcenon::segment_transfer

#endif  // KCENON_SEGMENT_TRANSFER_CHECK_RESUME_CHECKS_H

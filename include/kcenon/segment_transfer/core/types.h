/**
 * @file types.h
 * @brief Core type definitions for segment_transfer
 */

#ifndef KCENON_SEGMENT_TRANSFER_CORE_TYPES_H
#define KCENON_SEGMENT_TRANSFER_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::segment_transfer {

/**
 * @brief Error codes for segmented transfer operations (-800 to -829)
 *
 * Error code ranges:
 * - -800 to -809: Transfer Errors
 * - -810 to -819: Storage Errors
 * - -820 to -829: Internal Errors
 */
enum class error_code : int32_t {
    success = 0,

    // Transfer Errors (-800 to -809)
    precondition_failed = -800,
    server_canceled = -801,
    file_busy_after_run = -802,
    pre_allocate_failed = -803,
    interrupted = -804,
    reuse_rejected = -805,
    connection_failed = -806,
    response_invalid = -807,

    // Storage Errors (-810 to -819)
    breakpoint_create_failed = -810,
    breakpoint_not_found = -811,
    discard_failed = -812,
    file_write_error = -813,
    commit_failed = -814,

    // Internal Errors (-820 to -829)
    internal_error = -820,
    pool_submit_failed = -821,
    pool_shut_down = -822,
    invalid_argument = -823,
    not_applicable = -824,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::precondition_failed:
            return "remote resource changed since last checkpoint";
        case error_code::server_canceled:
            return "transfer canceled by server";
        case error_code::file_busy_after_run:
            return "output file busy after run";
        case error_code::pre_allocate_failed:
            return "output pre-allocation failed";
        case error_code::interrupted:
            return "transfer interrupted";
        case error_code::reuse_rejected:
            return "reuse of another breakpoint rejected";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::response_invalid:
            return "invalid response";
        case error_code::breakpoint_create_failed:
            return "failed to create breakpoint info";
        case error_code::breakpoint_not_found:
            return "breakpoint info not found";
        case error_code::discard_failed:
            return "failed to discard partial output";
        case error_code::file_write_error:
            return "file write error";
        case error_code::commit_failed:
            return "failed to commit output";
        case error_code::internal_error:
            return "internal error";
        case error_code::pool_submit_failed:
            return "failed to submit block to worker pool";
        case error_code::pool_shut_down:
            return "worker pool shut down";
        case error_code::invalid_argument:
            return "invalid argument";
        case error_code::not_applicable:
            return "not applicable";
        default:
            return "unknown error";
    }
}

/**
 * @brief Check if error code is in transfer error range
 */
[[nodiscard]] constexpr auto is_transfer_error(error_code code) noexcept -> bool {
    auto value = static_cast<int32_t>(code);
    return value <= -800 && value >= -809;
}

/**
 * @brief Check if error code is in storage error range
 */
[[nodiscard]] constexpr auto is_storage_error(error_code code) noexcept -> bool {
    auto value = static_cast<int32_t>(code);
    return value <= -810 && value >= -819;
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }

    [[nodiscard]] auto operator==(const error& other) const -> bool = default;
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::segment_transfer

#endif  // KCENON_SEGMENT_TRANSFER_CORE_TYPES_H

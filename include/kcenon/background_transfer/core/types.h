/**
 * @file types.h
 * @brief Core type definitions for background_transfer
 */

#ifndef KCENON_BACKGROUND_TRANSFER_CORE_TYPES_H
#define KCENON_BACKGROUND_TRANSFER_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::background_transfer {

/**
 * @brief Error codes for orchestrator operations
 */
enum class error_code {
    success = 0,

    // Request errors (-100 to -119)
    invalid_request = -100,
    task_not_found = -101,
    duplicate_task = -102,
    invalid_url = -103,

    // Admission and resume errors (-120 to -139)
    admission_rejected = -120,
    resume_unsupported = -121,
    resume_state_invalid = -122,

    // Chunk errors (-140 to -159)
    chunk_irrecoverable = -140,
    orphaned_chunk = -141,
    probe_failed = -142,

    // Delivery errors (-160 to -179)
    delivery_unavailable = -160,

    // Configuration errors (-180 to -199)
    invalid_configuration = -180,

    // Durable state errors (-200 to -219)
    state_read_error = -200,
    state_write_error = -201,
    state_corrupted = -202,

    // Internal errors (-220 to -239)
    executor_error = -220,
    internal_error = -221,
    not_initialized = -222,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::invalid_request:
            return "invalid request";
        case error_code::task_not_found:
            return "task not found";
        case error_code::duplicate_task:
            return "task id already in use";
        case error_code::invalid_url:
            return "invalid url";
        case error_code::admission_rejected:
            return "admission rejected";
        case error_code::resume_unsupported:
            return "resume not supported for this task";
        case error_code::resume_state_invalid:
            return "resume state invalid";
        case error_code::chunk_irrecoverable:
            return "chunk failed without retries left";
        case error_code::orphaned_chunk:
            return "chunk has no live parent";
        case error_code::probe_failed:
            return "metadata probe failed";
        case error_code::delivery_unavailable:
            return "host listener unavailable";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::state_read_error:
            return "state read error";
        case error_code::state_write_error:
            return "state write error";
        case error_code::state_corrupted:
            return "state corrupted";
        case error_code::executor_error:
            return "transfer executor error";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_initialized:
            return "not initialized";
        default:
            return "unknown error";
    }
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

}  // namespace kcenon::background_transfer

#endif  // KCENON_BACKGROUND_TRANSFER_CORE_TYPES_H

/**
 * @file types.h
 * @brief Core type definitions for path_migration_system
 */

#ifndef KCENON_PATH_MIGRATION_CORE_TYPES_H
#define KCENON_PATH_MIGRATION_CORE_TYPES_H

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::path_migration {

/**
 * @brief Error codes for connection migration operations
 */
enum class error_code {
    success = 0,

    // Connection ID errors (-300 to -319)
    pool_exhausted = -300,
    duplicate_id = -301,
    retired_id = -302,
    unknown_id = -303,
    invalid_connection_id = -304,
    no_available_id = -305,

    // Path errors (-320 to -339)
    unknown_path = -320,
    path_not_validated = -321,
    path_open_failed = -322,
    unvalidated_peer_path = -323,
    validation_in_progress = -324,

    // Migration errors (-340 to -359)
    migration_in_progress = -340,
    migration_failed = -341,

    // Stream continuity errors (-360 to -379)
    unknown_stream = -360,
    invalid_range = -361,

    // Transport errors (-380 to -399)
    malformed_frame = -380,
    send_failed = -381,
    transport_error = -382,
    connection_closed = -383,

    // Configuration errors (-140 to -159)
    invalid_configuration = -141,

    // Internal errors (-200 to -219)
    internal_error = -200,
    not_initialized = -201,
    already_initialized = -202,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::pool_exhausted:
            return "connection ID pool exhausted";
        case error_code::duplicate_id:
            return "duplicate connection ID sequence";
        case error_code::retired_id:
            return "connection ID retired";
        case error_code::unknown_id:
            return "unknown connection ID";
        case error_code::invalid_connection_id:
            return "invalid connection ID";
        case error_code::no_available_id:
            return "no available connection ID";
        case error_code::unknown_path:
            return "unknown path";
        case error_code::path_not_validated:
            return "path not validated";
        case error_code::path_open_failed:
            return "path open failed";
        case error_code::unvalidated_peer_path:
            return "unvalidated peer path";
        case error_code::validation_in_progress:
            return "validation already in progress";
        case error_code::migration_in_progress:
            return "migration in progress";
        case error_code::migration_failed:
            return "migration failed";
        case error_code::unknown_stream:
            return "unknown stream";
        case error_code::invalid_range:
            return "invalid byte range";
        case error_code::malformed_frame:
            return "malformed frame";
        case error_code::send_failed:
            return "send failed";
        case error_code::transport_error:
            return "transport error";
        case error_code::connection_closed:
            return "connection closed";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_initialized:
            return "not initialized";
        case error_code::already_initialized:
            return "already initialized";
        default:
            return "unknown error";
    }
}

/**
 * @brief Reason attached to a failed migration
 */
enum class failure_reason {
    none,
    timeout,              ///< No PATH_RESPONSE before the deadline
    validation_rejected,  ///< PATH_RESPONSE carried a token we never sent
    no_route,             ///< Candidate could not be resolved, bound or reached
    cancelled             ///< Attempt abandoned (connection closing or cancel())
};

/**
 * @brief Convert failure_reason to string
 */
[[nodiscard]] constexpr auto to_string(failure_reason reason) -> const char* {
    switch (reason) {
        case failure_reason::none: return "none";
        case failure_reason::timeout: return "timeout";
        case failure_reason::validation_rejected: return "validation_rejected";
        case failure_reason::no_route: return "no_route";
        case failure_reason::cancelled: return "cancelled";
        default: return "unknown";
    }
}

/**
 * @brief Error type with code, optional message and migration failure reason
 */
struct error {
    error_code code;
    std::string message;
    failure_reason reason = failure_reason::none;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}
    error(error_code c, failure_reason r, std::string msg)
        : code(c), message(std::move(msg)), reason(r) {}

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
 * A simple Result type similar to std::expected (C++23).
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

/**
 * @brief Identifier of a path slot in the path arena
 *
 * Identifiers are handed out monotonically and never reused within a
 * connection.
 */
struct path_id {
    uint32_t value;

    path_id() : value(0) {}
    explicit path_id(uint32_t v) : value(v) {}

    [[nodiscard]] auto operator==(const path_id& other) const -> bool = default;
    [[nodiscard]] auto operator<(const path_id& other) const -> bool {
        return value < other.value;
    }
};

/**
 * @brief Application stream identifier
 */
using stream_id = uint64_t;

}  // namespace kcenon::path_migration

// Hash support for path_id
template <>
struct std::hash<kcenon::path_migration::path_id> {
    auto operator()(const kcenon::path_migration::path_id& id) const noexcept -> std::size_t {
        return std::hash<uint32_t>{}(id.value);
    }
};

#endif  // KCENON_PATH_MIGRATION_CORE_TYPES_H

/**
 * @file path_validator.h
 * @brief PATH_CHALLENGE / PATH_RESPONSE driven path validation
 *
 * A candidate path is validated when the peer echoes one of the challenge
 * tokens issued for it, on the same path and from the candidate's remote
 * address. Each validation runs the state machine
 * idle -> challenging -> {validated, failed}, retrying with a fresh token
 * after a timeout or a rejected response.
 */

#ifndef KCENON_PATH_MIGRATION_VALIDATION_PATH_VALIDATOR_H
#define KCENON_PATH_MIGRATION_VALIDATION_PATH_VALIDATOR_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "kcenon/path_migration/connection/network_path.h"
#include "kcenon/path_migration/core/suspend_point.h"
#include "kcenon/path_migration/core/types.h"
#include "kcenon/path_migration/transport/path_frames.h"

namespace kcenon::path_migration {

/**
 * @brief Validator configuration
 */
struct validator_config {
    /// Time to wait for PATH_RESPONSE per attempt
    std::chrono::milliseconds challenge_timeout{1000};

    /// Additional attempts after the first one fails
    uint32_t max_retries = 3;
};

/**
 * @brief Per-candidate validation state
 */
enum class validation_state {
    idle,         ///< No validation known for the candidate
    challenging,  ///< PATH_CHALLENGE outstanding
    validated,    ///< Last validation succeeded
    failed        ///< Last validation was abandoned
};

[[nodiscard]] constexpr auto to_string(validation_state state) -> const char* {
    switch (state) {
        case validation_state::idle: return "idle";
        case validation_state::challenging: return "challenging";
        case validation_state::validated: return "validated";
        case validation_state::failed: return "failed";
        default: return "unknown";
    }
}

/**
 * @brief Final outcome of one validation
 */
enum class validation_outcome {
    validated,    ///< Matching PATH_RESPONSE on the candidate path
    timeout,      ///< Every attempt timed out
    rejected,     ///< Last attempt received an unknown token
    unreachable,  ///< PATH_CHALLENGE could not be sent
    cancelled     ///< Cancelled by the caller or connection close
};

[[nodiscard]] constexpr auto to_string(validation_outcome outcome) -> const char* {
    switch (outcome) {
        case validation_outcome::validated: return "validated";
        case validation_outcome::timeout: return "timeout";
        case validation_outcome::rejected: return "rejected";
        case validation_outcome::unreachable: return "unreachable";
        case validation_outcome::cancelled: return "cancelled";
        default: return "unknown";
    }
}

/**
 * @brief Result of a validation
 */
struct validation_result {
    validation_outcome outcome = validation_outcome::timeout;
    uint32_t attempts = 0;                ///< Challenges sent
    std::chrono::milliseconds rtt{0};     ///< Challenge to response, when validated
    std::string detail;                   ///< Send error text for unreachable

    [[nodiscard]] auto succeeded() const -> bool {
        return outcome == validation_outcome::validated;
    }
};

/**
 * @brief Validator statistics
 */
struct validator_statistics {
    uint64_t challenges_sent = 0;
    uint64_t responses_matched = 0;
    uint64_t responses_rejected = 0;
    uint64_t off_path_responses = 0;  ///< Matching token on another path, ignored
    uint64_t timeouts = 0;
    uint64_t challenges_answered = 0;
    uint64_t validations_succeeded = 0;
    uint64_t validations_failed = 0;
};

/**
 * @brief Sends one frame on a path (wraps header encoding and transport)
 */
using frame_sender = std::function<result<void>(const network_path&, const path_frame&)>;

/**
 * @brief Drives path validation for a connection
 *
 * @code
 * path_validator validator(sender);
 * auto result = validator.validate(candidate);
 * if (result && result.value().succeeded()) {
 *     // candidate may become active
 * }
 * @endcode
 */
class path_validator {
public:
    explicit path_validator(frame_sender sender, validator_config config = {});
    ~path_validator();

    path_validator(const path_validator&) = delete;
    path_validator& operator=(const path_validator&) = delete;

    /**
     * @brief Validate a candidate path, blocking until an outcome is known
     * @param candidate Path to validate (copied)
     * @param token Cancels the wait
     * @return The outcome, or validation_in_progress if the same candidate
     *         (path id and remote) is already being validated
     */
    [[nodiscard]] auto validate(const network_path& candidate,
                                cancellation_token token = {})
        -> result<validation_result>;

    /**
     * @brief Validate on a background thread
     *
     * The destructor cancels pending tasks and waits for them, so the
     * future may outlive the validator.
     */
    [[nodiscard]] auto validate_async(network_path candidate,
                                      cancellation_token token = {})
        -> std::future<result<validation_result>>;

    /**
     * @brief Feed a PATH_RESPONSE received on a path
     */
    void on_path_response(path_id arrival, const socket_address& source,
                          const path_token& token);

    /**
     * @brief Answer a PATH_CHALLENGE on the path it arrived on
     */
    auto on_path_challenge(const network_path& arrival, const socket_address& source,
                           const path_token& token) -> result<void>;

    [[nodiscard]] auto state(path_id path, const socket_address& remote) const
        -> validation_state;

    /**
     * @brief Number of validations currently in challenging state
     */
    [[nodiscard]] auto challenging_count() const -> std::size_t;

    /**
     * @brief Cancel every in-flight validation
     */
    void cancel_all();

    [[nodiscard]] auto get_statistics() const -> validator_statistics;
    [[nodiscard]] auto config() const -> const validator_config&;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::path_migration

#endif  // KCENON_PATH_MIGRATION_VALIDATION_PATH_VALIDATOR_H

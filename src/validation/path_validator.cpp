/**
 * @file path_validator.cpp
 * @brief Path validation implementation
 */

#include "kcenon/path_migration/validation/path_validator.h"
#include "kcenon/path_migration/core/logging.h"
#include "kcenon/path_migration/core/secure_random.h"

#include <algorithm>
#include <condition_variable>
#include <map>
#include <mutex>
#include <system_error>
#include <utility>
#include <vector>

namespace kcenon::path_migration {

namespace {

/**
 * @brief What resumed an attempt
 */
enum class attempt_signal {
    matched,
    rejected,
    timeout,
    cancelled
};

using candidate_key = std::pair<uint32_t, std::string>;

auto key_of(path_id path, const socket_address& remote) -> candidate_key {
    return {path.value, remote.to_string()};
}

auto context_of(const network_path& path) -> path_log_context {
    path_log_context ctx;
    ctx.path_id = path.id.value;
    ctx.local_address = path.local.to_string();
    ctx.remote_address = path.remote.to_string();
    if (!path.interface_name.empty()) {
        ctx.interface_name = path.interface_name;
    }
    return ctx;
}

}  // namespace

struct path_validator::impl {
    /**
     * @brief One in-flight validation
     */
    struct entry {
        network_path candidate;
        std::vector<path_token> issued;  ///< Tokens of every attempt so far
        std::shared_ptr<suspend_point<attempt_signal>> waiter;
        bool cancelled = false;
    };

    frame_sender sender;
    validator_config config;

    mutable std::mutex mutex;
    std::map<candidate_key, std::shared_ptr<entry>> in_flight;
    std::map<candidate_key, validation_state> finished;
    validator_statistics stats;
    bool closing = false;  ///< Set by the destructor; guarded by mutex

    // The destructor waits here for validate_async tasks
    std::mutex lifecycle_mutex;
    std::condition_variable lifecycle_cv;
    std::size_t async_tasks = 0;

    impl(frame_sender s, validator_config cfg)
        : sender(std::move(s)), config(std::move(cfg)) {}

    void end_async_task() {
        std::lock_guard lock(lifecycle_mutex);
        async_tasks--;
        lifecycle_cv.notify_all();
    }

    void finish(const candidate_key& key, const validation_result& outcome) {
        std::lock_guard lock(mutex);
        in_flight.erase(key);
        finished[key] = outcome.succeeded() ? validation_state::validated
                                            : validation_state::failed;
        if (outcome.succeeded()) {
            stats.validations_succeeded++;
        } else {
            stats.validations_failed++;
        }
    }
};

path_validator::path_validator(frame_sender sender, validator_config config)
    : impl_(std::make_unique<impl>(std::move(sender), std::move(config))) {}

path_validator::~path_validator() {
    {
        std::lock_guard lock(impl_->mutex);
        impl_->closing = true;
    }
    cancel_all();

    std::unique_lock lock(impl_->lifecycle_mutex);
    impl_->lifecycle_cv.wait(lock, [this] { return impl_->async_tasks == 0; });
}

auto path_validator::validate(const network_path& candidate, cancellation_token token)
    -> result<validation_result> {
    auto key = key_of(candidate.id, candidate.remote);
    auto current = std::make_shared<impl::entry>();
    current->candidate = candidate;

    {
        std::lock_guard lock(impl_->mutex);
        if (impl_->closing) {
            validation_result cancelled;
            cancelled.outcome = validation_outcome::cancelled;
            return cancelled;
        }
        if (impl_->in_flight.count(key) > 0) {
            return unexpected(error(error_code::validation_in_progress,
                "Validation of " + candidate.to_string() + " already in progress"));
        }
        impl_->in_flight.emplace(key, current);
        impl_->finished.erase(key);
    }

    auto ctx = context_of(candidate);
    validation_result outcome;
    outcome.outcome = validation_outcome::timeout;
    const uint32_t total_attempts = 1 + impl_->config.max_retries;

    for (uint32_t attempt = 1; attempt <= total_attempts; ++attempt) {
        path_token challenge{};
        auto filled = fill_random(challenge.data(), challenge.size());
        if (!filled) {
            impl_->finish(key, outcome);
            return unexpected(filled.error());
        }

        auto waiter = std::make_shared<suspend_point<attempt_signal>>();
        {
            std::lock_guard lock(impl_->mutex);
            if (current->cancelled) {
                outcome.outcome = validation_outcome::cancelled;
                break;
            }
            current->issued.push_back(challenge);
            current->waiter = waiter;
        }

        auto sent_at = std::chrono::steady_clock::now();
        auto sent = impl_->sender(candidate, path_challenge_frame{challenge});
        if (!sent) {
            outcome.outcome = validation_outcome::unreachable;
            outcome.detail = sent.error().message;
            ctx.error_message = sent.error().message;
            PM_LOG_WARN_CTX(log_category::validator, "PATH_CHALLENGE send failed", ctx);
            break;
        }

        outcome.attempts = attempt;
        {
            std::lock_guard lock(impl_->mutex);
            impl_->stats.challenges_sent++;
        }
        ctx.attempt = attempt;
        PM_LOG_DEBUG_CTX(log_category::validator, "PATH_CHALLENGE sent", ctx);

        auto signal = waiter->wait_until(sent_at + impl_->config.challenge_timeout,
                                         attempt_signal::timeout,
                                         token,
                                         attempt_signal::cancelled);

        if (signal == attempt_signal::matched) {
            outcome.outcome = validation_outcome::validated;
            outcome.rtt = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - sent_at);
            break;
        }
        if (signal == attempt_signal::cancelled) {
            outcome.outcome = validation_outcome::cancelled;
            break;
        }
        if (signal == attempt_signal::timeout) {
            outcome.outcome = validation_outcome::timeout;
            std::lock_guard lock(impl_->mutex);
            impl_->stats.timeouts++;
        } else {
            outcome.outcome = validation_outcome::rejected;
        }

        if (attempt < total_attempts) {
            PM_LOG_DEBUG_CTX(log_category::validator,
                std::string("Validation attempt failed (") + to_string(outcome.outcome) +
                "), retrying", ctx);
        }
    }

    impl_->finish(key, outcome);

    ctx.duration_ms = static_cast<uint64_t>(outcome.rtt.count());
    if (outcome.succeeded()) {
        PM_LOG_INFO_CTX(log_category::validator, "Path validated", ctx);
    } else {
        ctx.error_message = to_string(outcome.outcome);
        PM_LOG_WARN_CTX(log_category::validator, "Path validation failed", ctx);
    }
    return outcome;
}

auto path_validator::validate_async(network_path candidate, cancellation_token token)
    -> std::future<result<validation_result>> {
    {
        std::lock_guard lock(impl_->lifecycle_mutex);
        impl_->async_tasks++;
    }
    try {
        return std::async(std::launch::async,
            [this, candidate = std::move(candidate), token]() {
                auto outcome = validate(candidate, token);
                impl_->end_async_task();
                return outcome;
            });
    } catch (const std::system_error&) {
        impl_->end_async_task();
        throw;
    }
}

void path_validator::on_path_response(path_id arrival, const socket_address& source,
                                      const path_token& token) {
    std::shared_ptr<suspend_point<attempt_signal>> to_resume;
    attempt_signal signal = attempt_signal::matched;

    {
        std::lock_guard lock(impl_->mutex);

        std::shared_ptr<impl::entry> owner;
        for (const auto& [key, current] : impl_->in_flight) {
            if (std::find(current->issued.begin(), current->issued.end(), token) !=
                current->issued.end()) {
                owner = current;
                break;
            }
        }

        if (owner) {
            if (owner->candidate.id == arrival && owner->candidate.remote == source) {
                impl_->stats.responses_matched++;
                to_resume = owner->waiter;
                signal = attempt_signal::matched;
            } else {
                // A valid token on the wrong path proves nothing about the candidate
                impl_->stats.off_path_responses++;
                PM_LOG_DEBUG(log_category::validator,
                    "Ignoring PATH_RESPONSE for " + owner->candidate.to_string() +
                    " received on path #" + std::to_string(arrival.value) +
                    " from " + source.to_string());
            }
        } else {
            auto it = impl_->in_flight.find(key_of(arrival, source));
            if (it != impl_->in_flight.end()) {
                impl_->stats.responses_rejected++;
                to_resume = it->second->waiter;
                signal = attempt_signal::rejected;
            } else {
                PM_LOG_DEBUG(log_category::validator,
                    "Unsolicited PATH_RESPONSE from " + source.to_string());
            }
        }
    }

    if (to_resume) {
        to_resume->resume(signal);
    }
}

auto path_validator::on_path_challenge(const network_path& arrival,
                                       const socket_address& source,
                                       const path_token& token) -> result<void> {
    network_path reply_path = arrival;
    reply_path.remote = source;

    auto sent = impl_->sender(reply_path, path_response_frame{token});
    if (!sent) {
        return sent;
    }

    std::lock_guard lock(impl_->mutex);
    impl_->stats.challenges_answered++;
    return {};
}

auto path_validator::state(path_id path, const socket_address& remote) const
    -> validation_state {
    std::lock_guard lock(impl_->mutex);
    auto key = key_of(path, remote);
    if (impl_->in_flight.count(key) > 0) {
        return validation_state::challenging;
    }
    auto it = impl_->finished.find(key);
    if (it != impl_->finished.end()) {
        return it->second;
    }
    return validation_state::idle;
}

auto path_validator::challenging_count() const -> std::size_t {
    std::lock_guard lock(impl_->mutex);
    return impl_->in_flight.size();
}

void path_validator::cancel_all() {
    std::vector<std::shared_ptr<suspend_point<attempt_signal>>> waiters;
    {
        std::lock_guard lock(impl_->mutex);
        for (auto& [key, current] : impl_->in_flight) {
            current->cancelled = true;
            if (current->waiter) {
                waiters.push_back(current->waiter);
            }
        }
    }
    for (auto& waiter : waiters) {
        waiter->resume(attempt_signal::cancelled);
    }
}

auto path_validator::get_statistics() const -> validator_statistics {
    std::lock_guard lock(impl_->mutex);
    return impl_->stats;
}

auto path_validator::config() const -> const validator_config& {
    return impl_->config;
}

}  // namespace kcenon::path_migration

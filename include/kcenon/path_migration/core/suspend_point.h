/**
 * @file suspend_point.h
 * @brief One-shot suspend point with deadline and cancellation
 *
 * A waiter blocks on a suspend_point until exactly one of three things
 * happens: a producer resumes it with a value, the deadline passes, or the
 * associated cancellation_token fires. Whichever comes first wins; every
 * later resume attempt is rejected.
 */

#ifndef KCENON_PATH_MIGRATION_CORE_SUSPEND_POINT_H
#define KCENON_PATH_MIGRATION_CORE_SUSPEND_POINT_H

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace kcenon::path_migration {

/**
 * @brief Shared cancellation flag with callbacks
 *
 * Copies share state. Cancellation is sticky.
 */
class cancellation_token {
public:
    using callback = std::function<void()>;
    using registration = uint64_t;

    cancellation_token() : state_(std::make_shared<state>()) {}

    /**
     * @brief Request cancellation and run registered callbacks once
     *
     * Callbacks run under the token lock so that unsubscribe() returns only
     * after a running callback has finished. Callbacks must not call back
     * into the same token.
     */
    void request_cancel() {
        std::lock_guard lock(state_->mutex);
        if (state_->cancelled) {
            return;
        }
        state_->cancelled = true;
        for (auto& [id, cb] : state_->callbacks) {
            cb();
        }
        state_->callbacks.clear();
    }

    [[nodiscard]] auto is_cancelled() const -> bool {
        std::lock_guard lock(state_->mutex);
        return state_->cancelled;
    }

    /**
     * @brief Register a callback run on cancellation
     *
     * Runs the callback immediately (and returns 0) if already cancelled.
     */
    auto subscribe(callback cb) -> registration {
        {
            std::lock_guard lock(state_->mutex);
            if (!state_->cancelled) {
                auto id = ++state_->next_id;
                state_->callbacks.emplace(id, std::move(cb));
                return id;
            }
        }
        cb();
        return 0;
    }

    void unsubscribe(registration id) {
        if (id == 0) {
            return;
        }
        std::lock_guard lock(state_->mutex);
        state_->callbacks.erase(id);
    }

private:
    struct state {
        std::mutex mutex;
        bool cancelled = false;
        registration next_id = 0;
        std::map<registration, callback> callbacks;
    };

    std::shared_ptr<state> state_;
};

/**
 * @brief Single-shot rendezvous between one waiter and many resumers
 */
template <typename T>
class suspend_point {
public:
    suspend_point() = default;

    suspend_point(const suspend_point&) = delete;
    suspend_point& operator=(const suspend_point&) = delete;

    /**
     * @brief Resume the waiter with a value
     * @return true if this call resumed it, false if already resumed
     */
    auto resume(T value) -> bool {
        {
            std::lock_guard lock(mutex_);
            if (value_) {
                return false;
            }
            value_.emplace(std::move(value));
        }
        cv_.notify_all();
        return true;
    }

    /**
     * @brief Block until resumed, the deadline passes, or the token fires
     *
     * On deadline the point resumes itself with timeout_value; on
     * cancellation with cancelled_value.
     */
    auto wait_until(std::chrono::steady_clock::time_point deadline,
                    T timeout_value,
                    cancellation_token token,
                    T cancelled_value) -> T {
        auto reg = token.subscribe([this, v = cancelled_value]() mutable {
            resume(std::move(v));
        });

        T result = [&] {
            std::unique_lock lock(mutex_);
            if (!cv_.wait_until(lock, deadline, [this] { return value_.has_value(); })) {
                value_.emplace(std::move(timeout_value));
            }
            return *value_;
        }();

        token.unsubscribe(reg);
        return result;
    }

    /**
     * @brief Block until resumed or the deadline passes
     */
    auto wait_until(std::chrono::steady_clock::time_point deadline, T timeout_value) -> T {
        std::unique_lock lock(mutex_);
        if (!cv_.wait_until(lock, deadline, [this] { return value_.has_value(); })) {
            value_.emplace(std::move(timeout_value));
        }
        return *value_;
    }

    [[nodiscard]] auto is_resumed() const -> bool {
        std::lock_guard lock(mutex_);
        return value_.has_value();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<T> value_;
};

}  // namespace kcenon::path_migration

#endif  // KCENON_PATH_MIGRATION_CORE_SUSPEND_POINT_H

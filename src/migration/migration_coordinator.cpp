/**
 * @file migration_coordinator.cpp
 * @brief Migration coordinator implementation
 */

#include "kcenon/path_migration/migration/migration_coordinator.h"
#include "kcenon/path_migration/core/logging.h"

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace kcenon::path_migration {

namespace {

auto reason_of(validation_outcome outcome) -> failure_reason {
    switch (outcome) {
        case validation_outcome::timeout: return failure_reason::timeout;
        case validation_outcome::rejected: return failure_reason::validation_rejected;
        case validation_outcome::unreachable: return failure_reason::no_route;
        case validation_outcome::cancelled: return failure_reason::cancelled;
        default: return failure_reason::none;
    }
}

}  // namespace

struct migration_coordinator::impl {
    /**
     * @brief Ephemeral record of one migrate_to call
     */
    struct attempt {
        network_path candidate;
        connection_id local_id;
        connection_id peer_id;
        bool fresh_peer = false;
        clock::time_point started_at;
    };

    struct closing_path {
        path_id id;
        clock::time_point deadline;
    };

    migration_components components;
    migration_config config;

    std::atomic<bool> in_flight{false};
    std::atomic<bool> closed{false};

    // shutdown() waits here for the attempt and every migrate_to_async task
    std::mutex lifecycle_mutex;
    std::condition_variable lifecycle_cv;
    std::size_t async_tasks = 0;
    std::atomic<migration_state> current_state{migration_state::idle};

    std::mutex attempt_mutex;
    std::optional<cancellation_token> attempt_token;

    // Serializes the active path switch against tick()
    std::mutex switch_mutex;
    std::vector<closing_path> closing_paths;

    std::mutex peer_mutex;
    std::map<std::string, std::future<void>> peer_validations;
    cancellation_token close_token;

    event_callback event_cb;
    mutable std::mutex callback_mutex;

    mutable std::mutex stats_mutex;
    migration_statistics stats;

    impl(migration_components c, migration_config cfg)
        : components(std::move(c)), config(std::move(cfg)) {}

    /**
     * @brief Clears the in-flight flag when an attempt ends
     */
    class attempt_guard {
    public:
        explicit attempt_guard(impl& owner) : owner_(owner) {}
        ~attempt_guard() { owner_.end_attempt(); }

        attempt_guard(const attempt_guard&) = delete;
        attempt_guard& operator=(const attempt_guard&) = delete;

    private:
        impl& owner_;
    };

    // Both notify under the lock: the waiter may destroy *this once it wakes
    void end_attempt() {
        std::lock_guard lock(lifecycle_mutex);
        in_flight.store(false);
        lifecycle_cv.notify_all();
    }

    void end_async_task() {
        std::lock_guard lock(lifecycle_mutex);
        async_tasks--;
        lifecycle_cv.notify_all();
    }

    void set_state(migration_state new_state) {
        auto old_state = current_state.exchange(new_state);
        if (old_state != new_state) {
            PM_LOG_DEBUG(log_category::coordinator,
                "Migration state changed: " +
                std::string(to_string(old_state)) + " -> " +
                std::string(to_string(new_state)));
        }
    }

    void emit_event(const migration_event_data& event) {
        std::lock_guard lock(callback_mutex);
        if (event_cb) {
            event_cb(event);
        }
    }

    void record_success(std::chrono::milliseconds duration) {
        std::lock_guard lock(stats_mutex);
        stats.successful_migrations++;
        stats.last_migration_time = duration;
        // Update average migration time
        auto total_time = stats.avg_migration_time.count() *
                          static_cast<int64_t>(stats.successful_migrations - 1) +
                          duration.count();
        stats.avg_migration_time = std::chrono::milliseconds{
            total_time / static_cast<int64_t>(stats.successful_migrations)};
    }

    void record_failure() {
        std::lock_guard lock(stats_mutex);
        stats.failed_migrations++;
    }

    void send_retire(uint64_t sequence) {
        auto active = components.paths.active();
        if (!active) {
            return;
        }
        auto sent = components.sender(active.value(), retire_connection_id_frame{sequence});
        if (!sent) {
            PM_LOG_WARN(log_category::coordinator,
                "RETIRE_CONNECTION_ID #" + std::to_string(sequence) +
                " not sent: " + sent.error().message);
        }
    }

    /**
     * @brief Undo everything an attempt created, leaving the active path alone
     */
    void discard(const attempt& current, bool path_registered) {
        if (path_registered) {
            auto id = current.candidate.id;
            if (components.transport.is_open(id)) {
                auto closed_path = components.transport.close_path(id);
                if (!closed_path) {
                    PM_LOG_WARN(log_category::coordinator,
                        "Closing candidate failed: " + closed_path.error().message);
                }
            }
            components.pool.release_path(id);
            auto removed = components.paths.remove(id);
            if (!removed) {
                PM_LOG_WARN(log_category::coordinator,
                    "Removing candidate failed: " + removed.error().message);
            }
        }

        auto retired = components.pool.retire(id_issuer::local, current.local_id.sequence);
        if (!retired) {
            PM_LOG_DEBUG(log_category::coordinator,
                "Local ID not retired: " + retired.error().message);
        }

        if (current.fresh_peer) {
            retired = components.pool.retire(id_issuer::peer, current.peer_id.sequence);
            if (retired) {
                send_retire(current.peer_id.sequence);
            } else {
                PM_LOG_DEBUG(log_category::coordinator,
                    "Peer ID not retired: " + retired.error().message);
            }
        }
    }

    auto fail(const attempt& current, bool path_registered, failure_reason reason,
              const std::string& message) -> unexpected {
        discard(current, path_registered);
        record_failure();
        set_state(migration_state::failed);

        path_log_context ctx;
        ctx.path_id = current.candidate.id.value;
        ctx.local_address = current.candidate.local.to_string();
        ctx.remote_address = current.candidate.remote.to_string();
        ctx.error_message = std::string(to_string(reason)) + ": " + message;
        PM_LOG_WARN_CTX(log_category::coordinator, "Migration failed", ctx);

        migration_event_data event(migration_event::migration_failed);
        if (path_registered) {
            event.new_path = current.candidate;
        }
        event.reason = reason;
        event.error_message = message;
        emit_event(event);

        return unexpected(error(error_code::migration_failed, reason, message));
    }

    auto resolve_local(const migration_target& target) -> result<local_binding> {
        local_binding binding;
        binding.interface_name = target.interface_name;
        binding.port = target.local_port;

        if (!target.local_address.empty()) {
            binding.address = target.local_address;
            return binding;
        }
        if (target.interface_name.empty()) {
            return unexpected(error(error_code::migration_failed, failure_reason::no_route,
                "Migration target names neither an interface nor an address"));
        }

        auto address = components.resolver.resolve(target.interface_name);
        if (!address) {
            return unexpected(error(error_code::migration_failed, failure_reason::no_route,
                address.error().message));
        }
        binding.address = address.value();
        return binding;
    }

    auto run(const migration_target& target, cancellation_token token)
        -> result<migration_report> {
        attempt current;
        current.started_at = clock::now();
        set_state(migration_state::preparing);

        auto active = components.paths.active();
        if (!active) {
            set_state(migration_state::failed);
            return unexpected(error(error_code::not_initialized, "No active path"));
        }
        const auto old_path = active.value();

        // Resolve the candidate
        auto binding = resolve_local(target);
        if (!binding) {
            record_failure();
            set_state(migration_state::failed);
            migration_event_data event(migration_event::migration_failed);
            event.reason = failure_reason::no_route;
            event.error_message = binding.error().message;
            emit_event(event);
            PM_LOG_WARN(log_category::coordinator,
                "Cannot resolve " + target.to_string() + ": " + binding.error().message);
            return unexpected(binding.error());
        }
        auto remote = target.remote.value_or(old_path.remote);

        // Fresh connection IDs
        auto local_id = components.pool.allocate_local();
        if (!local_id) {
            record_failure();
            set_state(migration_state::failed);
            if (local_id.error().code == error_code::pool_exhausted) {
                return unexpected(error(error_code::no_available_id,
                    "No local connection ID available: " + local_id.error().message));
            }
            return unexpected(local_id.error());
        }
        current.local_id = local_id.value();

        if (config.require_fresh_peer_id) {
            auto peer_id = components.pool.claim_peer();
            if (!peer_id) {
                auto discarded = components.pool.retire(id_issuer::local, current.local_id.sequence);
                if (!discarded) {
                    PM_LOG_DEBUG(log_category::coordinator, discarded.error().message);
                }
                record_failure();
                set_state(migration_state::failed);
                return unexpected(error(error_code::no_available_id,
                    "No unused peer connection ID: " + peer_id.error().message));
            }
            current.peer_id = peer_id.value();
            current.fresh_peer = true;
        } else {
            auto peer_id = components.pool.active_for(old_path.id, id_issuer::peer);
            if (!peer_id) {
                auto discarded = components.pool.retire(id_issuer::local, current.local_id.sequence);
                if (!discarded) {
                    PM_LOG_DEBUG(log_category::coordinator, discarded.error().message);
                }
                record_failure();
                set_state(migration_state::failed);
                return unexpected(error(error_code::no_available_id,
                    "Active path has no peer connection ID"));
            }
            current.peer_id = peer_id.value();
        }

        // Register and bind the candidate without touching the active path
        current.candidate = components.paths.add(
            socket_address{binding.value().address, binding.value().port},
            remote, binding.value().interface_name);

        auto bound = components.transport.open_path(current.candidate.id, binding.value(), remote);
        if (!bound) {
            return fail(current, true, failure_reason::no_route, bound.error().message);
        }
        current.candidate.local = bound.value();
        auto updated = components.paths.set_local(current.candidate.id, bound.value());
        if (!updated) {
            return fail(current, true, failure_reason::none, updated.error().message);
        }

        auto bound_local = components.pool.set_active(
            current.candidate.id, id_issuer::local, current.local_id.sequence);
        auto bound_peer = components.pool.set_active(
            current.candidate.id, id_issuer::peer, current.peer_id.sequence);
        if (!bound_local || !bound_peer) {
            return fail(current, true, failure_reason::none,
                !bound_local ? bound_local.error().message : bound_peer.error().message);
        }

        // Tell the peer about the new local ID over the active path
        new_connection_id_frame announce;
        announce.sequence = current.local_id.sequence;
        announce.connection_id = current.local_id.bytes;
        auto announced = components.sender(old_path, announce);
        if (announced) {
            auto marked = components.pool.mark_advertised(current.local_id.sequence);
            if (!marked) {
                PM_LOG_DEBUG(log_category::coordinator, marked.error().message);
            }
        } else {
            PM_LOG_WARN(log_category::coordinator,
                "NEW_CONNECTION_ID not sent: " + announced.error().message);
        }

        migration_event_data opened(migration_event::path_opened);
        opened.old_path = old_path;
        opened.new_path = current.candidate;
        emit_event(opened);

        // Validate
        set_state(migration_state::validating);
        auto marked_validating = components.paths.set_state(current.candidate.id, path_state::validating);
        if (!marked_validating) {
            return fail(current, true, failure_reason::none, marked_validating.error().message);
        }
        current.candidate.state = path_state::validating;

        auto validation = components.validator.validate(current.candidate, token);
        if (!validation) {
            return fail(current, true, failure_reason::none, validation.error().message);
        }
        if (!validation.value().succeeded()) {
            const auto& outcome = validation.value();
            std::string message = "Validation of " + current.candidate.to_string() + " " +
                                  to_string(outcome.outcome) + " after " +
                                  std::to_string(outcome.attempts) + " attempt(s)";
            if (!outcome.detail.empty()) {
                message += ": " + outcome.detail;
            }
            return fail(current, true, reason_of(outcome.outcome), message);
        }

        migration_event_data validated(migration_event::path_validated);
        validated.new_path = current.candidate;
        emit_event(validated);

        // Switch
        set_state(migration_state::switching);
        migration_report report;
        {
            std::lock_guard lock(switch_mutex);

            auto marked = components.paths.set_state(current.candidate.id, path_state::validated);
            if (!marked) {
                return fail(current, true, failure_reason::none, marked.error().message);
            }
            auto rtt_set = components.paths.set_rtt(current.candidate.id, validation.value().rtt);
            if (!rtt_set) {
                PM_LOG_DEBUG(log_category::coordinator, rtt_set.error().message);
            }

            auto activated = components.paths.activate(current.candidate.id);
            if (!activated) {
                return fail(current, true, failure_reason::none, activated.error().message);
            }

            auto deadline = clock::now() + config.retirement_grace_period;
            auto old_local = components.pool.active_for(old_path.id, id_issuer::local);
            if (old_local && !old_local.value().same_identity(current.local_id)) {
                auto scheduled = components.pool.schedule_retirement(
                    id_issuer::local, old_local.value().sequence, deadline);
                if (scheduled) {
                    report.retiring_ids.push_back(old_local.value());
                }
            }
            auto old_peer = components.pool.active_for(old_path.id, id_issuer::peer);
            if (old_peer && !old_peer.value().same_identity(current.peer_id)) {
                auto scheduled = components.pool.schedule_retirement(
                    id_issuer::peer, old_peer.value().sequence, deadline);
                if (scheduled) {
                    report.retiring_ids.push_back(old_peer.value());
                }
            }
            closing_paths.push_back({old_path.id, deadline});

            auto new_path = components.paths.get(current.candidate.id);
            if (new_path) {
                current.candidate = new_path.value();
            }

            auto rescheduled = components.bridge.on_path_switch(old_path.id, current.candidate);
            if (rescheduled) {
                report.rescheduled_bytes = rescheduled.value();
            } else {
                PM_LOG_WARN(log_category::coordinator,
                    "Re-scheduling data failed: " + rescheduled.error().message);
            }
        }

        report.old_path = old_path;
        report.new_path = current.candidate;
        report.active_local_id = current.local_id;
        report.active_peer_id = current.peer_id;
        report.validation_attempts = validation.value().attempts;
        report.path_rtt = validation.value().rtt;
        report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            clock::now() - current.started_at);

        record_success(report.duration);
        set_state(migration_state::completed);

        path_log_context ctx;
        ctx.path_id = current.candidate.id.value;
        ctx.local_address = current.candidate.local.to_string();
        ctx.remote_address = current.candidate.remote.to_string();
        ctx.interface_name = current.candidate.interface_name;
        ctx.duration_ms = static_cast<uint64_t>(report.duration.count());
        ctx.bytes = report.rescheduled_bytes;
        ctx.connection_id = current.local_id.to_hex();
        PM_LOG_INFO_CTX(log_category::coordinator, "Migration completed", ctx);

        migration_event_data completed(migration_event::migration_completed);
        completed.old_path = old_path;
        completed.new_path = current.candidate;
        emit_event(completed);

        return report;
    }

    /**
     * @brief Drop finished peer validations; caller holds peer_mutex
     */
    void reap_peer_validations() {
        for (auto it = peer_validations.begin(); it != peer_validations.end();) {
            if (it->second.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                it->second.get();
                it = peer_validations.erase(it);
            } else {
                ++it;
            }
        }
    }

    void validate_peer_address(network_path candidate, socket_address source) {
        auto validation = components.validator.validate(candidate, close_token);
        if (!validation || !validation.value().succeeded()) {
            PM_LOG_WARN(log_category::coordinator,
                "Peer address " + source.to_string() + " not validated");
            return;
        }
        if (components.paths.active_id() != candidate.id) {
            return;
        }

        auto updated = components.paths.set_remote(candidate.id, source);
        if (!updated) {
            PM_LOG_WARN(log_category::coordinator, updated.error().message);
            return;
        }

        {
            std::lock_guard lock(stats_mutex);
            stats.peer_address_changes++;
        }
        PM_LOG_INFO(log_category::coordinator,
            "Peer address changed to " + source.to_string());

        migration_event_data event(migration_event::peer_address_changed);
        event.new_path = candidate;
        emit_event(event);
    }
};

migration_coordinator::migration_coordinator(migration_components components,
                                             migration_config config)
    : impl_(std::make_unique<impl>(std::move(components), std::move(config))) {}

migration_coordinator::~migration_coordinator() {
    shutdown();
}

auto migration_coordinator::migrate_to(const migration_target& target)
    -> result<migration_report> {
    if (impl_->closed.load()) {
        return unexpected(error(error_code::connection_closed, "Connection is closed"));
    }

    bool expected = false;
    if (!impl_->in_flight.compare_exchange_strong(expected, true)) {
        {
            std::lock_guard lock(impl_->stats_mutex);
            impl_->stats.rejected_in_progress++;
        }
        return unexpected(error(error_code::migration_in_progress,
            "A migration attempt is already in flight"));
    }
    impl::attempt_guard guard(*impl_);

    cancellation_token token;
    {
        std::lock_guard lock(impl_->attempt_mutex);
        impl_->attempt_token = token;
        if (impl_->closed.load()) {
            // shutdown() ran between the closed check and here
            token.request_cancel();
        }
    }
    {
        std::lock_guard lock(impl_->stats_mutex);
        impl_->stats.total_migrations++;
    }

    PM_LOG_INFO(log_category::coordinator, "Migrating to " + target.to_string());
    impl_->emit_event(migration_event_data(migration_event::migration_started));

    auto outcome = impl_->run(target, token);

    std::lock_guard lock(impl_->attempt_mutex);
    impl_->attempt_token.reset();
    return outcome;
}

auto migration_coordinator::migrate_to_async(migration_target target)
    -> std::future<result<migration_report>> {
    {
        std::lock_guard lock(impl_->lifecycle_mutex);
        impl_->async_tasks++;
    }
    try {
        return std::async(std::launch::async, [this, target = std::move(target)]() {
            auto outcome = migrate_to(target);
            impl_->end_async_task();
            return outcome;
        });
    } catch (const std::system_error&) {
        impl_->end_async_task();
        throw;
    }
}

auto migration_coordinator::accept_inbound(path_id arrival, const socket_address& source)
    -> result<void> {
    auto active = impl_->components.paths.active();
    if (!active || active.value().id != arrival || active.value().remote == source) {
        return {};
    }

    if (!impl_->config.validate_peer_address_change) {
        auto updated = impl_->components.paths.set_remote(arrival, source);
        if (!updated) {
            return updated;
        }
        std::lock_guard lock(impl_->stats_mutex);
        impl_->stats.peer_address_changes++;
        return {};
    }

    auto key = source.to_string();
    {
        std::lock_guard lock(impl_->peer_mutex);
        impl_->reap_peer_validations();

        if (impl_->peer_validations.count(key) == 0 && !impl_->closed.load()) {
            if (impl_->peer_validations.size() >= impl_->config.max_peer_validations) {
                {
                    std::lock_guard stats_lock(impl_->stats_mutex);
                    impl_->stats.peer_validations_dropped++;
                }
                PM_LOG_DEBUG(log_category::coordinator,
                    "Not validating " + key + ": " +
                    std::to_string(impl_->peer_validations.size()) +
                    " peer validation(s) already running");
            } else {
                network_path candidate = active.value();
                candidate.remote = source;
                PM_LOG_INFO(log_category::coordinator,
                    "Packet from unvalidated peer address " + key + ", validating");
                impl_->peer_validations.emplace(key, std::async(std::launch::async,
                    [this, candidate, source]() {
                        impl_->validate_peer_address(candidate, source);
                    }));
            }
        }
    }

    return unexpected(error(error_code::unvalidated_peer_path,
        "Source " + key + " is not the validated peer address"));
}

auto migration_coordinator::tick(clock::time_point now) -> std::size_t {
    auto retired = impl_->components.pool.retire_expired(now);
    for (const auto& id : retired) {
        if (id.issuer == id_issuer::peer) {
            impl_->send_retire(id.sequence);
        }
    }

    if (!retired.empty()) {
        {
            std::lock_guard lock(impl_->stats_mutex);
            impl_->stats.retired_ids += retired.size();
        }
        PM_LOG_DEBUG(log_category::coordinator,
            "Retired " + std::to_string(retired.size()) + " connection ID(s)");
        impl_->emit_event(migration_event_data(migration_event::connection_ids_retired));
    }

    {
        std::lock_guard lock(impl_->switch_mutex);
        auto active = impl_->components.paths.active_id();
        for (auto it = impl_->closing_paths.begin(); it != impl_->closing_paths.end();) {
            if (it->deadline > now) {
                ++it;
                continue;
            }
            if (active && *active == it->id) {
                // Migrated back onto this path before the deadline
                it = impl_->closing_paths.erase(it);
                continue;
            }
            auto active_path = impl_->components.paths.active();
            if (active_path) {
                auto recovered = impl_->components.bridge.on_path_closed(it->id, active_path.value());
                if (!recovered) {
                    PM_LOG_WARN(log_category::coordinator,
                        "Re-scheduling data of closed path failed: " + recovered.error().message);
                }
            }
            if (impl_->components.transport.is_open(it->id)) {
                auto closed_path = impl_->components.transport.close_path(it->id);
                if (!closed_path) {
                    PM_LOG_WARN(log_category::coordinator, closed_path.error().message);
                }
            }
            impl_->components.pool.release_path(it->id);
            auto removed = impl_->components.paths.remove(it->id);
            if (!removed) {
                PM_LOG_DEBUG(log_category::coordinator, removed.error().message);
            }
            PM_LOG_DEBUG(log_category::coordinator,
                "Closed retired path #" + std::to_string(it->id.value));
            it = impl_->closing_paths.erase(it);
        }
    }

    {
        std::lock_guard lock(impl_->peer_mutex);
        impl_->reap_peer_validations();
    }
    return retired.size();
}

auto migration_coordinator::flush_active() -> result<uint64_t> {
    std::lock_guard lock(impl_->switch_mutex);
    auto active = impl_->components.paths.active();
    if (!active) {
        return unexpected(active.error());
    }
    return impl_->components.bridge.flush(active.value());
}

void migration_coordinator::cancel() {
    std::lock_guard lock(impl_->attempt_mutex);
    if (impl_->attempt_token) {
        impl_->attempt_token->request_cancel();
    }
}

void migration_coordinator::shutdown() {
    impl_->closed.store(true);
    cancel();
    impl_->close_token.request_cancel();

    std::map<std::string, std::future<void>> pending;
    {
        std::lock_guard lock(impl_->peer_mutex);
        pending.swap(impl_->peer_validations);
    }
    for (auto& [address, validation] : pending) {
        validation.wait();
    }

    // A cancelled attempt unwinds quickly; neither it nor an async task may outlive us
    std::unique_lock lock(impl_->lifecycle_mutex);
    impl_->lifecycle_cv.wait(lock, [this] {
        return !impl_->in_flight.load() && impl_->async_tasks == 0;
    });
}

auto migration_coordinator::state() const -> migration_state {
    return impl_->current_state.load();
}

auto migration_coordinator::is_migrating() const -> bool {
    return impl_->in_flight.load();
}

auto migration_coordinator::get_statistics() const -> migration_statistics {
    std::lock_guard lock(impl_->stats_mutex);
    return impl_->stats;
}

auto migration_coordinator::config() const -> const migration_config& {
    return impl_->config;
}

void migration_coordinator::on_migration_event(event_callback callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->event_cb = std::move(callback);
}

}  // namespace kcenon::path_migration

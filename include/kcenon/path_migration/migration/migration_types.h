/**
 * @file migration_types.h
 * @brief Migration target, report, events, statistics and configuration
 */

#ifndef KCENON_PATH_MIGRATION_MIGRATION_MIGRATION_TYPES_H
#define KCENON_PATH_MIGRATION_MIGRATION_MIGRATION_TYPES_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "kcenon/path_migration/connection/network_path.h"
#include "kcenon/path_migration/core/connection_id.h"
#include "kcenon/path_migration/core/types.h"

namespace kcenon::path_migration {

/**
 * @brief Where to migrate to
 *
 * At least one of interface_name and local_address must be set. When both
 * are set the address is used and the socket is additionally bound to the
 * interface.
 */
struct migration_target {
    std::string interface_name;
    std::string local_address;
    uint16_t local_port = 0;

    /// New peer address; the current remote is kept when empty
    std::optional<socket_address> remote;

    [[nodiscard]] static auto from_interface(std::string name) -> migration_target {
        migration_target target;
        target.interface_name = std::move(name);
        return target;
    }

    [[nodiscard]] static auto from_address(std::string address, uint16_t port = 0)
        -> migration_target {
        migration_target target;
        target.local_address = std::move(address);
        target.local_port = port;
        return target;
    }

    [[nodiscard]] auto to_string() const -> std::string {
        std::string out = interface_name.empty() ? local_address : interface_name;
        if (!interface_name.empty() && !local_address.empty()) {
            out += "/" + local_address;
        }
        if (local_port != 0) {
            out += ":" + std::to_string(local_port);
        }
        return out;
    }
};

/**
 * @brief Outcome of a successful migration
 */
struct migration_report {
    network_path old_path;
    network_path new_path;

    connection_id active_local_id;
    connection_id active_peer_id;

    /// IDs of the old path, retired after the grace period
    std::vector<connection_id> retiring_ids;

    uint32_t validation_attempts = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::milliseconds path_rtt{0};

    /// Unacknowledged bytes moved to the new path
    uint64_t rescheduled_bytes = 0;
};

/**
 * @brief Coordinator state
 */
enum class migration_state {
    idle,        ///< No migration in progress
    preparing,   ///< Resolving target, allocating IDs, opening the path
    validating,  ///< Waiting for PATH_RESPONSE
    switching,   ///< Activating the new path
    completed,   ///< Last migration succeeded
    failed       ///< Last migration failed
};

[[nodiscard]] constexpr auto to_string(migration_state state) -> const char* {
    switch (state) {
        case migration_state::idle: return "idle";
        case migration_state::preparing: return "preparing";
        case migration_state::validating: return "validating";
        case migration_state::switching: return "switching";
        case migration_state::completed: return "completed";
        case migration_state::failed: return "failed";
        default: return "unknown";
    }
}

/**
 * @brief Migration event types
 */
enum class migration_event {
    migration_started,         ///< migrate_to accepted
    path_opened,               ///< Candidate bound
    path_validated,            ///< Candidate validated
    migration_completed,       ///< Active path switched
    migration_failed,          ///< Attempt abandoned
    peer_address_changed,      ///< Peer seen at a new, validated address
    connection_ids_retired     ///< Grace period ended for old IDs
};

[[nodiscard]] constexpr auto to_string(migration_event event) -> const char* {
    switch (event) {
        case migration_event::migration_started: return "migration_started";
        case migration_event::path_opened: return "path_opened";
        case migration_event::path_validated: return "path_validated";
        case migration_event::migration_completed: return "migration_completed";
        case migration_event::migration_failed: return "migration_failed";
        case migration_event::peer_address_changed: return "peer_address_changed";
        case migration_event::connection_ids_retired: return "connection_ids_retired";
        default: return "unknown";
    }
}

/**
 * @brief Migration event data passed to callbacks
 */
struct migration_event_data {
    /// Event type
    migration_event event;

    /// Previous path (if applicable)
    std::optional<network_path> old_path;

    /// New path (if applicable)
    std::optional<network_path> new_path;

    /// Failure reason (for failure events)
    failure_reason reason = failure_reason::none;

    /// Error message (for failure events)
    std::string error_message;

    /// Event timestamp
    std::chrono::steady_clock::time_point timestamp;

    migration_event_data()
        : event(migration_event::migration_started),
          timestamp(std::chrono::steady_clock::now()) {}

    explicit migration_event_data(migration_event e)
        : event(e), timestamp(std::chrono::steady_clock::now()) {}
};

/**
 * @brief Migration statistics
 */
struct migration_statistics {
    uint64_t total_migrations = 0;           ///< Attempts that passed the in-flight guard
    uint64_t successful_migrations = 0;
    uint64_t failed_migrations = 0;
    uint64_t rejected_in_progress = 0;       ///< Calls refused with migration_in_progress
    uint64_t peer_address_changes = 0;       ///< Validated peer address changes
    uint64_t peer_validations_dropped = 0;   ///< New sources ignored at max_peer_validations
    uint64_t retired_ids = 0;
    std::chrono::milliseconds avg_migration_time{0};
    std::chrono::milliseconds last_migration_time{0};
};

/**
 * @brief Configuration for migration coordination
 */
struct migration_config {
    /// Use a fresh peer-issued ID on the new path (privacy)
    bool require_fresh_peer_id = true;

    /// Old IDs and the old path stay usable this long after a switch
    std::chrono::milliseconds retirement_grace_period{3000};

    /// Validate a new peer source address before recording it
    bool validate_peer_address_change = true;

    /// Peer address validations allowed in flight at once (at least 1)
    std::size_t max_peer_validations = 1;
};

}  // namespace kcenon::path_migration

#endif  // KCENON_PATH_MIGRATION_MIGRATION_MIGRATION_TYPES_H

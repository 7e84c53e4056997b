/**
 * @file migration_coordinator.h
 * @brief Orchestrates an active client migration to a new local path
 *
 * migrate_to() runs one attempt end to end: pick fresh connection IDs,
 * bind the candidate path, validate it with PATH_CHALLENGE and, only after
 * validation succeeds, swap the active path and move unacknowledged data.
 * A failed attempt leaves the active path untouched.
 */

#ifndef KCENON_PATH_MIGRATION_MIGRATION_MIGRATION_COORDINATOR_H
#define KCENON_PATH_MIGRATION_MIGRATION_MIGRATION_COORDINATOR_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>

#include "kcenon/path_migration/connection/connection_id_pool.h"
#include "kcenon/path_migration/connection/path_table.h"
#include "kcenon/path_migration/continuity/transfer_continuity_bridge.h"
#include "kcenon/path_migration/core/types.h"
#include "kcenon/path_migration/migration/migration_types.h"
#include "kcenon/path_migration/transport/interface_resolver.h"
#include "kcenon/path_migration/transport/path_transport.h"
#include "kcenon/path_migration/validation/path_validator.h"

namespace kcenon::path_migration {

/**
 * @brief Collaborators of a coordinator, all owned by the connection
 */
struct migration_components {
    connection_id_pool& pool;
    path_table& paths;
    path_validator& validator;
    transfer_continuity_bridge& bridge;
    path_transport& transport;
    const interface_resolver& resolver;

    /// Sends a control frame on a path with the path's peer ID as destination
    frame_sender sender;
};

/**
 * @brief Connection migration coordinator
 *
 * At most one attempt runs at a time; a concurrent migrate_to() fails fast
 * with migration_in_progress.
 *
 * @code
 * auto report = coordinator.migrate_to(migration_target::from_interface("wlan0"));
 * if (report) {
 *     std::cout << "Now on " << report.value().new_path.to_string() << "\n";
 * } else if (report.error().reason == failure_reason::timeout) {
 *     // still on the old path
 * }
 * @endcode
 */
class migration_coordinator {
public:
    using event_callback = std::function<void(const migration_event_data&)>;
    using clock = std::chrono::steady_clock;

    migration_coordinator(migration_components components, migration_config config = {});
    ~migration_coordinator();

    migration_coordinator(const migration_coordinator&) = delete;
    migration_coordinator& operator=(const migration_coordinator&) = delete;

    /**
     * @brief Migrate the connection to a new local path
     * @return Report of the switch, or migration_in_progress,
     *         no_available_id, migration_failed{reason}, connection_closed
     */
    [[nodiscard]] auto migrate_to(const migration_target& target) -> result<migration_report>;

    /**
     * @brief Run migrate_to on a background thread
     */
    [[nodiscard]] auto migrate_to_async(migration_target target)
        -> std::future<result<migration_report>>;

    /**
     * @brief Check the source of a packet that arrived on a path
     *
     * A packet on the active path from an address other than the recorded
     * peer address starts (once per address) a validation of that address.
     * The recorded address changes only after the validation succeeds. At
     * most max_peer_validations run at once; other new sources are ignored
     * until one finishes.
     *
     * @return unvalidated_peer_path while the source is not validated
     */
    auto accept_inbound(path_id arrival, const socket_address& source) -> result<void>;

    /**
     * @brief Retire expired IDs and close paths whose grace period ended
     * @return Number of IDs retired
     */
    auto tick(clock::time_point now = clock::now()) -> std::size_t;

    /**
     * @brief Flush queued stream data on the active path
     *
     * Serialized with the path switch, so no bytes are recorded on a path
     * the switch has already moved away from.
     */
    auto flush_active() -> result<uint64_t>;

    /**
     * @brief Cancel the in-flight attempt, if any
     */
    void cancel();

    /**
     * @brief Cancel everything and wait for background work
     *
     * Returns only after migrate_to_async tasks and peer address
     * validations have finished. Later migrate_to() calls return connection_closed. Must not be called
     * from a migration event callback.
     */
    void shutdown();

    [[nodiscard]] auto state() const -> migration_state;
    [[nodiscard]] auto is_migrating() const -> bool;
    [[nodiscard]] auto get_statistics() const -> migration_statistics;
    [[nodiscard]] auto config() const -> const migration_config&;

    void on_migration_event(event_callback callback);

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::path_migration

#endif  // KCENON_PATH_MIGRATION_MIGRATION_MIGRATION_COORDINATOR_H

/**
 * @file quic_connection.h
 * @brief A client connection that can move between local paths
 *
 * quic_connection is created once the handshake has produced the initial
 * connection IDs and path. It owns the connection ID pool, the path table,
 * the validator, the continuity bridge and the migration coordinator, and
 * routes every inbound packet to the component that handles its frame.
 */

#ifndef KCENON_PATH_MIGRATION_CONNECTION_QUIC_CONNECTION_H
#define KCENON_PATH_MIGRATION_CONNECTION_QUIC_CONNECTION_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "kcenon/path_migration/connection/connection_config.h"
#include "kcenon/path_migration/connection/connection_id_pool.h"
#include "kcenon/path_migration/connection/path_table.h"
#include "kcenon/path_migration/continuity/transfer_continuity_bridge.h"
#include "kcenon/path_migration/migration/migration_coordinator.h"
#include "kcenon/path_migration/transport/interface_resolver.h"
#include "kcenon/path_migration/transport/path_transport.h"
#include "kcenon/path_migration/validation/path_validator.h"

namespace kcenon::path_migration {

/**
 * @brief What the handshake hands over to the connection
 */
struct handshake_info {
    /// Our connection ID (sequence 0), used by the peer as destination
    std::vector<std::byte> local_cid;

    /// Peer connection ID (sequence 0), used by us as destination
    std::vector<std::byte> peer_cid;

    /// Local binding of the initial path
    local_binding local;

    /// Peer address of the initial path
    socket_address remote;
};

/**
 * @brief Connection statistics
 */
struct connection_statistics {
    uint64_t packets_received = 0;
    uint64_t packets_sent = 0;
    uint64_t dropped_unknown_cid = 0;
    uint64_t dropped_retired_cid = 0;
    uint64_t packets_from_unvalidated_source = 0;
    uint64_t acks_sent = 0;
};

/**
 * @brief Migrating client connection
 *
 * @code
 * handshake_info hs{local_cid, peer_cid, local_binding{"eth0"}, {"203.0.113.7", 4433}};
 * auto conn = quic_connection::create(udp_path_transport::create(), hs);
 * if (conn) {
 *     auto& c = *conn.value();
 *     c.write(0, file_bytes, true);
 *     c.flush();
 *     auto report = c.migrate_to(migration_target::from_interface("wlan0"));
 * }
 * @endcode
 */
class quic_connection {
public:
    using clock = std::chrono::steady_clock;

    /**
     * @brief Create a connection on top of a transport
     * @param transport Datagram transport, shared with the caller
     * @param handshake Initial IDs and path
     * @param config Connection configuration
     * @param resolver Interface resolver (system resolver when null)
     */
    [[nodiscard]] static auto create(std::shared_ptr<path_transport> transport,
                                     handshake_info handshake,
                                     const connection_config& config = {},
                                     std::shared_ptr<const interface_resolver> resolver = nullptr)
        -> result<std::unique_ptr<quic_connection>>;

    ~quic_connection();

    // Non-copyable
    quic_connection(const quic_connection&) = delete;
    auto operator=(const quic_connection&) -> quic_connection& = delete;

    // ========================================================================
    // Migration
    // ========================================================================

    /**
     * @brief Migrate to a new local path (blocking)
     */
    [[nodiscard]] auto migrate_to(const migration_target& target) -> result<migration_report>;

    [[nodiscard]] auto migrate_to_async(migration_target target)
        -> std::future<result<migration_report>>;

    void on_migration_event(migration_coordinator::event_callback callback);

    // ========================================================================
    // Data
    // ========================================================================

    /**
     * @brief Queue bytes on a stream
     * @return Stream offset of the first byte
     */
    auto write(stream_id stream, std::span<const std::byte> data, bool fin = false)
        -> result<uint64_t>;

    /**
     * @brief Send queued bytes on the active path
     * @return Bytes sent
     */
    auto flush() -> result<uint64_t>;

    /**
     * @brief Install the in-order receive handler
     */
    void on_stream_data(delivery_handler handler);

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Drive retirements and the idle timeout
     * @return connection_closed once the connection is closed
     */
    auto tick(clock::time_point now = clock::now()) -> result<void>;

    /**
     * @brief Cancel validations, close every path
     */
    void close();

    [[nodiscard]] auto is_open() const -> bool;

    // ========================================================================
    // Inspection
    // ========================================================================

    [[nodiscard]] auto active_path() const -> result<network_path>;
    [[nodiscard]] auto id_pool() const -> const connection_id_pool&;
    [[nodiscard]] auto paths() const -> const path_table&;
    [[nodiscard]] auto validator() const -> const path_validator&;
    [[nodiscard]] auto bridge() const -> const transfer_continuity_bridge&;
    [[nodiscard]] auto coordinator() -> migration_coordinator&;
    [[nodiscard]] auto get_statistics() const -> connection_statistics;
    [[nodiscard]] auto config() const -> const connection_config&;

    /**
     * @brief Hex form of the handshake connection ID, used in logs
     */
    [[nodiscard]] auto log_id() const -> const std::string&;

private:
    quic_connection();

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::path_migration

#endif  // KCENON_PATH_MIGRATION_CONNECTION_QUIC_CONNECTION_H

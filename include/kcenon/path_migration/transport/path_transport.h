/**
 * @file path_transport.h
 * @brief Transport adapter interface used by the migration layer
 *
 * The migration layer never touches sockets directly. Everything it needs
 * from the datagram layer (bind a local path, send on a path, receive
 * decoded packets tagged with their arrival path) goes through this
 * interface so that UDP, an in-memory loopback or a full QUIC stack can sit
 * underneath.
 */

#ifndef KCENON_PATH_MIGRATION_TRANSPORT_PATH_TRANSPORT_H
#define KCENON_PATH_MIGRATION_TRANSPORT_PATH_TRANSPORT_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "kcenon/path_migration/connection/network_path.h"
#include "kcenon/path_migration/core/types.h"
#include "kcenon/path_migration/transport/path_frames.h"

namespace kcenon::path_migration {

/**
 * @brief Local side of a path to bind
 */
struct local_binding {
    /// Interface to bind to (SO_BINDTODEVICE where supported), may be empty
    std::string interface_name;

    /// Local address, "0.0.0.0" binds any
    std::string address = "0.0.0.0";

    /// Local port, 0 picks an ephemeral port
    uint16_t port = 0;
};

/**
 * @brief Decoded packet tagged with its arrival path
 */
struct inbound_packet {
    path_id path;
    socket_address source;
    std::vector<std::byte> destination_cid;
    path_frame frame;
    std::chrono::steady_clock::time_point received_at;
};

/**
 * @brief Transport statistics
 */
struct path_transport_statistics {
    uint64_t bytes_sent = 0;
    uint64_t bytes_received = 0;
    uint64_t packets_sent = 0;
    uint64_t packets_received = 0;
    uint64_t malformed_packets = 0;
    uint64_t errors = 0;
};

/**
 * @brief Datagram transport with one binding per path
 *
 * Implementations may deliver packets from several threads; handlers must
 * be thread safe.
 */
class path_transport {
public:
    using packet_handler = std::function<void(const inbound_packet&)>;

    path_transport() = default;
    virtual ~path_transport() = default;

    // Non-copyable
    path_transport(const path_transport&) = delete;
    auto operator=(const path_transport&) -> path_transport& = delete;

    /**
     * @brief Get the transport type identifier (e.g., "udp", "loopback")
     */
    [[nodiscard]] virtual auto type() const -> std::string_view = 0;

    /**
     * @brief Bind a local endpoint for a path
     * @param id Path the binding belongs to
     * @param local Local interface/address/port
     * @param remote Peer address the path will send to
     * @return The actually bound local address or path_open_failed
     */
    [[nodiscard]] virtual auto open_path(path_id id,
                                         const local_binding& local,
                                         const socket_address& remote)
        -> result<socket_address> = 0;

    /**
     * @brief Send a datagram to path.remote from the binding of path.id
     * @return Bytes sent, or send_failed / unknown_path
     */
    [[nodiscard]] virtual auto send_on_path(const network_path& path,
                                            std::span<const std::byte> data)
        -> result<std::size_t> = 0;

    /**
     * @brief Release the binding of a path
     */
    virtual auto close_path(path_id id) -> result<void> = 0;

    /**
     * @brief Install the inbound packet handler
     */
    virtual void on_packet(packet_handler handler) = 0;

    [[nodiscard]] virtual auto is_open(path_id id) const -> bool = 0;

    [[nodiscard]] virtual auto get_statistics() const -> path_transport_statistics = 0;
};

}  // namespace kcenon::path_migration

#endif  // KCENON_PATH_MIGRATION_TRANSPORT_PATH_TRANSPORT_H

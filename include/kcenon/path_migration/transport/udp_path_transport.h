/**
 * @file udp_path_transport.h
 * @brief Boost.Asio UDP implementation of path_transport
 */

#ifndef KCENON_PATH_MIGRATION_TRANSPORT_UDP_PATH_TRANSPORT_H
#define KCENON_PATH_MIGRATION_TRANSPORT_UDP_PATH_TRANSPORT_H

#include <cstddef>
#include <memory>

#include "kcenon/path_migration/transport/path_transport.h"

namespace kcenon::path_migration {

/**
 * @brief UDP transport configuration
 */
struct udp_transport_config {
    /// Receive buffer per datagram
    std::size_t receive_buffer_size = 65536;

    /// Bind sockets to the named interface with SO_BINDTODEVICE
    bool bind_to_device = true;
};

/**
 * @brief One UDP socket per path, all driven by one io_context thread
 *
 * Sockets are shared-owned, so a send racing close_path() either completes
 * on the path's own socket or fails with unknown_path.
 *
 * @code
 * auto transport = udp_path_transport::create();
 * transport->on_packet([](const inbound_packet& packet) { ... });
 * auto bound = transport->open_path(path_id{0}, local_binding{}, {"192.0.2.1", 4433});
 * @endcode
 */
class udp_path_transport : public path_transport {
public:
    [[nodiscard]] static auto create(const udp_transport_config& config = {})
        -> std::unique_ptr<udp_path_transport>;

    ~udp_path_transport() override;

    [[nodiscard]] auto type() const -> std::string_view override;

    [[nodiscard]] auto open_path(path_id id,
                                 const local_binding& local,
                                 const socket_address& remote)
        -> result<socket_address> override;

    [[nodiscard]] auto send_on_path(const network_path& path,
                                    std::span<const std::byte> data)
        -> result<std::size_t> override;

    auto close_path(path_id id) -> result<void> override;

    void on_packet(packet_handler handler) override;

    [[nodiscard]] auto is_open(path_id id) const -> bool override;

    [[nodiscard]] auto get_statistics() const -> path_transport_statistics override;

    /**
     * @brief Close every socket and stop the io thread
     *
     * Later open_path() calls fail with path_open_failed.
     */
    void shutdown();

private:
    explicit udp_path_transport(const udp_transport_config& config);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::path_migration

#endif  // KCENON_PATH_MIGRATION_TRANSPORT_UDP_PATH_TRANSPORT_H

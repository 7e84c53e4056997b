/**
 * @file udp_path_transport.cpp
 * @brief Boost.Asio UDP path transport
 */

#include "kcenon/path_migration/transport/udp_path_transport.h"
#include "kcenon/path_migration/core/logging.h"

#include <atomic>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>

#include <boost/asio.hpp>

#include <sys/socket.h>

namespace kcenon::path_migration {

namespace asio = boost::asio;
using udp = asio::ip::udp;

namespace {

auto to_socket_address(const udp::endpoint& endpoint) -> socket_address {
    return socket_address{endpoint.address().to_string(), endpoint.port()};
}

}  // namespace

struct udp_path_transport::impl {
    /**
     * @brief Socket of one path
     *
     * mutex serializes every call on the socket object; completion handlers
     * hold a shared_ptr so the object outlives its pending receive.
     */
    struct path_socket {
        path_socket(asio::io_context& io, path_id id, std::size_t buffer_size)
            : socket(io), path(id), buffer(buffer_size) {}

        std::mutex mutex;
        udp::socket socket;
        path_id path;
        socket_address local;
        std::vector<std::byte> buffer;
        udp::endpoint source;
    };

    udp_transport_config config;

    asio::io_context io;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work;
    std::thread io_thread;
    std::atomic<bool> stopped{false};

    mutable std::mutex sockets_mutex;
    std::unordered_map<path_id, std::shared_ptr<path_socket>> sockets;

    std::mutex handler_mutex;
    packet_handler handler;

    mutable std::mutex stats_mutex;
    path_transport_statistics stats;

    explicit impl(const udp_transport_config& cfg) : config(cfg) {
        work.emplace(asio::make_work_guard(io));
        io_thread = std::thread([this] { io.run(); });
    }

    ~impl() {
        stop();
    }

    void stop() {
        if (stopped.exchange(true)) {
            return;
        }

        std::unordered_map<path_id, std::shared_ptr<path_socket>> remaining;
        {
            std::lock_guard lock(sockets_mutex);
            remaining.swap(sockets);
        }
        for (auto& [id, entry] : remaining) {
            close_socket(*entry);
        }

        work.reset();
        io.stop();
        if (io_thread.joinable() && io_thread.get_id() != std::this_thread::get_id()) {
            io_thread.join();
        }
    }

    void close_socket(path_socket& entry) {
        std::lock_guard lock(entry.mutex);
        boost::system::error_code ec;
        entry.socket.close(ec);
        if (ec) {
            PM_LOG_DEBUG(log_category::transport,
                "Closing path #" + std::to_string(entry.path.value) + ": " + ec.message());
        }
    }

    auto resolve(const socket_address& address, error_code code) -> result<udp::endpoint> {
        if (address.host.empty() || address.host == "0.0.0.0") {
            return udp::endpoint(asio::ip::address_v4::any(), address.port);
        }

        boost::system::error_code ec;
        auto parsed = asio::ip::make_address_v4(address.host, ec);
        if (!ec) {
            return udp::endpoint(parsed, address.port);
        }

        udp::resolver resolver(io);
        auto results = resolver.resolve(udp::v4(), address.host, std::to_string(address.port), ec);
        if (ec || results.empty()) {
            return unexpected(error(code,
                "Cannot resolve " + address.host + ": " +
                (ec ? ec.message() : std::string("no IPv4 address"))));
        }
        return results.begin()->endpoint();
    }

    /**
     * @brief Arm the next receive; caller holds entry->mutex
     */
    void start_receive(const std::shared_ptr<path_socket>& entry) {
        if (!entry->socket.is_open()) {
            return;
        }
        entry->socket.async_receive_from(
            asio::buffer(entry->buffer.data(), entry->buffer.size()),
            entry->source,
            [this, entry](const boost::system::error_code& ec, std::size_t received) {
                if (ec == asio::error::operation_aborted) {
                    return;
                }
                if (ec) {
                    std::lock_guard lock(stats_mutex);
                    stats.errors++;
                } else {
                    handle_datagram(*entry, received);
                }

                std::lock_guard lock(entry->mutex);
                start_receive(entry);
            });
    }

    void handle_datagram(const path_socket& entry, std::size_t received) {
        {
            std::lock_guard lock(stats_mutex);
            stats.packets_received++;
            stats.bytes_received += received;
        }

        auto decoded = decode_packet(std::span<const std::byte>(entry.buffer.data(), received));
        if (!decoded) {
            {
                std::lock_guard lock(stats_mutex);
                stats.malformed_packets++;
            }
            PM_LOG_DEBUG(log_category::transport,
                "Dropping malformed datagram on path #" + std::to_string(entry.path.value) +
                ": " + decoded.error().message);
            return;
        }

        inbound_packet packet;
        packet.path = entry.path;
        packet.source = to_socket_address(entry.source);
        packet.destination_cid = std::move(decoded.value().destination_cid);
        packet.frame = std::move(decoded.value().frame);
        packet.received_at = std::chrono::steady_clock::now();

        packet_handler current;
        {
            std::lock_guard lock(handler_mutex);
            current = handler;
        }
        if (current) {
            current(packet);
        }
    }

    auto find(path_id id) const -> std::shared_ptr<path_socket> {
        std::lock_guard lock(sockets_mutex);
        auto it = sockets.find(id);
        return it == sockets.end() ? nullptr : it->second;
    }
};

udp_path_transport::udp_path_transport(const udp_transport_config& config)
    : impl_(std::make_unique<impl>(config)) {}

udp_path_transport::~udp_path_transport() = default;

auto udp_path_transport::create(const udp_transport_config& config)
    -> std::unique_ptr<udp_path_transport> {
    return std::unique_ptr<udp_path_transport>(new udp_path_transport(config));
}

auto udp_path_transport::type() const -> std::string_view {
    return "udp";
}

auto udp_path_transport::open_path(path_id id,
                                   const local_binding& local,
                                   const socket_address& remote)
    -> result<socket_address> {
    if (impl_->stopped.load()) {
        return unexpected(error(error_code::path_open_failed, "Transport is shut down"));
    }
    if (impl_->find(id)) {
        return unexpected(error(error_code::path_open_failed,
            "Path #" + std::to_string(id.value) + " is already open"));
    }

    auto bind_endpoint = impl_->resolve(socket_address{local.address, local.port},
                                        error_code::path_open_failed);
    if (!bind_endpoint) {
        return unexpected(bind_endpoint.error());
    }
    auto remote_endpoint = impl_->resolve(remote, error_code::path_open_failed);
    if (!remote_endpoint) {
        return unexpected(remote_endpoint.error());
    }

    auto entry = std::make_shared<impl::path_socket>(
        impl_->io, id, impl_->config.receive_buffer_size);

    boost::system::error_code ec;
    entry->socket.open(udp::v4(), ec);
    if (ec) {
        return unexpected(error(error_code::path_open_failed, "socket open failed: " + ec.message()));
    }

#ifdef SO_BINDTODEVICE
    if (impl_->config.bind_to_device && !local.interface_name.empty()) {
        if (::setsockopt(entry->socket.native_handle(), SOL_SOCKET, SO_BINDTODEVICE,
                         local.interface_name.c_str(),
                         static_cast<socklen_t>(local.interface_name.size())) != 0) {
            // Needs CAP_NET_RAW; the address bind below still pins the source
            PM_LOG_WARN(log_category::transport,
                "SO_BINDTODEVICE " + local.interface_name + " failed");
        }
    }
#endif

    entry->socket.bind(bind_endpoint.value(), ec);
    if (ec) {
        return unexpected(error(error_code::path_open_failed,
            "bind " + local.address + ":" + std::to_string(local.port) +
            " failed: " + ec.message()));
    }

    auto bound = entry->socket.local_endpoint(ec);
    if (ec) {
        return unexpected(error(error_code::path_open_failed,
            "local_endpoint failed: " + ec.message()));
    }
    entry->local = to_socket_address(bound);

    {
        std::lock_guard lock(impl_->sockets_mutex);
        if (!impl_->sockets.emplace(id, entry).second) {
            return unexpected(error(error_code::path_open_failed,
                "Path #" + std::to_string(id.value) + " is already open"));
        }
    }
    {
        std::lock_guard lock(entry->mutex);
        impl_->start_receive(entry);
    }

    path_log_context ctx;
    ctx.path_id = id.value;
    ctx.local_address = entry->local.to_string();
    ctx.remote_address = remote.to_string();
    ctx.interface_name = local.interface_name;
    PM_LOG_DEBUG_CTX(log_category::transport, "Opened UDP path", ctx);

    return entry->local;
}

auto udp_path_transport::send_on_path(const network_path& path,
                                      std::span<const std::byte> data)
    -> result<std::size_t> {
    auto entry = impl_->find(path.id);
    if (!entry) {
        return unexpected(error(error_code::unknown_path,
            "Path #" + std::to_string(path.id.value) + " is not open"));
    }

    auto destination = impl_->resolve(path.remote, error_code::send_failed);
    if (!destination) {
        return unexpected(destination.error());
    }

    boost::system::error_code ec;
    std::size_t sent = 0;
    {
        std::lock_guard lock(entry->mutex);
        if (!entry->socket.is_open()) {
            return unexpected(error(error_code::unknown_path,
                "Path #" + std::to_string(path.id.value) + " was closed"));
        }
        sent = entry->socket.send_to(asio::buffer(data.data(), data.size()),
                                     destination.value(), 0, ec);
    }

    if (ec) {
        {
            std::lock_guard lock(impl_->stats_mutex);
            impl_->stats.errors++;
        }
        return unexpected(error(error_code::send_failed,
            "send_to " + path.remote.to_string() + " failed: " + ec.message()));
    }

    std::lock_guard lock(impl_->stats_mutex);
    impl_->stats.packets_sent++;
    impl_->stats.bytes_sent += sent;
    return sent;
}

auto udp_path_transport::close_path(path_id id) -> result<void> {
    std::shared_ptr<impl::path_socket> entry;
    {
        std::lock_guard lock(impl_->sockets_mutex);
        auto it = impl_->sockets.find(id);
        if (it == impl_->sockets.end()) {
            return unexpected(error(error_code::unknown_path,
                "Path #" + std::to_string(id.value) + " is not open"));
        }
        entry = std::move(it->second);
        impl_->sockets.erase(it);
    }

    impl_->close_socket(*entry);
    PM_LOG_DEBUG(log_category::transport, "Closed UDP path #" + std::to_string(id.value));
    return {};
}

void udp_path_transport::on_packet(packet_handler handler) {
    std::lock_guard lock(impl_->handler_mutex);
    impl_->handler = std::move(handler);
}

auto udp_path_transport::is_open(path_id id) const -> bool {
    return impl_->find(id) != nullptr;
}

auto udp_path_transport::get_statistics() const -> path_transport_statistics {
    std::lock_guard lock(impl_->stats_mutex);
    return impl_->stats;
}

void udp_path_transport::shutdown() {
    impl_->stop();
}

}  // namespace kcenon::path_migration

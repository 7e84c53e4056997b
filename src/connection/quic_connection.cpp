/**
 * @file quic_connection.cpp
 * @brief Migrating connection implementation
 */

#include "kcenon/path_migration/connection/quic_connection.h"
#include "kcenon/path_migration/core/logging.h"

#include <atomic>
#include <mutex>
#include <shared_mutex>
#include <variant>

namespace kcenon::path_migration {

namespace {

/**
 * @brief Lets close() cut off packet dispatch from transport threads
 */
template <typename Target>
struct dispatch_gate {
    std::shared_mutex mutex;
    Target* target = nullptr;
};

}  // namespace

struct quic_connection::impl {
    connection_config config;
    std::string log_id;

    std::shared_ptr<path_transport> transport;
    std::shared_ptr<const interface_resolver> resolver;

    connection_id_pool pool;
    path_table paths;
    path_validator validator;
    transfer_continuity_bridge bridge;
    std::unique_ptr<migration_coordinator> coordinator;

    std::shared_ptr<dispatch_gate<impl>> gate;
    std::atomic<bool> closed{false};
    std::atomic<clock::rep> last_activity{0};

    mutable std::mutex stats_mutex;
    connection_statistics stats;

    impl(std::shared_ptr<path_transport> t,
         std::shared_ptr<const interface_resolver> r,
         const connection_config& cfg)
        : config(cfg),
          transport(std::move(t)),
          resolver(std::move(r)),
          pool(cfg.pool),
          validator([this](const network_path& path, const path_frame& frame) {
              return send_frame(path, frame);
          }, cfg.validation),
          bridge([this](const network_path& path, const stream_frame& frame) {
              return send_frame(path, path_frame{frame});
          }, cfg.continuity),
          gate(std::make_shared<dispatch_gate<impl>>()) {
        coordinator = std::make_unique<migration_coordinator>(
            migration_components{
                pool, paths, validator, bridge, *transport, *resolver,
                [this](const network_path& path, const path_frame& frame) {
                    return send_frame(path, frame);
                }},
            cfg.migration);
    }

    auto context() const -> path_log_context {
        path_log_context ctx;
        ctx.connection_id = log_id;
        return ctx;
    }

    void touch(clock::time_point now) {
        last_activity.store(now.time_since_epoch().count());
    }

    auto send_frame(const network_path& path, const path_frame& frame) -> result<void> {
        auto dcid = pool.active_for(path.id, id_issuer::peer);
        if (!dcid) {
            return unexpected(dcid.error());
        }

        auto packet = encode_packet(dcid.value().bytes, frame);
        auto sent = transport->send_on_path(path, packet);
        if (!sent) {
            return unexpected(sent.error());
        }

        std::lock_guard lock(stats_mutex);
        stats.packets_sent++;
        return {};
    }

    auto start(const handshake_info& handshake) -> result<void> {
        log_id = to_hex(handshake.local_cid);

        auto local = pool.add_handshake_local(handshake.local_cid);
        if (!local) {
            return unexpected(local.error());
        }
        auto peer = pool.register_peer(handshake.peer_cid, 0);
        if (!peer) {
            return unexpected(peer.error());
        }

        auto path = paths.add(socket_address{handshake.local.address, handshake.local.port},
                              handshake.remote, handshake.local.interface_name);

        gate->target = this;
        transport->on_packet([gate = gate](const inbound_packet& packet) {
            std::shared_lock lock(gate->mutex);
            if (gate->target) {
                gate->target->handle(packet);
            }
        });

        auto bound = transport->open_path(path.id, handshake.local, handshake.remote);
        if (!bound) {
            return unexpected(error(error_code::path_open_failed, bound.error().message));
        }

        // The handshake already proved the initial path
        auto step = paths.set_local(path.id, bound.value());
        if (step) step = paths.set_state(path.id, path_state::validated);
        if (!step) {
            return step;
        }
        auto activated = paths.activate(path.id);
        if (!activated) {
            return unexpected(activated.error());
        }
        step = pool.set_active(path.id, id_issuer::local, local.value().sequence);
        if (step) step = pool.set_active(path.id, id_issuer::peer, peer.value().sequence);
        if (!step) {
            return step;
        }

        touch(clock::now());

        auto active = paths.active();
        for (std::size_t i = 0; i < config.initial_advertised_ids && active; ++i) {
            auto spare = pool.allocate_local();
            if (!spare) {
                return unexpected(spare.error());
            }
            new_connection_id_frame announce;
            announce.sequence = spare.value().sequence;
            announce.connection_id = spare.value().bytes;
            auto sent = send_frame(active.value(), announce);
            if (sent) {
                step = pool.mark_advertised(spare.value().sequence);
                if (!step) {
                    return step;
                }
            } else {
                PM_LOG_WARN(log_category::connection,
                    "NEW_CONNECTION_ID not sent: " + sent.error().message);
            }
        }

        auto ctx = context();
        ctx.path_id = path.id.value;
        ctx.local_address = bound.value().to_string();
        ctx.remote_address = handshake.remote.to_string();
        ctx.interface_name = handshake.local.interface_name;
        PM_LOG_INFO_CTX(log_category::connection, "Connection established", ctx);
        return {};
    }

    // ========================================================================
    // Inbound dispatch
    // ========================================================================

    void handle(const inbound_packet& packet) {
        if (closed.load()) {
            return;
        }
        touch(packet.received_at);

        {
            std::lock_guard lock(stats_mutex);
            stats.packets_received++;
        }

        auto local = pool.find_local(packet.destination_cid);
        if (!local) {
            {
                std::lock_guard lock(stats_mutex);
                if (local.error().code == error_code::retired_id) {
                    stats.dropped_retired_cid++;
                } else {
                    stats.dropped_unknown_cid++;
                }
            }
            PM_LOG_DEBUG(log_category::connection,
                "Dropping packet from " + packet.source.to_string() + ": " +
                local.error().message);
            return;
        }

        auto accepted = coordinator->accept_inbound(packet.path, packet.source);
        if (!accepted) {
            std::lock_guard lock(stats_mutex);
            stats.packets_from_unvalidated_source++;
        }

        auto arrival = paths.get(packet.path);
        if (!arrival) {
            PM_LOG_DEBUG(log_category::connection,
                "Packet on unknown path #" + std::to_string(packet.path.value));
            return;
        }

        std::visit([&](const auto& frame) {
            dispatch(arrival.value(), packet, frame);
        }, packet.frame);
    }

    void dispatch(const network_path& arrival, const inbound_packet& packet,
                  const path_challenge_frame& frame) {
        auto answered = validator.on_path_challenge(arrival, packet.source, frame.token);
        if (!answered) {
            PM_LOG_WARN(log_category::connection,
                "PATH_RESPONSE not sent: " + answered.error().message);
        }
    }

    void dispatch(const network_path&, const inbound_packet& packet,
                  const path_response_frame& frame) {
        validator.on_path_response(packet.path, packet.source, frame.token);
    }

    void dispatch(const network_path&, const inbound_packet&,
                  const new_connection_id_frame& frame) {
        auto retired = pool.register_peer(frame.connection_id, frame.sequence,
                                          frame.retire_prior_to);
        if (!retired) {
            PM_LOG_DEBUG(log_category::connection,
                "NEW_CONNECTION_ID #" + std::to_string(frame.sequence) +
                " ignored: " + retired.error().message);
            return;
        }

        auto active = paths.active();
        if (!active) {
            return;
        }

        // retire_prior_to may have taken the ID we were sending with
        if (!pool.active_for(active.value().id, id_issuer::peer)) {
            auto replacement = pool.claim_peer();
            if (!replacement) {
                PM_LOG_WARN(log_category::connection,
                    "Active path lost its peer connection ID: " + replacement.error().message);
                return;
            }
            auto bound = pool.set_active(active.value().id, id_issuer::peer,
                                         replacement.value().sequence);
            if (!bound) {
                PM_LOG_WARN(log_category::connection, bound.error().message);
                return;
            }
        }

        for (auto sequence : retired.value()) {
            auto sent = send_frame(active.value(), retire_connection_id_frame{sequence});
            if (!sent) {
                PM_LOG_WARN(log_category::connection,
                    "RETIRE_CONNECTION_ID #" + std::to_string(sequence) +
                    " not sent: " + sent.error().message);
            }
        }
    }

    void dispatch(const network_path&, const inbound_packet&,
                  const retire_connection_id_frame& frame) {
        auto retired = pool.retire(id_issuer::local, frame.sequence);
        if (!retired) {
            PM_LOG_DEBUG(log_category::connection,
                "RETIRE_CONNECTION_ID #" + std::to_string(frame.sequence) +
                " ignored: " + retired.error().message);
        }
    }

    void dispatch(const network_path& arrival, const inbound_packet&,
                  const stream_frame& frame) {
        auto received = bridge.on_stream_frame(frame.stream, frame.offset, frame.data, frame.fin);
        if (!received) {
            PM_LOG_WARN(log_category::connection,
                "STREAM frame rejected: " + received.error().message);
            return;
        }
        if (frame.data.empty()) {
            return;
        }

        ack_frame ack;
        ack.stream = frame.stream;
        ack.offset = frame.offset;
        ack.length = frame.data.size();
        auto sent = send_frame(arrival, ack);
        if (!sent) {
            PM_LOG_DEBUG(log_category::connection, "ACK not sent: " + sent.error().message);
            return;
        }
        std::lock_guard lock(stats_mutex);
        stats.acks_sent++;
    }

    void dispatch(const network_path&, const inbound_packet&, const ack_frame& frame) {
        auto acked = bridge.on_ack(frame.stream, byte_range{frame.offset, frame.length});
        if (!acked) {
            PM_LOG_DEBUG(log_category::connection, "ACK ignored: " + acked.error().message);
        }
    }

    void close() {
        if (closed.exchange(true)) {
            return;
        }

        coordinator->shutdown();
        validator.cancel_all();

        {
            std::unique_lock lock(gate->mutex);
            gate->target = nullptr;
        }

        for (const auto& path : paths.paths()) {
            if (transport->is_open(path.id)) {
                auto closed_path = transport->close_path(path.id);
                if (!closed_path) {
                    PM_LOG_WARN(log_category::connection, closed_path.error().message);
                }
            }
        }

        auto ctx = context();
        PM_LOG_INFO_CTX(log_category::connection, "Connection closed", ctx);
    }
};

quic_connection::quic_connection() = default;

quic_connection::~quic_connection() {
    if (impl_) {
        impl_->close();
    }
}

auto quic_connection::create(std::shared_ptr<path_transport> transport,
                             handshake_info handshake,
                             const connection_config& config,
                             std::shared_ptr<const interface_resolver> resolver)
    -> result<std::unique_ptr<quic_connection>> {
    auto valid = config.validate();
    if (!valid) {
        return unexpected(valid.error());
    }
    if (!transport) {
        return unexpected(error(error_code::invalid_configuration, "Transport is required"));
    }
    if (!resolver) {
        resolver = system_interface_resolver::create();
    }

    get_logger().initialize();

    std::unique_ptr<quic_connection> connection(new quic_connection());
    connection->impl_ = std::make_unique<impl>(std::move(transport), std::move(resolver), config);

    auto started = connection->impl_->start(handshake);
    if (!started) {
        connection->impl_->close();
        return unexpected(started.error());
    }
    return std::move(connection);
}

auto quic_connection::migrate_to(const migration_target& target) -> result<migration_report> {
    if (impl_->closed.load()) {
        return unexpected(error(error_code::connection_closed, "Connection is closed"));
    }
    return impl_->coordinator->migrate_to(target);
}

auto quic_connection::migrate_to_async(migration_target target)
    -> std::future<result<migration_report>> {
    return impl_->coordinator->migrate_to_async(std::move(target));
}

void quic_connection::on_migration_event(migration_coordinator::event_callback callback) {
    impl_->coordinator->on_migration_event(std::move(callback));
}

auto quic_connection::write(stream_id stream, std::span<const std::byte> data, bool fin)
    -> result<uint64_t> {
    if (impl_->closed.load()) {
        return unexpected(error(error_code::connection_closed, "Connection is closed"));
    }
    return impl_->bridge.write(stream, data, fin);
}

auto quic_connection::flush() -> result<uint64_t> {
    if (impl_->closed.load()) {
        return unexpected(error(error_code::connection_closed, "Connection is closed"));
    }
    return impl_->coordinator->flush_active();
}

void quic_connection::on_stream_data(delivery_handler handler) {
    impl_->bridge.on_delivery(std::move(handler));
}

auto quic_connection::tick(clock::time_point now) -> result<void> {
    if (impl_->closed.load()) {
        return unexpected(error(error_code::connection_closed, "Connection is closed"));
    }

    impl_->coordinator->tick(now);

    auto last = clock::time_point(clock::duration(impl_->last_activity.load()));
    if (now - last > impl_->config.idle_timeout) {
        auto ctx = impl_->context();
        ctx.duration_ms = static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(now - last).count());
        PM_LOG_INFO_CTX(log_category::connection, "Idle timeout reached", ctx);
        impl_->close();
        return unexpected(error(error_code::connection_closed, "Idle timeout"));
    }
    return {};
}

void quic_connection::close() {
    impl_->close();
}

auto quic_connection::is_open() const -> bool {
    return !impl_->closed.load();
}

auto quic_connection::active_path() const -> result<network_path> {
    return impl_->paths.active();
}

auto quic_connection::id_pool() const -> const connection_id_pool& {
    return impl_->pool;
}

auto quic_connection::paths() const -> const path_table& {
    return impl_->paths;
}

auto quic_connection::validator() const -> const path_validator& {
    return impl_->validator;
}

auto quic_connection::bridge() const -> const transfer_continuity_bridge& {
    return impl_->bridge;
}

auto quic_connection::coordinator() -> migration_coordinator& {
    return *impl_->coordinator;
}

auto quic_connection::get_statistics() const -> connection_statistics {
    std::lock_guard lock(impl_->stats_mutex);
    return impl_->stats;
}

auto quic_connection::config() const -> const connection_config& {
    return impl_->config;
}

auto quic_connection::log_id() const -> const std::string& {
    return impl_->log_id;
}

}  // namespace kcenon::path_migration

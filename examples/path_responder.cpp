/**
 * @file path_responder.cpp
 * @brief Minimal peer for migrate_client
 *
 * This example demonstrates how to:
 * - Receive decoded packets from the UDP path transport
 * - Answer PATH_CHALLENGE from whatever address the client uses
 * - Reassemble stream data with the continuity bridge and acknowledge it
 * - Issue spare connection IDs so the client can migrate with fresh ones
 */

#include <kcenon/path_migration/path_migration.h>

#include <atomic>
#include <csignal>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using namespace kcenon::path_migration;

namespace {

std::atomic<bool> g_running{true};

void signal_handler(int) {
    g_running = false;
}

std::vector<std::byte> pre_shared_cid(uint8_t seed) {
    std::vector<std::byte> cid(8);
    for (std::size_t i = 0; i < cid.size(); ++i) {
        cid[i] = static_cast<std::byte>(seed + i);
    }
    return cid;
}

/**
 * @brief Server side state for one client
 */
class responder {
public:
    explicit responder(path_transport& transport)
        : transport_(transport),
          client_cid_(pre_shared_cid(0xA0)),
          reassembly_([](const network_path&, const stream_frame&) -> result<void> {
              return {};
          }) {
        reassembly_.on_delivery([this](stream_id stream, uint64_t offset,
                                       std::span<const std::byte> data, bool fin) {
            received_ += data.size();
            if (fin) {
                std::cout << "Stream " << stream << " finished at "
                          << offset + data.size() << " bytes" << std::endl;
            }
        });
    }

    void handle(const inbound_packet& packet) {
        std::lock_guard lock(mutex_);
        network_path reply;
        reply.id = packet.path;
        reply.remote = packet.source;

        if (!ids_issued_) {
            issue_ids(reply);
        }

        std::visit([&](const auto& frame) { on_frame(reply, frame); }, packet.frame);
    }

private:
    void send(const network_path& path, const path_frame& frame) {
        auto packet = encode_packet(client_cid_, frame);
        auto sent = transport_.send_on_path(path, packet);
        if (!sent) {
            std::cerr << "Send to " << path.remote.to_string() << " failed: "
                      << sent.error().message << std::endl;
        }
    }

    void issue_ids(const network_path& path) {
        for (uint64_t seq = 1; seq <= 3; ++seq) {
            new_connection_id_frame frame;
            frame.sequence = seq;
            frame.connection_id = pre_shared_cid(static_cast<uint8_t>(0xB0 + seq * 0x10));
            send(path, frame);
        }
        ids_issued_ = true;
    }

    void on_frame(const network_path& path, const path_challenge_frame& frame) {
        std::cout << "PATH_CHALLENGE from " << path.remote.to_string() << std::endl;
        send(path, path_response_frame{frame.token});
    }

    void on_frame(const network_path& path, const stream_frame& frame) {
        auto received = reassembly_.on_stream_frame(frame.stream, frame.offset, frame.data,
                                                    frame.fin);
        if (!received) {
            std::cerr << "Bad STREAM frame: " << received.error().message << std::endl;
            return;
        }
        if (!frame.data.empty()) {
            send(path, ack_frame{frame.stream, frame.offset, frame.data.size()});
        }
    }

    void on_frame(const network_path&, const new_connection_id_frame& frame) {
        // Address the client with the ID it announced last
        client_cid_ = frame.connection_id;
        std::cout << "Client announced connection ID #" << frame.sequence << std::endl;
    }

    void on_frame(const network_path&, const retire_connection_id_frame& frame) {
        std::cout << "Client retired our connection ID #" << frame.sequence << std::endl;
    }

    void on_frame(const network_path&, const path_response_frame&) {}
    void on_frame(const network_path&, const ack_frame&) {}

    path_transport& transport_;
    std::mutex mutex_;
    std::vector<std::byte> client_cid_;
    transfer_continuity_bridge reassembly_;
    uint64_t received_ = 0;
    bool ids_issued_ = false;
};

}  // namespace

int main(int argc, char* argv[]) {
    uint16_t port = 4433;
    if (argc > 1) {
        port = static_cast<uint16_t>(std::stoi(argv[1]));
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    get_logger().initialize();

    udp_transport_config config;
    config.bind_to_device = false;
    auto transport = udp_path_transport::create(config);

    responder peer(*transport);
    transport->on_packet([&peer](const inbound_packet& packet) { peer.handle(packet); });

    auto bound = transport->open_path(path_id{0}, local_binding{"", "0.0.0.0", port},
                                      socket_address{"0.0.0.0", 0});
    if (!bound) {
        std::cerr << "Failed to bind port " << port << ": " << bound.error().message
                  << std::endl;
        return 1;
    }
    std::cout << "Responder listening on " << bound.value().to_string() << std::endl;

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    transport->shutdown();
    return 0;
}

/**
 * @file migrate_client.cpp
 * @brief Client that moves a running transfer to another interface
 *
 * This example demonstrates how to:
 * - Create a migrating connection on top of the UDP path transport
 * - Stream data to a peer and watch acknowledgments
 * - Migrate the connection to another interface mid-transfer
 * - Observe migration events and statistics
 *
 * Run path_responder on the server first. Both programs start from the
 * same pre-shared connection IDs in place of a handshake.
 */

#include <kcenon/path_migration/path_migration.h>

#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace kcenon::path_migration;

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " <host:port> <from_interface> <to_interface> [bytes]"
              << std::endl;
    std::cout << std::endl;
    std::cout << "Example: " << program << " 203.0.113.5:4433 eth0 wlan0 1048576" << std::endl;
}

std::pair<std::string, uint16_t> parse_endpoint(const std::string& addr) {
    auto colon_pos = addr.find(':');
    if (colon_pos == std::string::npos) {
        return {addr, 4433};
    }
    return {
        addr.substr(0, colon_pos),
        static_cast<uint16_t>(std::stoi(addr.substr(colon_pos + 1)))
    };
}

std::vector<std::byte> pre_shared_cid(uint8_t seed) {
    std::vector<std::byte> cid(8);
    for (std::size_t i = 0; i < cid.size(); ++i) {
        cid[i] = static_cast<std::byte>(seed + i);
    }
    return cid;
}

bool wait_acked(quic_connection& connection, std::chrono::seconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (connection.bridge().all_acked(0)) {
            return true;
        }
        auto ticked = connection.tick();
        if (!ticked) {
            std::cerr << "Connection closed: " << ticked.error().message << std::endl;
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return connection.bridge().all_acked(0);
}

int main(int argc, char* argv[]) {
    if (argc < 4) {
        print_usage(argv[0]);
        return 1;
    }

    auto [host, port] = parse_endpoint(argv[1]);
    std::string from_interface = argv[2];
    std::string to_interface = argv[3];
    std::size_t total = argc > 4 ? std::stoul(argv[4]) : 1024 * 1024;

    get_logger().initialize();
    get_logger().set_level(log_level::info);

    auto resolver = std::shared_ptr<const interface_resolver>(system_interface_resolver::create());
    auto local_address = resolver->resolve(from_interface);
    if (!local_address) {
        std::cerr << "Cannot use " << from_interface << ": "
                  << local_address.error().message << std::endl;
        return 1;
    }

    handshake_info handshake;
    handshake.local_cid = pre_shared_cid(0xA0);
    handshake.peer_cid = pre_shared_cid(0xB0);
    handshake.local = local_binding{from_interface, local_address.value(), 0};
    handshake.remote = socket_address{host, port};

    auto config = connection_config_builder()
                      .with_challenge_timeout(std::chrono::milliseconds(500))
                      .with_max_retries(3)
                      .build();
    if (!config) {
        std::cerr << "Invalid configuration: " << config.error().message << std::endl;
        return 1;
    }

    std::shared_ptr<path_transport> transport = udp_path_transport::create();
    auto created = quic_connection::create(transport, handshake, config.value(), resolver);
    if (!created) {
        std::cerr << "Failed to create connection: " << created.error().message << std::endl;
        return 1;
    }
    auto& connection = *created.value();

    connection.on_migration_event([](const migration_event_data& event) {
        std::cout << "[event] " << to_string(event.event);
        if (event.new_path) {
            std::cout << " " << event.new_path->to_string();
        }
        if (!event.error_message.empty()) {
            std::cout << " (" << event.error_message << ")";
        }
        std::cout << std::endl;
    });

    std::vector<std::byte> data(total);
    for (std::size_t i = 0; i < total; ++i) {
        data[i] = static_cast<std::byte>('A' + (i % 26));
    }
    std::span<const std::byte> all(data);
    auto half = total / 2;

    // First half on the original path
    auto written = connection.write(0, all.first(half));
    auto flushed = written ? connection.flush() : result<uint64_t>(unexpected(written.error()));
    if (!flushed) {
        std::cerr << "Send failed: " << flushed.error().message << std::endl;
        return 1;
    }
    if (!wait_acked(connection, std::chrono::seconds(10))) {
        std::cerr << "First half was not acknowledged" << std::endl;
        return 1;
    }
    std::cout << "Sent " << half << " bytes on " << from_interface << std::endl;

    // Second half goes out, then we move
    written = connection.write(0, all.subspan(half), true);
    flushed = written ? connection.flush() : result<uint64_t>(unexpected(written.error()));
    if (!flushed) {
        std::cerr << "Send failed: " << flushed.error().message << std::endl;
    }

    auto report = connection.migrate_to(migration_target::from_interface(to_interface));
    if (!report) {
        std::cerr << "Migration failed (" << to_string(report.error().reason) << "): "
                  << report.error().message << std::endl;
        std::cerr << "Still on " << connection.active_path().value().to_string() << std::endl;
    } else {
        const auto& r = report.value();
        std::cout << "Migrated " << r.old_path.to_string() << " => " << r.new_path.to_string()
                  << " in " << r.duration.count() << "ms (rtt " << r.path_rtt.count()
                  << "ms, " << r.rescheduled_bytes << " bytes re-sent)" << std::endl;
    }

    if (!wait_acked(connection, std::chrono::seconds(10))) {
        std::cerr << "Transfer incomplete" << std::endl;
        return 1;
    }

    auto stats = connection.coordinator().get_statistics();
    std::cout << "Transfer complete: " << total << " bytes, "
              << stats.successful_migrations << " migration(s)" << std::endl;

    connection.close();
    return 0;
}

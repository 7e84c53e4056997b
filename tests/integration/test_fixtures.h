/**
 * @file test_fixtures.h
 * @brief Test fixtures for integration tests
 *
 * A connection runs against an in-memory network: loopback_transport plays
 * the client's datagram layer and scripted_peer plays the server.
 */

#ifndef KCENON_PATH_MIGRATION_TEST_FIXTURES_H
#define KCENON_PATH_MIGRATION_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <kcenon/path_migration/path_migration.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <thread>
#include <variant>
#include <vector>

namespace kcenon::path_migration::test {

template <typename Predicate>
auto wait_for(Predicate predicate,
              std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) -> bool {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

inline auto make_cid(uint8_t seed, std::size_t length = 8) -> std::vector<std::byte> {
    std::vector<std::byte> bytes(length);
    for (std::size_t i = 0; i < length; ++i) {
        bytes[i] = static_cast<std::byte>(seed + i);
    }
    return bytes;
}

inline auto make_payload(std::size_t size) -> std::vector<std::byte> {
    std::vector<std::byte> data(size);
    std::mt19937 gen(42);  // Fixed seed for reproducibility
    std::uniform_int_distribution<> dis(0, 255);
    for (auto& b : data) {
        b = static_cast<std::byte>(dis(gen));
    }
    return data;
}

/**
 * @brief In-memory path_transport
 *
 * Outbound datagrams go to a remote endpoint callback. Inbound datagrams are
 * decoded and handed to the packet handler on a worker thread, in order.
 */
class loopback_transport : public path_transport {
public:
    using remote_endpoint = std::function<void(const network_path&, std::vector<std::byte>)>;

    loopback_transport() : worker_([this] { run(); }) {}

    ~loopback_transport() override {
        {
            std::lock_guard lock(queue_mutex_);
            stopping_ = true;
        }
        queue_cv_.notify_all();
        worker_.join();
    }

    [[nodiscard]] auto type() const -> std::string_view override { return "loopback"; }

    [[nodiscard]] auto open_path(path_id id, const local_binding& local,
                                 const socket_address& /*remote*/)
        -> result<socket_address> override {
        std::lock_guard lock(mutex_);
        if (unbindable_.count(local.address) > 0) {
            return unexpected(error(error_code::path_open_failed,
                "Cannot bind " + local.address));
        }
        auto port = local.port != 0 ? local.port : next_port_++;
        socket_address bound{local.address, port};
        open_[id] = bound;
        return bound;
    }

    [[nodiscard]] auto send_on_path(const network_path& path,
                                    std::span<const std::byte> data)
        -> result<std::size_t> override {
        remote_endpoint endpoint;
        {
            std::lock_guard lock(mutex_);
            auto it = open_.find(path.id);
            if (it == open_.end()) {
                stats_.errors++;
                return unexpected(error(error_code::unknown_path,
                    "Path #" + std::to_string(path.id.value) + " is not open"));
            }
            stats_.packets_sent++;
            stats_.bytes_sent += data.size();
            if (blackholed_.count(it->second.host) > 0) {
                return data.size();
            }
            endpoint = endpoint_;
        }
        if (endpoint) {
            endpoint(path, std::vector<std::byte>(data.begin(), data.end()));
        }
        return data.size();
    }

    auto close_path(path_id id) -> result<void> override {
        std::lock_guard lock(mutex_);
        if (open_.erase(id) == 0) {
            return unexpected(error(error_code::unknown_path,
                "Path #" + std::to_string(id.value) + " is not open"));
        }
        return {};
    }

    void on_packet(packet_handler handler) override {
        std::lock_guard lock(queue_mutex_);
        handler_ = std::move(handler);
    }

    [[nodiscard]] auto is_open(path_id id) const -> bool override {
        std::lock_guard lock(mutex_);
        return open_.count(id) > 0;
    }

    [[nodiscard]] auto get_statistics() const -> path_transport_statistics override {
        std::lock_guard lock(mutex_);
        return stats_;
    }

    void set_remote_endpoint(remote_endpoint endpoint) {
        std::lock_guard lock(mutex_);
        endpoint_ = std::move(endpoint);
    }

    /**
     * @brief Silently drop everything sent from a local host
     */
    void blackhole(const std::string& local_host) {
        std::lock_guard lock(mutex_);
        blackholed_.insert(local_host);
    }

    void refuse_bind(const std::string& local_host) {
        std::lock_guard lock(mutex_);
        unbindable_.insert(local_host);
    }

    /**
     * @brief Queue a datagram for the client as if it arrived on a path
     */
    void deliver(path_id path, const socket_address& source, std::span<const std::byte> data) {
        auto decoded = decode_packet(data);
        if (!decoded) {
            std::lock_guard lock(mutex_);
            stats_.malformed_packets++;
            return;
        }
        {
            std::lock_guard lock(mutex_);
            stats_.packets_received++;
            stats_.bytes_received += data.size();
        }

        inbound_packet packet;
        packet.path = path;
        packet.source = source;
        packet.destination_cid = std::move(decoded.value().destination_cid);
        packet.frame = std::move(decoded.value().frame);
        packet.received_at = std::chrono::steady_clock::now();
        {
            std::lock_guard lock(queue_mutex_);
            queue_.push_back(std::move(packet));
        }
        queue_cv_.notify_one();
    }

    /**
     * @brief Wait until every queued datagram was handled
     */
    auto drain(std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) -> bool {
        std::unique_lock lock(queue_mutex_);
        return idle_cv_.wait_for(lock, timeout, [this] { return queue_.empty() && !busy_; });
    }

private:
    void run() {
        std::unique_lock lock(queue_mutex_);
        while (true) {
            queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (stopping_) {
                return;
            }
            auto packet = std::move(queue_.front());
            queue_.pop_front();
            auto handler = handler_;
            busy_ = true;
            lock.unlock();

            if (handler) {
                handler(packet);
            }

            lock.lock();
            busy_ = false;
            if (queue_.empty()) {
                idle_cv_.notify_all();
            }
        }
    }

    mutable std::mutex mutex_;
    std::map<path_id, socket_address> open_;
    std::set<std::string> blackholed_;
    std::set<std::string> unbindable_;
    uint16_t next_port_ = 50000;
    remote_endpoint endpoint_;
    path_transport_statistics stats_;

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::deque<inbound_packet> queue_;
    packet_handler handler_;
    bool busy_ = false;
    bool stopping_ = false;

    std::thread worker_;
};

/**
 * @brief Server side of the in-memory network
 *
 * Answers PATH_CHALLENGE, acknowledges and reassembles STREAM data, and
 * records the connection IDs the client used and retired.
 */
class scripted_peer {
public:
    explicit scripted_peer(loopback_transport& transport, std::vector<std::byte> client_cid)
        : transport_(transport),
          handshake_cid_(std::move(client_cid)),
          reassembly_([](const network_path&, const stream_frame&) -> result<void> {
              return {};
          }) {
        reassembly_.on_delivery([this](stream_id, uint64_t, std::span<const std::byte> data,
                                       bool fin) {
            std::lock_guard lock(mutex_);
            received_.insert(received_.end(), data.begin(), data.end());
            if (fin) {
                fin_count_++;
            }
        });
        transport_.set_remote_endpoint(
            [this](const network_path& path, std::vector<std::byte> data) {
                on_datagram(path, data);
            });
    }

    ~scripted_peer() {
        transport_.set_remote_endpoint(nullptr);
    }

    scripted_peer(const scripted_peer&) = delete;
    scripted_peer& operator=(const scripted_peer&) = delete;

    // Behaviour switches
    std::atomic<bool> answer_challenges{true};
    std::atomic<bool> corrupt_responses{false};
    std::atomic<bool> send_acks{true};

    /**
     * @brief Answer from this address instead of the one the client sent to
     */
    void respond_from(std::optional<socket_address> source) {
        std::lock_guard lock(mutex_);
        response_source_ = std::move(source);
    }

    /**
     * @brief Send a frame to the client on a path
     */
    void send(path_id path, const socket_address& source, std::span<const std::byte> dcid,
              const path_frame& frame) {
        auto packet = encode_packet(dcid, frame);
        transport_.deliver(path, source, packet);
    }

    /**
     * @brief Send a frame using the client ID this peer uses for the path
     */
    void send(path_id path, const socket_address& source, const path_frame& frame) {
        std::vector<std::byte> dcid;
        {
            std::lock_guard lock(mutex_);
            dcid = cid_for(path);
        }
        send(path, source, dcid, frame);
    }

    /**
     * @brief Issue peer connection IDs sequence 1..count over a path
     */
    void issue_ids(path_id path, const socket_address& source, uint64_t count,
                   uint8_t seed = 0xC0) {
        for (uint64_t seq = 1; seq <= count; ++seq) {
            new_connection_id_frame frame;
            frame.sequence = seq;
            frame.connection_id = make_cid(static_cast<uint8_t>(seed + seq * 0x10));
            send(path, source, frame);
        }
    }

    // Observations

    [[nodiscard]] auto received() const -> std::vector<std::byte> {
        std::lock_guard lock(mutex_);
        return received_;
    }

    [[nodiscard]] auto received_size() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return received_.size();
    }

    [[nodiscard]] auto fin_count() const -> int {
        std::lock_guard lock(mutex_);
        return fin_count_;
    }

    [[nodiscard]] auto challenges_on(path_id path) const -> std::size_t {
        std::lock_guard lock(mutex_);
        auto it = challenges_.find(path);
        return it == challenges_.end() ? 0 : it->second;
    }

    /**
     * @brief Destination IDs the client used on a path, in arrival order
     */
    [[nodiscard]] auto dcids_on(path_id path) const -> std::vector<std::vector<std::byte>> {
        std::lock_guard lock(mutex_);
        auto it = dcids_.find(path);
        return it == dcids_.end() ? std::vector<std::vector<std::byte>>{} : it->second;
    }

    [[nodiscard]] auto retired_sequences() const -> std::vector<uint64_t> {
        std::lock_guard lock(mutex_);
        return retired_;
    }

    [[nodiscard]] auto announced_ids() const -> std::vector<new_connection_id_frame> {
        std::lock_guard lock(mutex_);
        return announced_;
    }

    [[nodiscard]] auto reassembly_statistics() const -> continuity_statistics {
        return reassembly_.get_statistics();
    }

private:
    /**
     * @brief Client ID to address a path with (caller holds mutex_)
     *
     * The handshake ID is used on the first path, every later path gets the
     * most recently announced ID.
     */
    auto cid_for(path_id path) -> std::vector<std::byte> {
        auto it = path_cids_.find(path);
        if (it != path_cids_.end()) {
            return it->second;
        }
        auto chosen = announced_.empty() || path_cids_.empty()
                          ? handshake_cid_
                          : announced_.back().connection_id;
        path_cids_[path] = chosen;
        return chosen;
    }

    void on_datagram(const network_path& path, std::span<const std::byte> data) {
        auto decoded = decode_packet(data);
        if (!decoded) {
            return;
        }

        socket_address source;
        {
            std::lock_guard lock(mutex_);
            dcids_[path.id].push_back(decoded.value().destination_cid);
            source = response_source_.value_or(path.remote);
        }

        std::visit([&](const auto& frame) { handle(path, source, frame); },
                   decoded.value().frame);
    }

    void handle(const network_path& path, const socket_address& source,
                const path_challenge_frame& frame) {
        {
            std::lock_guard lock(mutex_);
            challenges_[path.id]++;
        }
        if (!answer_challenges.load()) {
            return;
        }
        path_response_frame response{frame.token};
        if (corrupt_responses.load()) {
            response.token[0] ^= std::byte{0xFF};
        }
        send(path.id, source, response);
    }

    void handle(const network_path& path, const socket_address& source,
                const stream_frame& frame) {
        auto received = reassembly_.on_stream_frame(frame.stream, frame.offset, frame.data,
                                                    frame.fin);
        if (!received || frame.data.empty() || !send_acks.load()) {
            return;
        }
        send(path.id, source, ack_frame{frame.stream, frame.offset, frame.data.size()});
    }

    void handle(const network_path&, const socket_address&,
                const new_connection_id_frame& frame) {
        std::lock_guard lock(mutex_);
        announced_.push_back(frame);
    }

    void handle(const network_path&, const socket_address&,
                const retire_connection_id_frame& frame) {
        std::lock_guard lock(mutex_);
        retired_.push_back(frame.sequence);
    }

    void handle(const network_path&, const socket_address&, const path_response_frame&) {}
    void handle(const network_path&, const socket_address&, const ack_frame&) {}

    loopback_transport& transport_;
    std::vector<std::byte> handshake_cid_;
    transfer_continuity_bridge reassembly_;

    mutable std::mutex mutex_;
    std::optional<socket_address> response_source_;
    std::map<path_id, std::vector<std::byte>> path_cids_;
    std::map<path_id, std::size_t> challenges_;
    std::map<path_id, std::vector<std::vector<std::byte>>> dcids_;
    std::vector<new_connection_id_frame> announced_;
    std::vector<uint64_t> retired_;
    std::vector<std::byte> received_;
    int fin_count_ = 0;
};

/**
 * @brief Interface table with fixed addresses
 */
class static_resolver : public interface_resolver {
public:
    explicit static_resolver(std::map<std::string, std::string> addresses)
        : addresses_(std::move(addresses)) {}

    [[nodiscard]] auto resolve(const std::string& name) const -> result<std::string> override {
        auto it = addresses_.find(name);
        if (it == addresses_.end()) {
            return unexpected(error(error_code::migration_failed, failure_reason::no_route,
                "Interface " + name + " not found"));
        }
        return it->second;
    }

    [[nodiscard]] auto list() const -> std::vector<network_interface> override {
        std::vector<network_interface> out;
        for (const auto& [name, address] : addresses_) {
            out.push_back({name, address, true, false});
        }
        return out;
    }

private:
    std::map<std::string, std::string> addresses_;
};

/**
 * @brief Connection wired to a scripted peer over the loopback network
 */
class MigrationFixture : public ::testing::Test {
protected:
    void SetUp() override {
        transport_ = std::make_shared<loopback_transport>();
        peer_ = std::make_unique<scripted_peer>(*transport_, client_cid_);
        resolver_ = std::make_shared<static_resolver>(std::map<std::string, std::string>{
            {"eth0", "10.0.0.2"},
            {"wlan0", "192.168.1.10"},
            {"cell0", "100.64.0.10"}});
    }

    void TearDown() override {
        if (connection_) {
            connection_->close();
        }
        connection_.reset();
        peer_.reset();
        transport_.reset();
    }

    [[nodiscard]] static auto default_config() -> connection_config {
        auto config = connection_config_builder()
                          .with_challenge_timeout(std::chrono::milliseconds(100))
                          .with_max_retries(2)
                          .with_max_segment_size(1000)
                          .build();
        return config.value();
    }

    /**
     * @brief Create the connection and give it three spare peer IDs
     */
    void connect(const connection_config& config = default_config()) {
        handshake_info handshake;
        handshake.local_cid = client_cid_;
        handshake.peer_cid = make_cid(0xB0);
        handshake.local = local_binding{"eth0", "10.0.0.2", 5000};
        handshake.remote = server_;

        auto created = quic_connection::create(transport_, handshake, config, resolver_);
        ASSERT_TRUE(created.has_value()) << created.error().message;
        connection_ = std::move(created.value());
        initial_path_ = connection_->active_path().value().id;

        peer_->issue_ids(initial_path_, server_, 3);
        ASSERT_TRUE(transport_->drain());
        ASSERT_EQ(connection_->id_pool().available_peer(), 3u);
    }

    std::vector<std::byte> client_cid_ = make_cid(0xA0);
    socket_address server_{"203.0.113.5", 4433};

    std::shared_ptr<loopback_transport> transport_;
    std::unique_ptr<scripted_peer> peer_;
    std::shared_ptr<static_resolver> resolver_;
    std::unique_ptr<quic_connection> connection_;
    path_id initial_path_;
};

}  // namespace kcenon::path_migration::test

#endif  // KCENON_PATH_MIGRATION_TEST_FIXTURES_H

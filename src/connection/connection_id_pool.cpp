/**
 * @file connection_id_pool.cpp
 * @brief Connection ID pool implementation
 */

#include "kcenon/path_migration/connection/connection_id_pool.h"
#include "kcenon/path_migration/core/logging.h"
#include "kcenon/path_migration/core/secure_random.h"

#include <algorithm>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <unordered_map>

namespace kcenon::path_migration {

namespace {

constexpr int max_generation_attempts = 16;

struct path_binding {
    std::optional<uint64_t> local;
    std::optional<uint64_t> peer;

    auto slot(id_issuer issuer) -> std::optional<uint64_t>& {
        return issuer == id_issuer::local ? local : peer;
    }

    [[nodiscard]] auto slot(id_issuer issuer) const -> const std::optional<uint64_t>& {
        return issuer == id_issuer::local ? local : peer;
    }
};

struct pending_retirement {
    id_issuer issuer;
    uint64_t sequence;
    std::chrono::steady_clock::time_point deadline;
};

}  // namespace

struct connection_id_pool::impl {
    connection_id_pool_config config;

    mutable std::mutex mutex;
    std::map<uint64_t, connection_id> local_ids;
    std::map<uint64_t, connection_id> peer_ids;
    std::set<std::vector<std::byte>> seen_bytes;
    std::unordered_map<path_id, path_binding> bindings;
    std::vector<pending_retirement> retirements;
    uint64_t next_local_sequence = 0;

    explicit impl(connection_id_pool_config cfg) : config(std::move(cfg)) {}

    auto table(id_issuer issuer) -> std::map<uint64_t, connection_id>& {
        return issuer == id_issuer::local ? local_ids : peer_ids;
    }

    auto table(id_issuer issuer) const -> const std::map<uint64_t, connection_id>& {
        return issuer == id_issuer::local ? local_ids : peer_ids;
    }

    static auto count_live(const std::map<uint64_t, connection_id>& ids) -> std::size_t {
        return static_cast<std::size_t>(std::count_if(ids.begin(), ids.end(),
            [](const auto& entry) { return !entry.second.retired; }));
    }

    auto find_live(id_issuer issuer, uint64_t sequence) -> result<connection_id*> {
        auto& ids = table(issuer);
        auto it = ids.find(sequence);
        if (it == ids.end()) {
            return unexpected(error(error_code::unknown_id,
                std::string(to_string(issuer)) + " connection ID #" +
                std::to_string(sequence) + " is unknown"));
        }
        if (it->second.retired) {
            return unexpected(error(error_code::retired_id,
                std::string(to_string(issuer)) + " connection ID #" +
                std::to_string(sequence) + " is retired"));
        }
        return &it->second;
    }

    void detach(const connection_id& id) {
        for (auto& [path, binding] : bindings) {
            auto& slot = binding.slot(id.issuer);
            if (slot && *slot == id.sequence) {
                slot.reset();
            }
        }
    }

    void retire_locked(connection_id& id) {
        id.retired = true;
        id.in_use = false;
        detach(id);
        retirements.erase(
            std::remove_if(retirements.begin(), retirements.end(),
                [&id](const pending_retirement& r) {
                    return r.issuer == id.issuer && r.sequence == id.sequence;
                }),
            retirements.end());

        PM_LOG_DEBUG(log_category::pool,
            "Retired " + std::string(to_string(id.issuer)) +
            " connection ID #" + std::to_string(id.sequence));
    }

    auto insert_peer(std::vector<std::byte> bytes, uint64_t sequence) -> result<connection_id> {
        if (bytes.size() < min_connection_id_length ||
            bytes.size() > max_connection_id_length) {
            return unexpected(error(error_code::invalid_connection_id,
                "Connection ID length " + std::to_string(bytes.size()) +
                " outside 1..20"));
        }
        if (peer_ids.count(sequence) > 0) {
            return unexpected(error(error_code::duplicate_id,
                "Peer connection ID sequence " + std::to_string(sequence) +
                " already seen"));
        }
        if (count_live(peer_ids) >= config.max_peer_ids) {
            return unexpected(error(error_code::pool_exhausted,
                "Peer connection ID limit reached"));
        }

        connection_id id;
        id.bytes = std::move(bytes);
        id.sequence = sequence;
        id.issuer = id_issuer::peer;
        seen_bytes.insert(id.bytes);
        peer_ids.emplace(sequence, id);
        return id;
    }
};

connection_id_pool::connection_id_pool(connection_id_pool_config config)
    : impl_(std::make_unique<impl>(std::move(config))) {}

connection_id_pool::~connection_id_pool() = default;

auto connection_id_pool::add_handshake_local(std::vector<std::byte> bytes)
    -> result<connection_id> {
    std::lock_guard lock(impl_->mutex);

    if (bytes.size() < min_connection_id_length || bytes.size() > max_connection_id_length) {
        return unexpected(error(error_code::invalid_connection_id,
            "Handshake connection ID has invalid length"));
    }
    if (impl_->seen_bytes.count(bytes) > 0) {
        return unexpected(error(error_code::duplicate_id,
            "Handshake connection ID already known"));
    }
    if (impl::count_live(impl_->local_ids) >= impl_->config.max_local_ids) {
        return unexpected(error(error_code::pool_exhausted,
            "Local connection ID limit reached"));
    }

    connection_id id;
    id.bytes = std::move(bytes);
    id.sequence = impl_->next_local_sequence++;
    id.issuer = id_issuer::local;
    id.advertised = true;
    impl_->seen_bytes.insert(id.bytes);
    impl_->local_ids.emplace(id.sequence, id);
    return id;
}

auto connection_id_pool::allocate_local() -> result<connection_id> {
    std::lock_guard lock(impl_->mutex);

    if (impl::count_live(impl_->local_ids) >= impl_->config.max_local_ids) {
        return unexpected(error(error_code::pool_exhausted,
            "Local connection ID limit of " +
            std::to_string(impl_->config.max_local_ids) + " reached"));
    }

    for (int attempt = 0; attempt < max_generation_attempts; ++attempt) {
        auto bytes = generate_random_bytes(impl_->config.connection_id_length);
        if (!bytes) {
            return unexpected(bytes.error());
        }
        if (impl_->seen_bytes.count(bytes.value()) > 0) {
            continue;
        }

        connection_id id;
        id.bytes = std::move(bytes.value());
        id.sequence = impl_->next_local_sequence++;
        id.issuer = id_issuer::local;
        impl_->seen_bytes.insert(id.bytes);
        impl_->local_ids.emplace(id.sequence, id);

        PM_LOG_DEBUG(log_category::pool,
            "Allocated local connection ID #" + std::to_string(id.sequence));
        return id;
    }

    return unexpected(error(error_code::internal_error,
        "Could not generate a unique connection ID"));
}

auto connection_id_pool::mark_advertised(uint64_t sequence) -> result<void> {
    std::lock_guard lock(impl_->mutex);
    auto id = impl_->find_live(id_issuer::local, sequence);
    if (!id) {
        return unexpected(id.error());
    }
    id.value()->advertised = true;
    return {};
}

auto connection_id_pool::register_peer(std::vector<std::byte> bytes, uint64_t sequence)
    -> result<connection_id> {
    std::lock_guard lock(impl_->mutex);
    auto id = impl_->insert_peer(std::move(bytes), sequence);
    if (id) {
        PM_LOG_DEBUG(log_category::pool,
            "Registered peer connection ID #" + std::to_string(sequence));
    }
    return id;
}

auto connection_id_pool::register_peer(std::vector<std::byte> bytes, uint64_t sequence,
                                       uint64_t retire_prior_to)
    -> result<std::vector<uint64_t>> {
    if (retire_prior_to > sequence) {
        return unexpected(error(error_code::invalid_connection_id,
            "retire_prior_to exceeds sequence number"));
    }
    if (bytes.size() < min_connection_id_length || bytes.size() > max_connection_id_length) {
        return unexpected(error(error_code::invalid_connection_id,
            "Connection ID length " + std::to_string(bytes.size()) + " outside 1..20"));
    }

    std::lock_guard lock(impl_->mutex);

    // IDs below retire_prior_to leave the limit before the new one is counted
    std::vector<uint64_t> retired;
    if (impl_->peer_ids.count(sequence) == 0) {
        for (auto& [seq, id] : impl_->peer_ids) {
            if (seq < retire_prior_to && !id.retired) {
                impl_->retire_locked(id);
                retired.push_back(seq);
            }
        }
    }

    auto inserted = impl_->insert_peer(std::move(bytes), sequence);
    if (!inserted) {
        return unexpected(inserted.error());
    }
    return retired;
}

auto connection_id_pool::claim_peer() -> result<connection_id> {
    std::lock_guard lock(impl_->mutex);
    for (auto& [seq, id] : impl_->peer_ids) {
        if (!id.retired && !id.in_use) {
            id.in_use = true;
            return id;
        }
    }
    return unexpected(error(error_code::no_available_id,
        "No unused peer connection ID available"));
}

auto connection_id_pool::retire(id_issuer issuer, uint64_t sequence) -> result<void> {
    std::lock_guard lock(impl_->mutex);
    auto id = impl_->find_live(issuer, sequence);
    if (!id) {
        return unexpected(id.error());
    }
    impl_->retire_locked(*id.value());
    return {};
}

auto connection_id_pool::lookup(id_issuer issuer, uint64_t sequence) const
    -> result<connection_id> {
    std::lock_guard lock(impl_->mutex);
    const auto& ids = impl_->table(issuer);
    auto it = ids.find(sequence);
    if (it == ids.end()) {
        return unexpected(error(error_code::unknown_id,
            std::string(to_string(issuer)) + " connection ID #" +
            std::to_string(sequence) + " is unknown"));
    }
    if (it->second.retired) {
        return unexpected(error(error_code::retired_id,
            std::string(to_string(issuer)) + " connection ID #" +
            std::to_string(sequence) + " is retired"));
    }
    return it->second;
}

auto connection_id_pool::find_local(std::span<const std::byte> bytes) const
    -> result<connection_id> {
    std::lock_guard lock(impl_->mutex);
    for (const auto& [seq, id] : impl_->local_ids) {
        if (std::equal(id.bytes.begin(), id.bytes.end(), bytes.begin(), bytes.end())) {
            if (id.retired) {
                return unexpected(error(error_code::retired_id,
                    "Local connection ID #" + std::to_string(seq) + " is retired"));
            }
            return id;
        }
    }
    return unexpected(error(error_code::unknown_id, "Unknown local connection ID"));
}

auto connection_id_pool::active_for(path_id path, id_issuer issuer) const
    -> result<connection_id> {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->bindings.find(path);
    if (it == impl_->bindings.end() || !it->second.slot(issuer)) {
        return unexpected(error(error_code::unknown_id,
            "No " + std::string(to_string(issuer)) +
            " connection ID on path #" + std::to_string(path.value)));
    }
    return impl_->table(issuer).at(*it->second.slot(issuer));
}

auto connection_id_pool::set_active(path_id path, id_issuer issuer, uint64_t sequence)
    -> result<void> {
    std::lock_guard lock(impl_->mutex);
    auto id = impl_->find_live(issuer, sequence);
    if (!id) {
        return unexpected(id.error());
    }

    id.value()->in_use = true;
    impl_->bindings[path].slot(issuer) = sequence;
    return {};
}

void connection_id_pool::release_path(path_id path) {
    std::lock_guard lock(impl_->mutex);
    impl_->bindings.erase(path);
}

auto connection_id_pool::schedule_retirement(id_issuer issuer, uint64_t sequence,
                                             clock::time_point deadline) -> result<void> {
    std::lock_guard lock(impl_->mutex);
    auto id = impl_->find_live(issuer, sequence);
    if (!id) {
        return unexpected(id.error());
    }

    for (auto& pending : impl_->retirements) {
        if (pending.issuer == issuer && pending.sequence == sequence) {
            pending.deadline = std::min(pending.deadline, deadline);
            return {};
        }
    }
    impl_->retirements.push_back({issuer, sequence, deadline});
    return {};
}

auto connection_id_pool::retire_expired(clock::time_point now) -> std::vector<connection_id> {
    std::lock_guard lock(impl_->mutex);

    std::vector<pending_retirement> due;
    for (const auto& pending : impl_->retirements) {
        if (pending.deadline <= now) {
            due.push_back(pending);
        }
    }

    std::vector<connection_id> retired;
    for (const auto& pending : due) {
        auto& ids = impl_->table(pending.issuer);
        auto it = ids.find(pending.sequence);
        if (it == ids.end() || it->second.retired) {
            continue;
        }
        impl_->retire_locked(it->second);
        retired.push_back(it->second);
    }

    // retire_locked() already removed the due entries
    return retired;
}

auto connection_id_pool::outstanding_local() const -> std::size_t {
    std::lock_guard lock(impl_->mutex);
    return impl::count_live(impl_->local_ids);
}

auto connection_id_pool::available_peer() const -> std::size_t {
    std::lock_guard lock(impl_->mutex);
    return static_cast<std::size_t>(std::count_if(
        impl_->peer_ids.begin(), impl_->peer_ids.end(),
        [](const auto& entry) { return !entry.second.retired && !entry.second.in_use; }));
}

auto connection_id_pool::pending_retirements() const -> std::size_t {
    std::lock_guard lock(impl_->mutex);
    return impl_->retirements.size();
}

auto connection_id_pool::ids(id_issuer issuer) const -> std::vector<connection_id> {
    std::lock_guard lock(impl_->mutex);
    std::vector<connection_id> out;
    for (const auto& [seq, id] : impl_->table(issuer)) {
        out.push_back(id);
    }
    return out;
}

auto connection_id_pool::config() const -> const connection_id_pool_config& {
    return impl_->config;
}

}  // namespace kcenon::path_migration

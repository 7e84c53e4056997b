/**
 * @file path_table.cpp
 * @brief path_table implementation
 */

#include "kcenon/path_migration/connection/path_table.h"

#include <mutex>

namespace kcenon::path_migration {

namespace {

auto unknown(path_id id) -> unexpected {
    return unexpected(error(error_code::unknown_path,
        "Unknown path #" + std::to_string(id.value)));
}

}  // namespace

auto path_table::slot(path_id id) -> network_path* {
    auto it = slots_.find(id.value);
    return it == slots_.end() ? nullptr : &it->second;
}

auto path_table::slot(path_id id) const -> const network_path* {
    auto it = slots_.find(id.value);
    return it == slots_.end() ? nullptr : &it->second;
}

auto path_table::add(socket_address local, socket_address remote,
                     std::string interface_name) -> network_path {
    std::unique_lock lock(mutex_);
    network_path path;
    path.id = path_id{next_id_++};
    path.local = std::move(local);
    path.remote = std::move(remote);
    path.interface_name = std::move(interface_name);
    path.state = path_state::unvalidated;
    path.created_at = std::chrono::steady_clock::now();
    slots_.emplace(path.id.value, path);
    return path;
}

auto path_table::get(path_id id) const -> result<network_path> {
    std::shared_lock lock(mutex_);
    auto* s = slot(id);
    if (!s) {
        return unknown(id);
    }
    return *s;
}

auto path_table::contains(path_id id) const -> bool {
    std::shared_lock lock(mutex_);
    return slot(id) != nullptr;
}

auto path_table::set_state(path_id id, path_state state) -> result<void> {
    std::unique_lock lock(mutex_);
    auto* s = slot(id);
    if (!s) {
        return unknown(id);
    }
    s->state = state;
    return {};
}

auto path_table::set_local(path_id id, socket_address local) -> result<void> {
    std::unique_lock lock(mutex_);
    auto* s = slot(id);
    if (!s) {
        return unknown(id);
    }
    s->local = std::move(local);
    return {};
}

auto path_table::set_remote(path_id id, socket_address remote) -> result<void> {
    std::unique_lock lock(mutex_);
    auto* s = slot(id);
    if (!s) {
        return unknown(id);
    }
    s->remote = std::move(remote);
    return {};
}

auto path_table::set_rtt(path_id id, std::chrono::milliseconds rtt) -> result<void> {
    std::unique_lock lock(mutex_);
    auto* s = slot(id);
    if (!s) {
        return unknown(id);
    }
    s->rtt = rtt;
    return {};
}

auto path_table::remove(path_id id) -> result<void> {
    std::unique_lock lock(mutex_);
    auto* s = slot(id);
    if (!s) {
        return unknown(id);
    }
    if (active_.load() == id.value) {
        return unexpected(error(error_code::internal_error,
            "Cannot remove the active path"));
    }
    slots_.erase(id.value);
    return {};
}

auto path_table::activate(path_id id) -> result<std::optional<path_id>> {
    std::unique_lock lock(mutex_);
    auto* s = slot(id);
    if (!s) {
        return unknown(id);
    }
    if (!s->is_validated()) {
        return unexpected(error(error_code::path_not_validated,
            "Path " + s->to_string() + " is not validated"));
    }

    auto previous = active_.exchange(id.value);
    if (previous == no_active) {
        return std::optional<path_id>{};
    }
    return std::optional<path_id>{path_id{previous}};
}

auto path_table::active_id() const -> std::optional<path_id> {
    auto current = active_.load();
    if (current == no_active) {
        return std::nullopt;
    }
    return path_id{current};
}

auto path_table::active() const -> result<network_path> {
    auto id = active_id();
    if (!id) {
        return unexpected(error(error_code::unknown_path, "No active path"));
    }
    return get(*id);
}

auto path_table::paths() const -> std::vector<network_path> {
    std::shared_lock lock(mutex_);
    std::vector<network_path> out;
    out.reserve(slots_.size());
    for (const auto& [id, path] : slots_) {
        out.push_back(path);
    }
    return out;
}

auto path_table::size() const -> std::size_t {
    std::shared_lock lock(mutex_);
    return slots_.size();
}

}  // namespace kcenon::path_migration

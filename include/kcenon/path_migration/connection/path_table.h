/**
 * @file path_table.h
 * @brief Arena of network paths with an atomically swapped active index
 */

#ifndef KCENON_PATH_MIGRATION_CONNECTION_PATH_TABLE_H
#define KCENON_PATH_MIGRATION_CONNECTION_PATH_TABLE_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <vector>

#include "kcenon/path_migration/connection/network_path.h"
#include "kcenon/path_migration/core/types.h"

namespace kcenon::path_migration {

/**
 * @brief Path arena owned by a connection
 *
 * Ids increase monotonically and are never reused; removed paths are
 * erased. The active path is stored
 * as an atomic index so that readers on transport threads observe either the
 * old or the new path, never a torn value. Only the migration coordinator
 * calls activate().
 */
class path_table {
public:
    path_table() = default;

    path_table(const path_table&) = delete;
    path_table& operator=(const path_table&) = delete;

    /**
     * @brief Register a new path and assign it a fresh id
     */
    auto add(socket_address local, socket_address remote,
             std::string interface_name) -> network_path;

    [[nodiscard]] auto get(path_id id) const -> result<network_path>;
    [[nodiscard]] auto contains(path_id id) const -> bool;

    auto set_state(path_id id, path_state state) -> result<void>;
    auto set_local(path_id id, socket_address local) -> result<void>;
    auto set_remote(path_id id, socket_address remote) -> result<void>;
    auto set_rtt(path_id id, std::chrono::milliseconds rtt) -> result<void>;

    /**
     * @brief Remove a path slot
     *
     * The active path cannot be removed.
     */
    auto remove(path_id id) -> result<void>;

    /**
     * @brief Make a validated path the active one
     * @return id of the previously active path (if any)
     */
    auto activate(path_id id) -> result<std::optional<path_id>>;

    [[nodiscard]] auto active_id() const -> std::optional<path_id>;
    [[nodiscard]] auto active() const -> result<network_path>;

    [[nodiscard]] auto paths() const -> std::vector<network_path>;
    [[nodiscard]] auto size() const -> std::size_t;

private:
    static constexpr uint32_t no_active = 0xFFFFFFFFu;

    auto slot(path_id id) -> network_path*;
    auto slot(path_id id) const -> const network_path*;

    mutable std::shared_mutex mutex_;
    std::map<uint32_t, network_path> slots_;
    uint32_t next_id_ = 0;
    std::atomic<uint32_t> active_{no_active};
};

}  // namespace kcenon::path_migration

#endif  // KCENON_PATH_MIGRATION_CONNECTION_PATH_TABLE_H

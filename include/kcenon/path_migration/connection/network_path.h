/**
 * @file network_path.h
 * @brief Network path and socket address types
 */

#ifndef KCENON_PATH_MIGRATION_CONNECTION_NETWORK_PATH_H
#define KCENON_PATH_MIGRATION_CONNECTION_NETWORK_PATH_H

#include <chrono>
#include <cstdint>
#include <string>

#include "kcenon/path_migration/core/types.h"

namespace kcenon::path_migration {

/**
 * @brief Host and port of one endpoint
 */
struct socket_address {
    std::string host;
    uint16_t port = 0;

    [[nodiscard]] auto operator==(const socket_address& other) const -> bool = default;

    [[nodiscard]] auto empty() const -> bool { return host.empty() && port == 0; }

    [[nodiscard]] auto to_string() const -> std::string {
        return host + ":" + std::to_string(port);
    }
};

/**
 * @brief Validation state of a path
 */
enum class path_state {
    unvalidated,  ///< Registered, no challenge sent yet
    validating,   ///< PATH_CHALLENGE outstanding
    validated,    ///< Peer proved reachability
    failed        ///< Validation abandoned
};

[[nodiscard]] constexpr auto to_string(path_state state) -> const char* {
    switch (state) {
        case path_state::unvalidated: return "unvalidated";
        case path_state::validating: return "validating";
        case path_state::validated: return "validated";
        case path_state::failed: return "failed";
        default: return "unknown";
    }
}

/**
 * @brief One local/remote address pair the connection can send on
 */
struct network_path {
    /// Arena slot identifier
    path_id id;

    /// Bound local address
    socket_address local;

    /// Peer address
    socket_address remote;

    /// Network interface name (e.g., "eth0", "wlan0"), empty when bound by address
    std::string interface_name;

    path_state state = path_state::unvalidated;

    /// Last measured round-trip time
    std::chrono::milliseconds rtt{0};

    std::chrono::steady_clock::time_point created_at;

    [[nodiscard]] auto is_validated() const -> bool {
        return state == path_state::validated;
    }

    [[nodiscard]] auto to_string() const -> std::string {
        return "#" + std::to_string(id.value) + " " + local.to_string() +
               " -> " + remote.to_string();
    }
};

}  // namespace kcenon::path_migration

#endif  // KCENON_PATH_MIGRATION_CONNECTION_NETWORK_PATH_H

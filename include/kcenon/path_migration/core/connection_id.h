/**
 * @file connection_id.h
 * @brief Connection ID value type
 */

#ifndef KCENON_PATH_MIGRATION_CORE_CONNECTION_ID_H
#define KCENON_PATH_MIGRATION_CORE_CONNECTION_ID_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace kcenon::path_migration {

/// Minimum and maximum connection ID lengths accepted on the wire
inline constexpr std::size_t min_connection_id_length = 1;
inline constexpr std::size_t max_connection_id_length = 20;

/**
 * @brief Which endpoint issued a connection ID
 */
enum class id_issuer {
    local,  ///< Issued by us, used by the peer as destination
    peer    ///< Issued by the peer, used by us as destination
};

[[nodiscard]] constexpr auto to_string(id_issuer issuer) -> const char* {
    switch (issuer) {
        case id_issuer::local: return "local";
        case id_issuer::peer: return "peer";
        default: return "unknown";
    }
}

/**
 * @brief Opaque connection identifier with its bookkeeping flags
 *
 * Identity is (issuer, sequence). The byte value is unique among all IDs the
 * connection has ever seen.
 */
struct connection_id {
    std::vector<std::byte> bytes;
    uint64_t sequence = 0;
    id_issuer issuer = id_issuer::local;
    bool retired = false;     ///< Never reused once set
    bool advertised = false;  ///< Local IDs: announced with NEW_CONNECTION_ID
    bool in_use = false;      ///< Bound to a path

    [[nodiscard]] auto to_hex() const -> std::string;

    [[nodiscard]] auto same_identity(const connection_id& other) const -> bool {
        return issuer == other.issuer && sequence == other.sequence;
    }
};

/**
 * @brief Hex encode a byte sequence (lowercase)
 */
[[nodiscard]] auto to_hex(std::span<const std::byte> data) -> std::string;

}  // namespace kcenon::path_migration

#endif  // KCENON_PATH_MIGRATION_CORE_CONNECTION_ID_H

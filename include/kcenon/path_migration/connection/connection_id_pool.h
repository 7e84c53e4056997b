/**
 * @file connection_id_pool.h
 * @brief Local and peer-issued connection ID bookkeeping
 *
 * The pool owns every connection ID a connection has issued or received,
 * hands out fresh local IDs, claims unused peer IDs for new paths and
 * enforces that retired IDs are never reused or re-activated.
 */

#ifndef KCENON_PATH_MIGRATION_CONNECTION_CONNECTION_ID_POOL_H
#define KCENON_PATH_MIGRATION_CONNECTION_CONNECTION_ID_POOL_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include "kcenon/path_migration/core/connection_id.h"
#include "kcenon/path_migration/core/types.h"

namespace kcenon::path_migration {

/**
 * @brief Connection ID pool limits
 */
struct connection_id_pool_config {
    /// Maximum non-retired local IDs (active_connection_id_limit of the peer)
    std::size_t max_local_ids = 8;

    /// Maximum non-retired peer IDs we are willing to hold
    std::size_t max_peer_ids = 8;

    /// Length of locally generated IDs (4..20)
    std::size_t connection_id_length = 8;
};

/**
 * @brief Thread-safe store of local and peer connection IDs
 *
 * Identity of an ID is (issuer, sequence). At most one ID per issuer is
 * associated with a path. Retirement is monotonic.
 *
 * @code
 * connection_id_pool pool;
 * auto local = pool.allocate_local();
 * auto peer = pool.claim_peer();
 * if (local && peer) {
 *     pool.set_active(candidate, id_issuer::local, local.value().sequence);
 *     pool.set_active(candidate, id_issuer::peer, peer.value().sequence);
 * }
 * @endcode
 */
class connection_id_pool {
public:
    using clock = std::chrono::steady_clock;

    explicit connection_id_pool(connection_id_pool_config config = {});
    ~connection_id_pool();

    connection_id_pool(const connection_id_pool&) = delete;
    connection_id_pool& operator=(const connection_id_pool&) = delete;

    /**
     * @brief Record the local ID negotiated during the handshake
     *
     * The handshake ID takes the next local sequence and counts as advertised.
     */
    auto add_handshake_local(std::vector<std::byte> bytes) -> result<connection_id>;

    /**
     * @brief Generate an unused, unadvertised local ID
     * @return pool_exhausted when max_local_ids non-retired IDs exist
     */
    [[nodiscard]] auto allocate_local() -> result<connection_id>;

    /**
     * @brief Mark a local ID as announced to the peer
     */
    auto mark_advertised(uint64_t sequence) -> result<void>;

    /**
     * @brief Record a peer-issued ID
     * @return duplicate_id, invalid_connection_id or pool_exhausted on failure
     */
    auto register_peer(std::vector<std::byte> bytes, uint64_t sequence)
        -> result<connection_id>;

    /**
     * @brief Record a peer-issued ID carried by NEW_CONNECTION_ID
     *
     * Every non-retired peer ID with a sequence lower than retire_prior_to is
     * retired as well.
     *
     * @return Sequences retired by retire_prior_to
     */
    auto register_peer(std::vector<std::byte> bytes, uint64_t sequence,
                       uint64_t retire_prior_to) -> result<std::vector<uint64_t>>;

    /**
     * @brief Claim the lowest-sequence unused peer ID
     * @return no_available_id if none is left
     */
    [[nodiscard]] auto claim_peer() -> result<connection_id>;

    /**
     * @brief Retire an ID
     *
     * The ID is detached from any path and can never be used again.
     */
    auto retire(id_issuer issuer, uint64_t sequence) -> result<void>;

    [[nodiscard]] auto lookup(id_issuer issuer, uint64_t sequence) const
        -> result<connection_id>;

    /**
     * @brief Find a local ID by its bytes (incoming destination ID)
     */
    [[nodiscard]] auto find_local(std::span<const std::byte> bytes) const
        -> result<connection_id>;

    [[nodiscard]] auto active_for(path_id path, id_issuer issuer) const
        -> result<connection_id>;

    /**
     * @brief Associate an ID with a path, replacing the previous one
     */
    auto set_active(path_id path, id_issuer issuer, uint64_t sequence) -> result<void>;

    /**
     * @brief Drop every ID association of a path
     */
    void release_path(path_id path);

    /**
     * @brief Retire an ID once deadline is reached
     */
    auto schedule_retirement(id_issuer issuer, uint64_t sequence,
                             clock::time_point deadline) -> result<void>;

    /**
     * @brief Retire every scheduled ID whose deadline is at or before now
     * @return The IDs retired by this call
     */
    auto retire_expired(clock::time_point now) -> std::vector<connection_id>;

    [[nodiscard]] auto outstanding_local() const -> std::size_t;
    [[nodiscard]] auto available_peer() const -> std::size_t;
    [[nodiscard]] auto pending_retirements() const -> std::size_t;

    /**
     * @brief Snapshot of all IDs of one issuer, retired included
     */
    [[nodiscard]] auto ids(id_issuer issuer) const -> std::vector<connection_id>;

    [[nodiscard]] auto config() const -> const connection_id_pool_config&;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::path_migration

#endif  // KCENON_PATH_MIGRATION_CONNECTION_CONNECTION_ID_POOL_H

/**
 * @file transfer_continuity_bridge.h
 * @brief Keeps stream data flowing across path switches
 *
 * Stream offsets are independent of the path the bytes travel on. The
 * bridge remembers which byte ranges went out on which path, so that a
 * path switch can move every unacknowledged byte to the new path without
 * changing offsets. The receive side reassembles out-of-order and
 * retransmitted segments and delivers each byte exactly once.
 */

#ifndef KCENON_PATH_MIGRATION_CONTINUITY_TRANSFER_CONTINUITY_BRIDGE_H
#define KCENON_PATH_MIGRATION_CONTINUITY_TRANSFER_CONTINUITY_BRIDGE_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <vector>

#include "kcenon/path_migration/connection/network_path.h"
#include "kcenon/path_migration/core/range_set.h"
#include "kcenon/path_migration/core/types.h"
#include "kcenon/path_migration/transport/path_frames.h"

namespace kcenon::path_migration {

/**
 * @brief Bridge configuration
 */
struct continuity_config {
    /// Largest STREAM payload per datagram (1..65535)
    std::size_t max_segment_size = 1200;
};

/**
 * @brief Bridge statistics
 */
struct continuity_statistics {
    uint64_t bytes_written = 0;
    uint64_t bytes_sent = 0;           ///< First transmissions
    uint64_t bytes_retransmitted = 0;
    uint64_t bytes_acked = 0;
    uint64_t bytes_delivered = 0;
    uint64_t duplicate_bytes_dropped = 0;
    uint64_t path_switches = 0;
    uint64_t bytes_rescheduled = 0;
};

/**
 * @brief Sends one STREAM frame on a path
 */
using segment_sender = std::function<result<void>(const network_path&, const stream_frame&)>;

/**
 * @brief Receives in-order stream bytes
 *
 * Invoked once per contiguous chunk; offset is the stream offset of data[0].
 */
using delivery_handler = std::function<void(stream_id stream, uint64_t offset,
                                            std::span<const std::byte> data, bool fin)>;

/**
 * @brief Send buffering, retransmission and reassembly for all streams
 *
 * Frames are handed to the sender without holding internal locks. A segment
 * whose send fails stays recorded as in flight on its path and is recovered
 * by resend() or on_path_switch().
 */
class transfer_continuity_bridge {
public:
    explicit transfer_continuity_bridge(segment_sender sender, continuity_config config = {});
    ~transfer_continuity_bridge();

    transfer_continuity_bridge(const transfer_continuity_bridge&) = delete;
    transfer_continuity_bridge& operator=(const transfer_continuity_bridge&) = delete;

    // ========================================================================
    // Send side
    // ========================================================================

    /**
     * @brief Append bytes to a stream's send buffer
     * @param fin Marks the end of the stream
     * @return Stream offset of the first appended byte
     */
    auto write(stream_id stream, std::span<const std::byte> data, bool fin = false)
        -> result<uint64_t>;

    /**
     * @brief Transmit queued, never-sent bytes of every stream on a path
     * @return Bytes transmitted
     */
    auto flush(const network_path& path) -> result<uint64_t>;

    /**
     * @brief Mark a byte range acknowledged
     */
    auto on_ack(stream_id stream, byte_range range) -> result<void>;

    /**
     * @brief Byte ranges queued or in flight and not acknowledged
     */
    [[nodiscard]] auto pending_unacked(stream_id stream) const
        -> result<std::vector<byte_range>>;

    /**
     * @brief Retransmit the unacknowledged part of a range on a path
     * @return Bytes retransmitted
     */
    auto resend(stream_id stream, byte_range range, const network_path& path)
        -> result<uint64_t>;

    /**
     * @brief Move every unacknowledged byte onto new_path
     *
     * Bytes in flight on old_path, or on any other path that is not
     * new_path, and bytes still queued are transmitted on new_path. Offsets
     * never change.
     *
     * @return Bytes re-scheduled
     */
    auto on_path_switch(path_id old_path, const network_path& new_path) -> result<uint64_t>;

    /**
     * @brief Forget a closed path, resending its unacknowledged bytes on active
     * @return Bytes resent, or invalid_range when closed is the active path
     */
    auto on_path_closed(path_id closed, const network_path& active) -> result<uint64_t>;

    /**
     * @brief Number of paths holding in-flight ranges of a stream
     */
    [[nodiscard]] auto tracked_paths(stream_id stream) const -> std::size_t;

    [[nodiscard]] auto all_acked(stream_id stream) const -> bool;
    [[nodiscard]] auto write_offset(stream_id stream) const -> uint64_t;

    // ========================================================================
    // Receive side
    // ========================================================================

    /**
     * @brief Install the delivery handler
     *
     * The handler runs without internal locks held and may query the
     * bridge. It must not feed frames back into on_stream_frame().
     */
    void on_delivery(delivery_handler handler);

    /**
     * @brief Feed a received STREAM frame
     *
     * Contiguous data is delivered in order, exactly once. Duplicate and
     * overlapping bytes are dropped.
     */
    auto on_stream_frame(stream_id stream, uint64_t offset,
                         std::span<const std::byte> data, bool fin) -> result<void>;

    /**
     * @brief Offset up to which bytes have been delivered
     */
    [[nodiscard]] auto delivered_offset(stream_id stream) const -> uint64_t;

    /**
     * @brief Whether every byte up to FIN was delivered
     */
    [[nodiscard]] auto is_finished(stream_id stream) const -> bool;

    [[nodiscard]] auto get_statistics() const -> continuity_statistics;
    [[nodiscard]] auto config() const -> const continuity_config&;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::path_migration

#endif  // KCENON_PATH_MIGRATION_CONTINUITY_TRANSFER_CONTINUITY_BRIDGE_H

/**
 * @file transfer_continuity_bridge.cpp
 * @brief Transfer continuity bridge implementation
 */

#include "kcenon/path_migration/continuity/transfer_continuity_bridge.h"
#include "kcenon/path_migration/core/logging.h"

#include <algorithm>
#include <deque>
#include <map>
#include <mutex>
#include <optional>

namespace kcenon::path_migration {

namespace {

struct send_stream {
    uint64_t base_offset = 0;      ///< Offset of buffer.front()
    std::deque<std::byte> buffer;  ///< [base_offset, write_offset)
    uint64_t write_offset = 0;
    uint64_t sent_offset = 0;      ///< Everything below was transmitted once
    std::optional<uint64_t> fin_offset;
    bool fin_sent = false;
    range_set acked;               ///< Only ranges at or above base_offset
    std::map<path_id, range_set> in_flight;

    [[nodiscard]] auto slice(uint64_t offset, uint64_t length) const -> std::vector<std::byte> {
        auto first = buffer.begin() + static_cast<std::ptrdiff_t>(offset - base_offset);
        return std::vector<std::byte>(first, first + static_cast<std::ptrdiff_t>(length));
    }

    [[nodiscard]] auto clip(byte_range range, uint64_t upper) const -> byte_range {
        auto begin = std::max(range.offset, base_offset);
        auto end = std::min(range.end(), upper);
        if (end <= begin) {
            return {begin, 0};
        }
        return {begin, end - begin};
    }
};

/**
 * @brief In-order chunk collected under the receive lock
 */
struct ready_chunk {
    uint64_t offset = 0;           ///< Stream offset of data[skip]
    std::vector<std::byte> data;
    std::size_t skip = 0;
    bool fin = false;
};

struct recv_stream {
    uint64_t delivered = 0;
    std::map<uint64_t, std::vector<std::byte>> pending;
    std::optional<uint64_t> fin_offset;
    bool fin_delivered = false;
};

}  // namespace

struct transfer_continuity_bridge::impl {
    segment_sender sender;
    continuity_config config;

    mutable std::mutex send_mutex;
    std::map<stream_id, send_stream> send_streams;

    // Held across collection and delivery so chunks reach the handler in order
    std::mutex delivery_mutex;

    mutable std::mutex recv_mutex;
    std::map<stream_id, recv_stream> recv_streams;

    std::mutex handler_mutex;
    delivery_handler handler;

    mutable std::mutex stats_mutex;
    continuity_statistics stats;

    impl(segment_sender s, continuity_config cfg)
        : sender(std::move(s)), config(std::move(cfg)) {}

    /**
     * @brief Split a range into frames no larger than max_segment_size
     */
    void segment(stream_id id, const send_stream& stream, byte_range range,
                 std::vector<stream_frame>& out) const {
        uint64_t cursor = range.offset;
        while (cursor < range.end()) {
            auto length = std::min<uint64_t>(config.max_segment_size, range.end() - cursor);
            stream_frame frame;
            frame.stream = id;
            frame.offset = cursor;
            frame.data = stream.slice(cursor, length);
            frame.fin = stream.fin_offset && *stream.fin_offset == cursor + length;
            out.push_back(std::move(frame));
            cursor += length;
        }
    }

    /**
     * @brief Queue never-sent bytes of a stream for a path
     */
    auto take_queued(stream_id id, send_stream& stream, path_id path,
                     std::vector<stream_frame>& out) const -> uint64_t {
        uint64_t queued = 0;
        if (stream.sent_offset < stream.write_offset) {
            byte_range range{stream.sent_offset, stream.write_offset - stream.sent_offset};
            segment(id, stream, range, out);
            stream.in_flight[path].add(range);
            stream.sent_offset = stream.write_offset;
            queued = range.length;
        }
        if (stream.fin_offset && !stream.fin_sent && stream.sent_offset == *stream.fin_offset) {
            if (queued == 0) {
                stream_frame frame;
                frame.stream = id;
                frame.offset = stream.sent_offset;
                frame.fin = true;
                out.push_back(std::move(frame));
            }
            stream.fin_sent = true;
        }
        return queued;
    }

    /**
     * @brief Move unacknowledged in-flight bytes onto target
     *
     * Takes the ranges of every path other than target, or of only one
     * path when from is set.
     */
    auto reschedule(stream_id id, send_stream& stream, const network_path& target,
                    std::optional<path_id> from, std::vector<stream_frame>& out) const
        -> uint64_t {
        range_set moving;
        for (auto it = stream.in_flight.begin(); it != stream.in_flight.end();) {
            if (it->first == target.id || (from && it->first != *from)) {
                ++it;
                continue;
            }
            for (const auto& range : it->second.ranges()) {
                moving.add(range);
            }
            it = stream.in_flight.erase(it);
        }

        uint64_t moved = 0;
        for (const auto& range : moving.ranges()) {
            for (const auto& gap : stream.acked.missing(stream.clip(range, stream.sent_offset))) {
                segment(id, stream, gap, out);
                stream.in_flight[target.id].add(gap);
                moved += gap.length;
            }
        }
        return moved;
    }

    auto transmit(const network_path& path, const std::vector<stream_frame>& frames)
        -> result<void> {
        for (const auto& frame : frames) {
            auto sent = sender(path, frame);
            if (!sent) {
                PM_LOG_WARN(log_category::bridge,
                    "STREAM send on " + path.to_string() + " failed: " + sent.error().message);
                return sent;
            }
        }
        return {};
    }

    void deliver(stream_id id, uint64_t offset, std::span<const std::byte> data, bool fin) {
        delivery_handler current;
        {
            std::lock_guard lock(handler_mutex);
            current = handler;
        }
        if (current) {
            current(id, offset, data, fin);
        }
    }
};

transfer_continuity_bridge::transfer_continuity_bridge(segment_sender sender,
                                                       continuity_config config)
    : impl_(std::make_unique<impl>(std::move(sender), std::move(config))) {}

transfer_continuity_bridge::~transfer_continuity_bridge() = default;

auto transfer_continuity_bridge::write(stream_id stream, std::span<const std::byte> data,
                                       bool fin) -> result<uint64_t> {
    std::lock_guard lock(impl_->send_mutex);
    auto& state = impl_->send_streams[stream];
    if (state.fin_offset) {
        return unexpected(error(error_code::invalid_range,
            "Stream " + std::to_string(stream) + " already finished"));
    }

    auto start = state.write_offset;
    state.buffer.insert(state.buffer.end(), data.begin(), data.end());
    state.write_offset += data.size();
    if (fin) {
        state.fin_offset = state.write_offset;
    }

    std::lock_guard stats_lock(impl_->stats_mutex);
    impl_->stats.bytes_written += data.size();
    return start;
}

auto transfer_continuity_bridge::flush(const network_path& path) -> result<uint64_t> {
    std::vector<stream_frame> frames;
    uint64_t total = 0;
    {
        std::lock_guard lock(impl_->send_mutex);
        for (auto& [id, state] : impl_->send_streams) {
            total += impl_->take_queued(id, state, path.id, frames);
        }
    }

    if (frames.empty()) {
        return total;
    }

    {
        std::lock_guard lock(impl_->stats_mutex);
        impl_->stats.bytes_sent += total;
    }

    auto sent = impl_->transmit(path, frames);
    if (!sent) {
        return unexpected(sent.error());
    }
    return total;
}

auto transfer_continuity_bridge::on_ack(stream_id stream, byte_range range) -> result<void> {
    std::lock_guard lock(impl_->send_mutex);
    auto it = impl_->send_streams.find(stream);
    if (it == impl_->send_streams.end()) {
        return unexpected(error(error_code::unknown_stream,
            "ACK for unknown stream " + std::to_string(stream)));
    }

    auto& state = it->second;
    if (range.end() > state.sent_offset) {
        return unexpected(error(error_code::invalid_range,
            "ACK beyond sent data on stream " + std::to_string(stream)));
    }

    auto clipped = state.clip(range, state.sent_offset);
    if (clipped.empty()) {
        return {};
    }

    auto newly = state.acked.add(clipped);

    // Release the acknowledged prefix
    auto prefix = state.acked.contiguous_end(state.base_offset);
    if (prefix > state.base_offset) {
        state.buffer.erase(state.buffer.begin(),
                           state.buffer.begin() + static_cast<std::ptrdiff_t>(prefix - state.base_offset));
        state.base_offset = prefix;
        state.acked.erase_below(prefix);
        for (auto& [path, ranges] : state.in_flight) {
            ranges.erase_below(prefix);
        }
    }

    std::lock_guard stats_lock(impl_->stats_mutex);
    impl_->stats.bytes_acked += newly;
    return {};
}

auto transfer_continuity_bridge::pending_unacked(stream_id stream) const
    -> result<std::vector<byte_range>> {
    std::lock_guard lock(impl_->send_mutex);
    auto it = impl_->send_streams.find(stream);
    if (it == impl_->send_streams.end()) {
        return unexpected(error(error_code::unknown_stream,
            "Unknown stream " + std::to_string(stream)));
    }

    const auto& state = it->second;
    return state.acked.missing({state.base_offset, state.write_offset - state.base_offset});
}

auto transfer_continuity_bridge::resend(stream_id stream, byte_range range,
                                        const network_path& path) -> result<uint64_t> {
    std::vector<stream_frame> frames;
    uint64_t total = 0;
    {
        std::lock_guard lock(impl_->send_mutex);
        auto it = impl_->send_streams.find(stream);
        if (it == impl_->send_streams.end()) {
            return unexpected(error(error_code::unknown_stream,
                "Unknown stream " + std::to_string(stream)));
        }

        auto& state = it->second;
        if (range.end() > state.write_offset) {
            return unexpected(error(error_code::invalid_range,
                "Resend range beyond written data on stream " + std::to_string(stream)));
        }

        for (const auto& gap : state.acked.missing(state.clip(range, state.sent_offset))) {
            impl_->segment(stream, state, gap, frames);
            state.in_flight[path.id].add(gap);
            total += gap.length;
        }
    }

    if (frames.empty()) {
        return total;
    }

    {
        std::lock_guard lock(impl_->stats_mutex);
        impl_->stats.bytes_retransmitted += total;
    }

    auto sent = impl_->transmit(path, frames);
    if (!sent) {
        return unexpected(sent.error());
    }
    return total;
}

auto transfer_continuity_bridge::on_path_switch(path_id old_path, const network_path& new_path)
    -> result<uint64_t> {
    std::vector<stream_frame> frames;
    uint64_t moved = 0;
    uint64_t queued = 0;
    {
        std::lock_guard lock(impl_->send_mutex);
        for (auto& [id, state] : impl_->send_streams) {
            moved += impl_->reschedule(id, state, new_path, std::nullopt, frames);
            queued += impl_->take_queued(id, state, new_path.id, frames);
        }
    }

    {
        std::lock_guard lock(impl_->stats_mutex);
        impl_->stats.path_switches++;
        impl_->stats.bytes_rescheduled += moved + queued;
        impl_->stats.bytes_retransmitted += moved;
        impl_->stats.bytes_sent += queued;
    }

    path_log_context ctx;
    ctx.path_id = new_path.id.value;
    ctx.remote_address = new_path.remote.to_string();
    ctx.bytes = moved + queued;
    PM_LOG_INFO_CTX(log_category::bridge,
        "Re-scheduled unacknowledged bytes from path #" + std::to_string(old_path.value) +
        " onto new path", ctx);

    if (!frames.empty()) {
        auto sent = impl_->transmit(new_path, frames);
        if (!sent) {
            return unexpected(sent.error());
        }
    }
    return moved + queued;
}

auto transfer_continuity_bridge::on_path_closed(path_id closed, const network_path& active)
    -> result<uint64_t> {
    if (closed == active.id) {
        return unexpected(error(error_code::invalid_range,
            "Path #" + std::to_string(closed.value) + " is the active path"));
    }

    std::vector<stream_frame> frames;
    uint64_t moved = 0;
    {
        std::lock_guard lock(impl_->send_mutex);
        for (auto& [id, state] : impl_->send_streams) {
            moved += impl_->reschedule(id, state, active, closed, frames);
        }
    }

    if (frames.empty()) {
        return moved;
    }

    {
        std::lock_guard lock(impl_->stats_mutex);
        impl_->stats.bytes_retransmitted += moved;
    }
    PM_LOG_DEBUG(log_category::bridge,
        "Path #" + std::to_string(closed.value) + " closed with " + std::to_string(moved) +
        " unacknowledged byte(s), resending on path #" + std::to_string(active.id.value));

    auto sent = impl_->transmit(active, frames);
    if (!sent) {
        return unexpected(sent.error());
    }
    return moved;
}

auto transfer_continuity_bridge::tracked_paths(stream_id stream) const -> std::size_t {
    std::lock_guard lock(impl_->send_mutex);
    auto it = impl_->send_streams.find(stream);
    return it == impl_->send_streams.end() ? 0 : it->second.in_flight.size();
}

auto transfer_continuity_bridge::all_acked(stream_id stream) const -> bool {
    std::lock_guard lock(impl_->send_mutex);
    auto it = impl_->send_streams.find(stream);
    if (it == impl_->send_streams.end()) {
        return true;
    }
    return it->second.base_offset == it->second.write_offset;
}

auto transfer_continuity_bridge::write_offset(stream_id stream) const -> uint64_t {
    std::lock_guard lock(impl_->send_mutex);
    auto it = impl_->send_streams.find(stream);
    return it == impl_->send_streams.end() ? 0 : it->second.write_offset;
}

void transfer_continuity_bridge::on_delivery(delivery_handler handler) {
    std::lock_guard lock(impl_->handler_mutex);
    impl_->handler = std::move(handler);
}

auto transfer_continuity_bridge::on_stream_frame(stream_id stream, uint64_t offset,
                                                 std::span<const std::byte> data, bool fin)
    -> result<void> {
    std::lock_guard delivery_lock(impl_->delivery_mutex);
    std::vector<ready_chunk> ready;
    uint64_t duplicates = 0;
    uint64_t delivered = 0;

    {
        std::lock_guard lock(impl_->recv_mutex);
        auto& state = impl_->recv_streams[stream];
        const uint64_t end = offset + data.size();

        if (fin) {
            if (state.fin_offset && *state.fin_offset != end) {
                return unexpected(error(error_code::invalid_range,
                    "Conflicting FIN on stream " + std::to_string(stream)));
            }
            state.fin_offset = end;
        }
        if (state.fin_offset && end > *state.fin_offset) {
            return unexpected(error(error_code::invalid_range,
                "Data beyond FIN on stream " + std::to_string(stream)));
        }

        if (end <= state.delivered) {
            duplicates += data.size();
        } else {
            auto skip = state.delivered > offset ? state.delivered - offset : 0;
            duplicates += skip;
            auto& slot = state.pending[offset + skip];
            if (slot.size() < data.size() - skip) {
                slot.assign(data.begin() + static_cast<std::ptrdiff_t>(skip), data.end());
            }
        }

        while (!state.pending.empty() && state.pending.begin()->first <= state.delivered) {
            auto node = state.pending.extract(state.pending.begin());
            auto chunk_offset = node.key();
            auto chunk_end = chunk_offset + node.mapped().size();

            if (chunk_end <= state.delivered) {
                duplicates += node.mapped().size();
                continue;
            }

            ready_chunk chunk;
            chunk.offset = state.delivered;
            chunk.skip = static_cast<std::size_t>(state.delivered - chunk_offset);
            chunk.fin = state.fin_offset && *state.fin_offset == chunk_end;
            chunk.data = std::move(node.mapped());
            duplicates += chunk.skip;
            delivered += chunk.data.size() - chunk.skip;

            state.delivered = chunk_end;
            if (chunk.fin) {
                state.fin_delivered = true;
            }
            ready.push_back(std::move(chunk));
        }

        if (state.fin_offset && !state.fin_delivered && state.delivered == *state.fin_offset) {
            state.fin_delivered = true;
            ready_chunk chunk;
            chunk.offset = state.delivered;
            chunk.fin = true;
            ready.push_back(std::move(chunk));
        }
    }

    {
        std::lock_guard stats_lock(impl_->stats_mutex);
        impl_->stats.bytes_delivered += delivered;
        impl_->stats.duplicate_bytes_dropped += duplicates;
    }

    for (const auto& chunk : ready) {
        impl_->deliver(stream, chunk.offset,
                       std::span<const std::byte>(chunk.data.data() + chunk.skip,
                                                  chunk.data.size() - chunk.skip),
                       chunk.fin);
    }
    return {};
}

auto transfer_continuity_bridge::delivered_offset(stream_id stream) const -> uint64_t {
    std::lock_guard lock(impl_->recv_mutex);
    auto it = impl_->recv_streams.find(stream);
    return it == impl_->recv_streams.end() ? 0 : it->second.delivered;
}

auto transfer_continuity_bridge::is_finished(stream_id stream) const -> bool {
    std::lock_guard lock(impl_->recv_mutex);
    auto it = impl_->recv_streams.find(stream);
    return it != impl_->recv_streams.end() && it->second.fin_delivered;
}

auto transfer_continuity_bridge::get_statistics() const -> continuity_statistics {
    std::lock_guard lock(impl_->stats_mutex);
    return impl_->stats;
}

auto transfer_continuity_bridge::config() const -> const continuity_config& {
    return impl_->config;
}

}  // namespace kcenon::path_migration

/**
 * @file path_frames.cpp
 * @brief Packet envelope encoding and decoding
 */

#include "kcenon/path_migration/transport/path_frames.h"
#include "kcenon/path_migration/core/connection_id.h"

#include <algorithm>
#include <type_traits>

namespace kcenon::path_migration {

namespace {

constexpr uint8_t fin_flag = 0x01;

// Big-endian helpers
void write_u8(std::vector<std::byte>& out, uint8_t value) {
    out.push_back(static_cast<std::byte>(value));
}

void write_u16(std::vector<std::byte>& out, uint16_t value) {
    out.push_back(static_cast<std::byte>((value >> 8) & 0xFF));
    out.push_back(static_cast<std::byte>(value & 0xFF));
}

void write_u64(std::vector<std::byte>& out, uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<std::byte>((value >> shift) & 0xFF));
    }
}

void write_bytes(std::vector<std::byte>& out, std::span<const std::byte> data) {
    out.insert(out.end(), data.begin(), data.end());
}

/**
 * @brief Bounds-checked cursor over an input buffer
 */
class reader {
public:
    explicit reader(std::span<const std::byte> data) : data_(data) {}

    auto u8(uint8_t& value) -> bool {
        if (remaining() < 1) return false;
        value = static_cast<uint8_t>(data_[pos_++]);
        return true;
    }

    auto u16(uint16_t& value) -> bool {
        if (remaining() < 2) return false;
        value = static_cast<uint16_t>(
            (static_cast<uint16_t>(data_[pos_]) << 8) |
            static_cast<uint16_t>(data_[pos_ + 1]));
        pos_ += 2;
        return true;
    }

    auto u64(uint64_t& value) -> bool {
        if (remaining() < 8) return false;
        value = 0;
        for (int i = 0; i < 8; ++i) {
            value = (value << 8) | static_cast<uint64_t>(data_[pos_ + i]);
        }
        pos_ += 8;
        return true;
    }

    auto bytes(std::size_t count, std::vector<std::byte>& out) -> bool {
        if (remaining() < count) return false;
        out.assign(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                   data_.begin() + static_cast<std::ptrdiff_t>(pos_ + count));
        pos_ += count;
        return true;
    }

    auto token(path_token& out) -> bool {
        if (remaining() < out.size()) return false;
        std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(pos_), out.size(), out.begin());
        pos_ += out.size();
        return true;
    }

    [[nodiscard]] auto remaining() const -> std::size_t { return data_.size() - pos_; }

private:
    std::span<const std::byte> data_;
    std::size_t pos_ = 0;
};

auto malformed(const std::string& what) -> unexpected {
    return unexpected(error(error_code::malformed_frame, what));
}

void encode_body(std::vector<std::byte>& out, const path_frame& frame) {
    std::visit([&out](const auto& f) {
        using frame_t = std::decay_t<decltype(f)>;
        if constexpr (std::is_same_v<frame_t, stream_frame>) {
            write_u64(out, f.stream);
            write_u64(out, f.offset);
            write_u8(out, f.fin ? fin_flag : 0);
            write_u16(out, static_cast<uint16_t>(f.data.size()));
            write_bytes(out, f.data);
        } else if constexpr (std::is_same_v<frame_t, ack_frame>) {
            write_u64(out, f.stream);
            write_u64(out, f.offset);
            write_u64(out, f.length);
        } else if constexpr (std::is_same_v<frame_t, new_connection_id_frame>) {
            write_u64(out, f.sequence);
            write_u64(out, f.retire_prior_to);
            write_u8(out, static_cast<uint8_t>(f.connection_id.size()));
            write_bytes(out, f.connection_id);
        } else if constexpr (std::is_same_v<frame_t, retire_connection_id_frame>) {
            write_u64(out, f.sequence);
        } else {
            write_bytes(out, f.token);
        }
    }, frame);
}

auto decode_body(frame_type type, reader& in) -> result<path_frame> {
    switch (type) {
        case frame_type::stream: {
            stream_frame f;
            uint8_t flags = 0;
            uint16_t length = 0;
            if (!in.u64(f.stream) || !in.u64(f.offset) || !in.u8(flags) ||
                !in.u16(length) || !in.bytes(length, f.data)) {
                return malformed("Truncated STREAM frame");
            }
            f.fin = (flags & fin_flag) != 0;
            return path_frame{std::move(f)};
        }
        case frame_type::ack: {
            ack_frame f;
            if (!in.u64(f.stream) || !in.u64(f.offset) || !in.u64(f.length)) {
                return malformed("Truncated ACK frame");
            }
            return path_frame{f};
        }
        case frame_type::new_connection_id: {
            new_connection_id_frame f;
            uint8_t length = 0;
            if (!in.u64(f.sequence) || !in.u64(f.retire_prior_to) || !in.u8(length)) {
                return malformed("Truncated NEW_CONNECTION_ID frame");
            }
            if (length < min_connection_id_length || length > max_connection_id_length) {
                return malformed("NEW_CONNECTION_ID with invalid length");
            }
            if (!in.bytes(length, f.connection_id)) {
                return malformed("Truncated NEW_CONNECTION_ID frame");
            }
            return path_frame{std::move(f)};
        }
        case frame_type::retire_connection_id: {
            retire_connection_id_frame f;
            if (!in.u64(f.sequence)) {
                return malformed("Truncated RETIRE_CONNECTION_ID frame");
            }
            return path_frame{f};
        }
        case frame_type::path_challenge: {
            path_challenge_frame f;
            if (!in.token(f.token)) {
                return malformed("Truncated PATH_CHALLENGE frame");
            }
            return path_frame{f};
        }
        case frame_type::path_response: {
            path_response_frame f;
            if (!in.token(f.token)) {
                return malformed("Truncated PATH_RESPONSE frame");
            }
            return path_frame{f};
        }
    }
    return malformed("Unknown frame type");
}

auto is_known_type(uint8_t value) -> bool {
    switch (static_cast<frame_type>(value)) {
        case frame_type::ack:
        case frame_type::stream:
        case frame_type::new_connection_id:
        case frame_type::retire_connection_id:
        case frame_type::path_challenge:
        case frame_type::path_response:
            return true;
    }
    return false;
}

}  // namespace

auto type_of(const path_frame& frame) -> frame_type {
    return std::visit([](const auto& f) {
        using frame_t = std::decay_t<decltype(f)>;
        if constexpr (std::is_same_v<frame_t, stream_frame>) return frame_type::stream;
        else if constexpr (std::is_same_v<frame_t, ack_frame>) return frame_type::ack;
        else if constexpr (std::is_same_v<frame_t, new_connection_id_frame>) return frame_type::new_connection_id;
        else if constexpr (std::is_same_v<frame_t, retire_connection_id_frame>) return frame_type::retire_connection_id;
        else if constexpr (std::is_same_v<frame_t, path_challenge_frame>) return frame_type::path_challenge;
        else return frame_type::path_response;
    }, frame);
}

auto encode_packet(std::span<const std::byte> destination_cid,
                   const path_frame& frame) -> std::vector<std::byte> {
    std::vector<std::byte> out;
    out.reserve(2 + destination_cid.size() + 32);
    write_u8(out, short_header_type);
    write_u8(out, static_cast<uint8_t>(destination_cid.size()));
    write_bytes(out, destination_cid);
    write_u8(out, static_cast<uint8_t>(type_of(frame)));
    encode_body(out, frame);
    return out;
}

auto decode_packet(std::span<const std::byte> packet) -> result<decoded_packet> {
    reader in(packet);

    uint8_t header = 0;
    uint8_t cid_length = 0;
    if (!in.u8(header) || header != short_header_type) {
        return malformed("Missing short header");
    }
    if (!in.u8(cid_length) || cid_length > max_connection_id_length) {
        return malformed("Invalid destination connection ID length");
    }

    decoded_packet decoded;
    if (!in.bytes(cid_length, decoded.destination_cid)) {
        return malformed("Truncated destination connection ID");
    }

    uint8_t type = 0;
    if (!in.u8(type) || !is_known_type(type)) {
        return malformed("Unknown frame type");
    }

    auto frame = decode_body(static_cast<frame_type>(type), in);
    if (!frame) {
        return unexpected(frame.error());
    }
    if (in.remaining() != 0) {
        return malformed("Trailing bytes after frame");
    }

    decoded.frame = std::move(frame.value());
    return decoded;
}

}  // namespace kcenon::path_migration

/**
 * @file path_frames.h
 * @brief Minimal packet envelope and control frames for path migration
 *
 * A packet is a short header followed by exactly one frame:
 *
 *   [0x40][dcid length : 1][dcid][frame type : 1][frame body]
 *
 * All integers are big-endian and fixed width.
 */

#ifndef KCENON_PATH_MIGRATION_TRANSPORT_PATH_FRAMES_H
#define KCENON_PATH_MIGRATION_TRANSPORT_PATH_FRAMES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <variant>
#include <vector>

#include "kcenon/path_migration/core/types.h"

namespace kcenon::path_migration {

/// Short header type byte
inline constexpr uint8_t short_header_type = 0x40;

/// Size of PATH_CHALLENGE / PATH_RESPONSE data
inline constexpr std::size_t path_token_size = 8;

using path_token = std::array<std::byte, path_token_size>;

/**
 * @brief Frame type codes
 */
enum class frame_type : uint8_t {
    ack = 0x02,
    stream = 0x08,
    new_connection_id = 0x18,
    retire_connection_id = 0x19,
    path_challenge = 0x1a,
    path_response = 0x1b
};

[[nodiscard]] constexpr auto to_string(frame_type type) -> const char* {
    switch (type) {
        case frame_type::ack: return "ACK";
        case frame_type::stream: return "STREAM";
        case frame_type::new_connection_id: return "NEW_CONNECTION_ID";
        case frame_type::retire_connection_id: return "RETIRE_CONNECTION_ID";
        case frame_type::path_challenge: return "PATH_CHALLENGE";
        case frame_type::path_response: return "PATH_RESPONSE";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Application data at a stream offset
 */
struct stream_frame {
    stream_id stream = 0;
    uint64_t offset = 0;
    bool fin = false;
    std::vector<std::byte> data;
};

/**
 * @brief Acknowledgment of a stream byte range
 */
struct ack_frame {
    stream_id stream = 0;
    uint64_t offset = 0;
    uint64_t length = 0;
};

struct new_connection_id_frame {
    uint64_t sequence = 0;
    uint64_t retire_prior_to = 0;
    std::vector<std::byte> connection_id;
};

struct retire_connection_id_frame {
    uint64_t sequence = 0;
};

struct path_challenge_frame {
    path_token token{};
};

struct path_response_frame {
    path_token token{};
};

using path_frame = std::variant<stream_frame,
                                ack_frame,
                                new_connection_id_frame,
                                retire_connection_id_frame,
                                path_challenge_frame,
                                path_response_frame>;

/**
 * @brief Type code of a frame
 */
[[nodiscard]] auto type_of(const path_frame& frame) -> frame_type;

/**
 * @brief Decoded packet
 */
struct decoded_packet {
    std::vector<std::byte> destination_cid;
    path_frame frame;
};

/**
 * @brief Serialize one frame behind a short header
 */
[[nodiscard]] auto encode_packet(std::span<const std::byte> destination_cid,
                                 const path_frame& frame) -> std::vector<std::byte>;

/**
 * @brief Parse a packet produced by encode_packet()
 * @return malformed_frame on truncated, oversized or unknown input
 */
[[nodiscard]] auto decode_packet(std::span<const std::byte> packet) -> result<decoded_packet>;

}  // namespace kcenon::path_migration

#endif  // KCENON_PATH_MIGRATION_TRANSPORT_PATH_FRAMES_H

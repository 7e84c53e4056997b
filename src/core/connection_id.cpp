/**
 * @file connection_id.cpp
 * @brief Connection ID helpers
 */

#include "kcenon/path_migration/core/connection_id.h"

namespace kcenon::path_migration {

auto to_hex(std::span<const std::byte> data) -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (auto byte : data) {
        result.push_back(hex_chars[static_cast<uint8_t>(byte) >> 4]);
        result.push_back(hex_chars[static_cast<uint8_t>(byte) & 0x0F]);
    }
    return result;
}

auto connection_id::to_hex() const -> std::string {
    return path_migration::to_hex(bytes);
}

}  // namespace kcenon::path_migration

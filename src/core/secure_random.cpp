/**
 * @file secure_random.cpp
 * @brief OpenSSL backed random generation
 */

#include "kcenon/path_migration/core/secure_random.h"

#include <openssl/rand.h>

#include <limits>

namespace kcenon::path_migration {

auto fill_random(std::byte* data, std::size_t size) -> result<void> {
    if (data == nullptr || size == 0) {
        return unexpected(error(error_code::invalid_configuration, "Size must be positive"));
    }
    if (size > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        return unexpected(error(error_code::invalid_configuration, "Size too large"));
    }

    if (RAND_bytes(reinterpret_cast<unsigned char*>(data), static_cast<int>(size)) != 1) {
        return unexpected(error(error_code::internal_error, "Failed to generate random bytes"));
    }
    return {};
}

auto generate_random_bytes(std::size_t size) -> result<std::vector<std::byte>> {
    if (size == 0) {
        return unexpected(error(error_code::invalid_configuration, "Size must be positive"));
    }

    std::vector<std::byte> bytes(size);
    auto filled = fill_random(bytes.data(), bytes.size());
    if (!filled) {
        return unexpected(filled.error());
    }
    return bytes;
}

}  // namespace kcenon::path_migration

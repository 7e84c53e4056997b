/**
 * @file secure_random.h
 * @brief Cryptographically secure random bytes for IDs and challenge tokens
 */

#ifndef KCENON_PATH_MIGRATION_CORE_SECURE_RANDOM_H
#define KCENON_PATH_MIGRATION_CORE_SECURE_RANDOM_H

#include <cstddef>
#include <vector>

#include "kcenon/path_migration/core/types.h"

namespace kcenon::path_migration {

/**
 * @brief Generate random bytes using OpenSSL RAND_bytes
 * @param size Number of bytes (must be positive)
 * @return Random bytes or error
 */
[[nodiscard]] auto generate_random_bytes(std::size_t size)
    -> result<std::vector<std::byte>>;

/**
 * @brief Fill an existing buffer with random bytes
 */
[[nodiscard]] auto fill_random(std::byte* data, std::size_t size) -> result<void>;

}  // namespace kcenon::path_migration

#endif  // KCENON_PATH_MIGRATION_CORE_SECURE_RANDOM_H

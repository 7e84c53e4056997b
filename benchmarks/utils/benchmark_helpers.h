/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_PATH_MIGRATION_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_PATH_MIGRATION_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

#include <kcenon/path_migration/connection/network_path.h>

namespace kcenon::path_migration::benchmark {

/**
 * @brief Helper class for generating test data for benchmarks
 */
class test_data_generator {
public:
    /**
     * @brief Generate random binary data
     * @param size Size in bytes
     * @param seed Random seed (0 for random)
     * @return Vector of random bytes
     */
    static auto generate_random_data(std::size_t size, uint32_t seed = 0)
        -> std::vector<std::byte>;

    /**
     * @brief Generate a connection ID that differs for every index
     */
    static auto generate_connection_id(uint64_t index, std::size_t length = 8)
        -> std::vector<std::byte>;
};

/**
 * @brief Validated path with fixed addresses
 */
auto make_bench_path(uint32_t id) -> network_path;

/**
 * @brief Common sizes used in benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_transfer = 64 * KB;
constexpr std::size_t medium_transfer = 1 * MB;
constexpr std::size_t large_transfer = 16 * MB;

constexpr std::size_t default_segment = 1200;
}  // namespace sizes

}  // namespace kcenon::path_migration::benchmark

#endif  // KCENON_PATH_MIGRATION_BENCHMARKS_BENCHMARK_HELPERS_H

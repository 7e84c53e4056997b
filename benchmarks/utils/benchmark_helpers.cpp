/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

namespace kcenon::path_migration::benchmark {

auto test_data_generator::generate_random_data(std::size_t size, uint32_t seed)
    -> std::vector<std::byte> {
    std::vector<std::byte> data(size);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    for (auto& byte : data) {
        byte = static_cast<std::byte>(dis(gen));
    }

    return data;
}

auto test_data_generator::generate_connection_id(uint64_t index, std::size_t length)
    -> std::vector<std::byte> {
    std::vector<std::byte> bytes(length, std::byte{0});
    for (std::size_t i = 0; i < length && i < sizeof(index); ++i) {
        bytes[length - 1 - i] = static_cast<std::byte>((index >> (8 * i)) & 0xFF);
    }
    return bytes;
}

auto make_bench_path(uint32_t id) -> network_path {
    network_path path;
    path.id = path_id{id};
    path.local = {"10.0.0." + std::to_string(id + 2), 5000};
    path.remote = {"203.0.113.5", 4433};
    path.state = path_state::validated;
    return path;
}

}  // namespace kcenon::path_migration::benchmark

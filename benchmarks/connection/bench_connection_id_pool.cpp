/**
 * @file bench_connection_id_pool.cpp
 * @brief Benchmarks for connection ID allocation, lookup and retirement
 */

#include <benchmark/benchmark.h>

#include <kcenon/path_migration/connection/connection_id_pool.h>

#include "utils/benchmark_helpers.h"

namespace kcenon::path_migration::benchmark {

/**
 * @brief One migration's worth of ID churn: allocate, bind, retire
 */
static void BM_ConnectionIdPool_AllocateRetire(::benchmark::State& state) {
    connection_id_pool_config config;
    config.max_local_ids = 8;
    connection_id_pool pool(config);

    for (auto _ : state) {
        auto id = pool.allocate_local();
        if (!id) {
            state.SkipWithError("Allocation failed");
            return;
        }
        auto bound = pool.set_active(path_id{1}, id_issuer::local, id.value().sequence);
        auto retired = pool.retire(id_issuer::local, id.value().sequence);
        if (!bound || !retired) {
            state.SkipWithError("Bind or retire failed");
            return;
        }
        ::benchmark::DoNotOptimize(id.value());
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Destination ID lookup on the receive path
 */
static void BM_ConnectionIdPool_FindLocal(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));

    connection_id_pool_config config;
    config.max_local_ids = count + 1;
    connection_id_pool pool(config);

    std::vector<connection_id> ids;
    for (std::size_t i = 0; i < count; ++i) {
        auto id = pool.allocate_local();
        if (!id) {
            state.SkipWithError("Allocation failed");
            return;
        }
        ids.push_back(id.value());
    }

    std::size_t index = 0;
    for (auto _ : state) {
        auto found = pool.find_local(ids[index % ids.size()].bytes);
        ::benchmark::DoNotOptimize(found);
        ++index;
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Peer ID registration followed by claim and retirement
 */
static void BM_ConnectionIdPool_RegisterClaimPeer(::benchmark::State& state) {
    connection_id_pool_config config;
    config.max_peer_ids = 8;
    connection_id_pool pool(config);

    uint64_t sequence = 0;
    for (auto _ : state) {
        auto registered = pool.register_peer(
            test_data_generator::generate_connection_id(sequence), sequence);
        auto claimed = pool.claim_peer();
        if (!registered || !claimed) {
            state.SkipWithError("Peer ID churn failed");
            return;
        }
        auto retired = pool.retire(id_issuer::peer, claimed.value().sequence);
        ::benchmark::DoNotOptimize(retired);
        ++sequence;
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_ConnectionIdPool_AllocateRetire)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_ConnectionIdPool_FindLocal)
    ->Arg(2)
    ->Arg(8)
    ->Arg(64)
    ->Unit(::benchmark::kNanosecond);

BENCHMARK(BM_ConnectionIdPool_RegisterClaimPeer)
    ->Unit(::benchmark::kMicrosecond);

}  // namespace kcenon::path_migration::benchmark

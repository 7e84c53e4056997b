/**
 * @file bench_transfer_continuity_bridge.cpp
 * @brief Benchmarks for stream buffering, path switching and reassembly
 */

#include <benchmark/benchmark.h>

#include <kcenon/path_migration/continuity/transfer_continuity_bridge.h>

#include "utils/benchmark_helpers.h"

#include <algorithm>
#include <random>

namespace kcenon::path_migration::benchmark {

namespace {

auto null_sender() -> segment_sender {
    return [](const network_path&, const stream_frame& frame) -> result<void> {
        ::benchmark::DoNotOptimize(frame.data.data());
        return {};
    };
}

}  // namespace

/**
 * @brief write + flush + cumulative ACK of a whole transfer
 */
static void BM_Bridge_WriteFlushAck(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    auto data = test_data_generator::generate_random_data(size, 42);
    auto path = make_bench_path(0);

    for (auto _ : state) {
        transfer_continuity_bridge bridge(null_sender());
        auto written = bridge.write(0, data, true);
        auto flushed = bridge.flush(path);
        auto acked = bridge.on_ack(0, byte_range{0, size});
        if (!written || !flushed || !acked) {
            state.SkipWithError("Transfer failed");
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Moving every unacknowledged byte to a new path
 */
static void BM_Bridge_PathSwitch(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    auto data = test_data_generator::generate_random_data(size, 42);
    auto old_path = make_bench_path(0);
    auto new_path = make_bench_path(1);

    for (auto _ : state) {
        state.PauseTiming();
        transfer_continuity_bridge bridge(null_sender());
        auto written = bridge.write(0, data, true);
        auto flushed = bridge.flush(old_path);
        state.ResumeTiming();

        auto moved = bridge.on_path_switch(old_path.id, new_path);
        if (!written || !flushed || !moved) {
            state.SkipWithError("Path switch failed");
            return;
        }
        ::benchmark::DoNotOptimize(moved.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Receive-side reassembly of shuffled segments
 */
static void BM_Bridge_ReassembleShuffled(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    const auto segment = sizes::default_segment;
    auto data = test_data_generator::generate_random_data(size, 42);

    std::vector<uint64_t> offsets;
    for (uint64_t offset = 0; offset < size; offset += segment) {
        offsets.push_back(offset);
    }
    std::shuffle(offsets.begin(), offsets.end(), std::mt19937(7));

    for (auto _ : state) {
        transfer_continuity_bridge bridge(null_sender());
        for (auto offset : offsets) {
            auto length = std::min<uint64_t>(segment, size - offset);
            std::span<const std::byte> slice(data.data() + offset, length);
            auto received = bridge.on_stream_frame(0, offset, slice, offset + length == size);
            if (!received) {
                state.SkipWithError("Reassembly failed");
                return;
            }
        }
        ::benchmark::DoNotOptimize(bridge.delivered_offset(0));
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_Bridge_WriteFlushAck)
    ->Arg(static_cast<int64_t>(sizes::small_transfer))
    ->Arg(static_cast<int64_t>(sizes::medium_transfer))
    ->Arg(static_cast<int64_t>(sizes::large_transfer))
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Bridge_PathSwitch)
    ->Arg(static_cast<int64_t>(sizes::small_transfer))
    ->Arg(static_cast<int64_t>(sizes::medium_transfer))
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Bridge_ReassembleShuffled)
    ->Arg(static_cast<int64_t>(sizes::small_transfer))
    ->Arg(static_cast<int64_t>(sizes::medium_transfer))
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::path_migration::benchmark

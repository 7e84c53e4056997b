/**
 * @file bench_path_frames.cpp
 * @brief Benchmarks for packet encoding and decoding
 */

#include <benchmark/benchmark.h>

#include <kcenon/path_migration/transport/path_frames.h>

#include "utils/benchmark_helpers.h"

namespace kcenon::path_migration::benchmark {

static void BM_PathFrames_EncodeStream(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    auto dcid = test_data_generator::generate_connection_id(1);

    stream_frame frame;
    frame.stream = 0;
    frame.offset = 1 << 20;
    frame.data = test_data_generator::generate_random_data(size, 42);

    for (auto _ : state) {
        auto packet = encode_packet(dcid, frame);
        ::benchmark::DoNotOptimize(packet.data());
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

static void BM_PathFrames_DecodeStream(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    auto dcid = test_data_generator::generate_connection_id(1);

    stream_frame frame;
    frame.data = test_data_generator::generate_random_data(size, 42);
    auto packet = encode_packet(dcid, frame);

    for (auto _ : state) {
        auto decoded = decode_packet(packet);
        if (!decoded) {
            state.SkipWithError("Decode failed");
            return;
        }
        ::benchmark::DoNotOptimize(decoded.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

static void BM_PathFrames_ChallengeRoundTrip(::benchmark::State& state) {
    auto dcid = test_data_generator::generate_connection_id(1);
    path_challenge_frame challenge;

    for (auto _ : state) {
        auto packet = encode_packet(dcid, challenge);
        auto decoded = decode_packet(packet);
        ::benchmark::DoNotOptimize(decoded);
    }
}

BENCHMARK(BM_PathFrames_EncodeStream)
    ->Arg(64)
    ->Arg(static_cast<int64_t>(sizes::default_segment))
    ->Unit(::benchmark::kNanosecond);

BENCHMARK(BM_PathFrames_DecodeStream)
    ->Arg(64)
    ->Arg(static_cast<int64_t>(sizes::default_segment))
    ->Unit(::benchmark::kNanosecond);

BENCHMARK(BM_PathFrames_ChallengeRoundTrip)
    ->Unit(::benchmark::kNanosecond);

}  // namespace kcenon::path_migration::benchmark

/**
 * @file test_transfer_continuity_bridge.cpp
 * @brief Unit tests for transfer_continuity_bridge
 */

#include <gtest/gtest.h>

#include <kcenon/path_migration/continuity/transfer_continuity_bridge.h>

#include <mutex>
#include <vector>

namespace kcenon::path_migration::test {

namespace {

auto payload(std::size_t size) -> std::vector<std::byte> {
    std::vector<std::byte> data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<std::byte>(i % 251);
    }
    return data;
}

auto make_path(uint32_t id) -> network_path {
    network_path path;
    path.id = path_id{id};
    path.remote = {"10.0.0.1", 4433};
    path.state = path_state::validated;
    return path;
}

struct sent_segment {
    path_id path;
    stream_frame frame;
};

}  // namespace

// =============================================================================
// Send side
// =============================================================================

class BridgeSendTest : public ::testing::Test {
protected:
    void SetUp() override {
        continuity_config config;
        config.max_segment_size = 100;
        bridge_ = std::make_unique<transfer_continuity_bridge>(
            [this](const network_path& path, const stream_frame& frame) -> result<void> {
                std::lock_guard lock(mutex_);
                sent_.push_back({path.id, frame});
                if (fail_sends_) {
                    return unexpected(error(error_code::send_failed, "down"));
                }
                return {};
            },
            config);
    }

    auto bytes_on(path_id path) -> uint64_t {
        std::lock_guard lock(mutex_);
        uint64_t total = 0;
        for (const auto& s : sent_) {
            if (s.path == path) {
                total += s.frame.data.size();
            }
        }
        return total;
    }

    std::unique_ptr<transfer_continuity_bridge> bridge_;
    std::mutex mutex_;
    std::vector<sent_segment> sent_;
    bool fail_sends_ = false;
};

TEST_F(BridgeSendTest, WriteReturnsOffsets) {
    auto data = payload(50);
    auto first = bridge_->write(0, data);
    auto second = bridge_->write(0, data);

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first.value(), 0u);
    EXPECT_EQ(second.value(), 50u);
    EXPECT_EQ(bridge_->write_offset(0), 100u);
}

TEST_F(BridgeSendTest, WriteAfterFinRejected) {
    auto data = payload(10);
    ASSERT_TRUE(bridge_->write(0, data, true).has_value());

    auto more = bridge_->write(0, data);
    ASSERT_FALSE(more.has_value());
    EXPECT_EQ(more.error().code, error_code::invalid_range);
}

TEST_F(BridgeSendTest, FlushSegmentsByMaxSize) {
    auto data = payload(250);
    ASSERT_TRUE(bridge_->write(0, data, true).has_value());

    auto flushed = bridge_->flush(make_path(0));
    ASSERT_TRUE(flushed.has_value());
    EXPECT_EQ(flushed.value(), 250u);

    ASSERT_EQ(sent_.size(), 3u);
    EXPECT_EQ(sent_[0].frame.offset, 0u);
    EXPECT_EQ(sent_[1].frame.offset, 100u);
    EXPECT_EQ(sent_[2].frame.offset, 200u);
    EXPECT_EQ(sent_[2].frame.data.size(), 50u);
    EXPECT_FALSE(sent_[1].frame.fin);
    EXPECT_TRUE(sent_[2].frame.fin);
}

TEST_F(BridgeSendTest, FlushSendsOnlyNewBytes) {
    auto data = payload(100);
    ASSERT_TRUE(bridge_->write(0, data).has_value());
    ASSERT_TRUE(bridge_->flush(make_path(0)).has_value());

    auto again = bridge_->flush(make_path(0));
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again.value(), 0u);
    EXPECT_EQ(sent_.size(), 1u);
}

TEST_F(BridgeSendTest, AckReleasesPrefix) {
    auto data = payload(200);
    ASSERT_TRUE(bridge_->write(0, data).has_value());
    ASSERT_TRUE(bridge_->flush(make_path(0)).has_value());

    ASSERT_TRUE(bridge_->on_ack(0, {0, 100}).has_value());
    auto pending = bridge_->pending_unacked(0);
    ASSERT_TRUE(pending.has_value());
    ASSERT_EQ(pending.value().size(), 1u);
    EXPECT_EQ(pending.value()[0], (byte_range{100, 100}));
    EXPECT_FALSE(bridge_->all_acked(0));

    ASSERT_TRUE(bridge_->on_ack(0, {100, 100}).has_value());
    EXPECT_TRUE(bridge_->all_acked(0));
    EXPECT_EQ(bridge_->get_statistics().bytes_acked, 200u);
}

TEST_F(BridgeSendTest, OutOfOrderAckLeavesGap) {
    auto data = payload(300);
    ASSERT_TRUE(bridge_->write(0, data).has_value());
    ASSERT_TRUE(bridge_->flush(make_path(0)).has_value());

    ASSERT_TRUE(bridge_->on_ack(0, {100, 100}).has_value());

    auto pending = bridge_->pending_unacked(0);
    ASSERT_TRUE(pending.has_value());
    ASSERT_EQ(pending.value().size(), 2u);
    EXPECT_EQ(pending.value()[0], (byte_range{0, 100}));
    EXPECT_EQ(pending.value()[1], (byte_range{200, 100}));
}

TEST_F(BridgeSendTest, DuplicateAckCountedOnce) {
    auto data = payload(100);
    ASSERT_TRUE(bridge_->write(0, data).has_value());
    ASSERT_TRUE(bridge_->flush(make_path(0)).has_value());

    ASSERT_TRUE(bridge_->on_ack(0, {0, 100}).has_value());
    ASSERT_TRUE(bridge_->on_ack(0, {0, 100}).has_value());
    EXPECT_EQ(bridge_->get_statistics().bytes_acked, 100u);
}

TEST_F(BridgeSendTest, AckUnknownStream) {
    auto acked = bridge_->on_ack(7, {0, 10});
    ASSERT_FALSE(acked.has_value());
    EXPECT_EQ(acked.error().code, error_code::unknown_stream);
}

TEST_F(BridgeSendTest, AckBeyondSentRejected) {
    auto data = payload(100);
    ASSERT_TRUE(bridge_->write(0, data).has_value());

    auto acked = bridge_->on_ack(0, {0, 10});
    ASSERT_FALSE(acked.has_value());
    EXPECT_EQ(acked.error().code, error_code::invalid_range);
}

TEST_F(BridgeSendTest, ResendSkipsAckedBytes) {
    auto data = payload(200);
    ASSERT_TRUE(bridge_->write(0, data).has_value());
    ASSERT_TRUE(bridge_->flush(make_path(0)).has_value());
    ASSERT_TRUE(bridge_->on_ack(0, {50, 50}).has_value());

    auto resent = bridge_->resend(0, {0, 200}, make_path(0));
    ASSERT_TRUE(resent.has_value());
    EXPECT_EQ(resent.value(), 150u);
    EXPECT_EQ(bridge_->get_statistics().bytes_retransmitted, 150u);
}

TEST_F(BridgeSendTest, PathSwitchMovesUnackedAndQueuedBytes) {
    auto data = payload(300);
    ASSERT_TRUE(bridge_->write(0, data).has_value());
    ASSERT_TRUE(bridge_->flush(make_path(0)).has_value());
    ASSERT_TRUE(bridge_->on_ack(0, {0, 100}).has_value());

    // Not yet flushed
    ASSERT_TRUE(bridge_->write(0, payload(50), true).has_value());

    auto moved = bridge_->on_path_switch(path_id{0}, make_path(1));

    ASSERT_TRUE(moved.has_value());
    EXPECT_EQ(moved.value(), 250u);
    EXPECT_EQ(bytes_on(path_id{1}), 250u);

    std::lock_guard lock(mutex_);
    std::vector<uint64_t> offsets;
    for (const auto& s : sent_) {
        if (s.path == path_id{1}) {
            offsets.push_back(s.frame.offset);
        }
    }
    EXPECT_EQ(offsets, (std::vector<uint64_t>{100, 200, 300}));
    EXPECT_TRUE(sent_.back().frame.fin);
}

TEST_F(BridgeSendTest, PathSwitchWithNothingPending) {
    auto moved = bridge_->on_path_switch(path_id{0}, make_path(1));
    ASSERT_TRUE(moved.has_value());
    EXPECT_EQ(moved.value(), 0u);
    EXPECT_TRUE(sent_.empty());
    EXPECT_EQ(bridge_->get_statistics().path_switches, 1u);
}

TEST_F(BridgeSendTest, FailedSendRecoveredBySwitch) {
    ASSERT_TRUE(bridge_->write(0, payload(100)).has_value());
    fail_sends_ = true;
    EXPECT_FALSE(bridge_->flush(make_path(0)).has_value());

    fail_sends_ = false;
    auto moved = bridge_->on_path_switch(path_id{0}, make_path(1));
    ASSERT_TRUE(moved.has_value());
    EXPECT_EQ(moved.value(), 100u);
}

TEST_F(BridgeSendTest, SwitchCollectsBytesFlushedOnStalePath) {
    ASSERT_TRUE(bridge_->write(0, payload(100)).has_value());
    ASSERT_TRUE(bridge_->on_path_switch(path_id{0}, make_path(1)).has_value());

    // Flushed on the previous path after the switch already happened
    ASSERT_TRUE(bridge_->write(0, payload(100)).has_value());
    ASSERT_TRUE(bridge_->flush(make_path(0)).has_value());
    EXPECT_EQ(bridge_->tracked_paths(0), 2u);

    auto moved = bridge_->on_path_switch(path_id{1}, make_path(2));

    ASSERT_TRUE(moved.has_value());
    EXPECT_EQ(moved.value(), 200u);
    EXPECT_EQ(bytes_on(path_id{2}), 200u);
    EXPECT_EQ(bridge_->tracked_paths(0), 1u);
}

TEST_F(BridgeSendTest, ClosedPathBytesResentOnActivePath) {
    ASSERT_TRUE(bridge_->write(0, payload(200)).has_value());
    ASSERT_TRUE(bridge_->flush(make_path(0)).has_value());
    ASSERT_TRUE(bridge_->on_path_switch(path_id{0}, make_path(1)).has_value());
    ASSERT_TRUE(bridge_->write(0, payload(100)).has_value());
    ASSERT_TRUE(bridge_->flush(make_path(0)).has_value());

    auto resent = bridge_->on_path_closed(path_id{0}, make_path(1));

    ASSERT_TRUE(resent.has_value());
    EXPECT_EQ(resent.value(), 100u);
    EXPECT_EQ(bytes_on(path_id{1}), 300u);
    EXPECT_EQ(bridge_->tracked_paths(0), 1u);
}

TEST_F(BridgeSendTest, ClosedPathWithAckedBytesIsForgotten) {
    ASSERT_TRUE(bridge_->write(0, payload(100)).has_value());
    ASSERT_TRUE(bridge_->flush(make_path(0)).has_value());
    ASSERT_TRUE(bridge_->on_ack(0, {0, 100}).has_value());

    auto resent = bridge_->on_path_closed(path_id{0}, make_path(1));

    ASSERT_TRUE(resent.has_value());
    EXPECT_EQ(resent.value(), 0u);
    EXPECT_EQ(bytes_on(path_id{1}), 0u);
    EXPECT_EQ(bridge_->tracked_paths(0), 0u);
}

TEST_F(BridgeSendTest, ClosingActivePathRejected) {
    auto resent = bridge_->on_path_closed(path_id{1}, make_path(1));
    ASSERT_FALSE(resent.has_value());
    EXPECT_EQ(resent.error().code, error_code::invalid_range);
}

// =============================================================================
// Receive side
// =============================================================================

class BridgeReceiveTest : public ::testing::Test {
protected:
    void SetUp() override {
        bridge_ = std::make_unique<transfer_continuity_bridge>(
            [](const network_path&, const stream_frame&) -> result<void> { return {}; });
        bridge_->on_delivery([this](stream_id, uint64_t offset,
                                    std::span<const std::byte> data, bool fin) {
            EXPECT_EQ(offset, received_.size());
            received_.insert(received_.end(), data.begin(), data.end());
            if (fin) {
                ++fin_count_;
            }
        });
    }

    auto feed(uint64_t offset, const std::vector<std::byte>& all, std::size_t length,
              bool fin = false) -> result<void> {
        std::span<const std::byte> slice(all.data() + offset, length);
        return bridge_->on_stream_frame(0, offset, slice, fin);
    }

    std::unique_ptr<transfer_continuity_bridge> bridge_;
    std::vector<std::byte> received_;
    int fin_count_ = 0;
};

TEST_F(BridgeReceiveTest, InOrderDelivery) {
    auto data = payload(300);
    ASSERT_TRUE(feed(0, data, 100).has_value());
    ASSERT_TRUE(feed(100, data, 100).has_value());
    ASSERT_TRUE(feed(200, data, 100, true).has_value());

    EXPECT_EQ(received_, data);
    EXPECT_EQ(fin_count_, 1);
    EXPECT_TRUE(bridge_->is_finished(0));
    EXPECT_EQ(bridge_->delivered_offset(0), 300u);
}

TEST_F(BridgeReceiveTest, OutOfOrderIsReassembled) {
    auto data = payload(300);
    ASSERT_TRUE(feed(200, data, 100, true).has_value());
    ASSERT_TRUE(feed(100, data, 100).has_value());
    EXPECT_TRUE(received_.empty());

    ASSERT_TRUE(feed(0, data, 100).has_value());
    EXPECT_EQ(received_, data);
    EXPECT_EQ(fin_count_, 1);
}

TEST_F(BridgeReceiveTest, DuplicatesDeliveredOnce) {
    auto data = payload(200);
    ASSERT_TRUE(feed(0, data, 100).has_value());
    ASSERT_TRUE(feed(0, data, 100).has_value());
    ASSERT_TRUE(feed(50, data, 100).has_value());
    ASSERT_TRUE(feed(100, data, 100).has_value());

    EXPECT_EQ(received_, data);
    auto stats = bridge_->get_statistics();
    EXPECT_EQ(stats.bytes_delivered, 200u);
    EXPECT_EQ(stats.duplicate_bytes_dropped, 200u);
}

TEST_F(BridgeReceiveTest, HandlerMayQueryBridge) {
    std::vector<uint64_t> offsets_seen;
    bool finished_seen = false;
    bridge_->on_delivery([this, &offsets_seen, &finished_seen](
                             stream_id stream, uint64_t, std::span<const std::byte>, bool fin) {
        offsets_seen.push_back(bridge_->delivered_offset(stream));
        if (fin) {
            finished_seen = bridge_->is_finished(stream);
        }
    });

    auto data = payload(200);
    ASSERT_TRUE(feed(0, data, 100).has_value());
    ASSERT_TRUE(feed(100, data, 100, true).has_value());

    EXPECT_EQ(offsets_seen, (std::vector<uint64_t>{100, 200}));
    EXPECT_TRUE(finished_seen);
}

TEST_F(BridgeReceiveTest, ZeroLengthFin) {
    auto data = payload(100);
    ASSERT_TRUE(feed(0, data, 100).has_value());
    ASSERT_TRUE(bridge_->on_stream_frame(0, 100, {}, true).has_value());

    EXPECT_EQ(fin_count_, 1);
    EXPECT_TRUE(bridge_->is_finished(0));
}

TEST_F(BridgeReceiveTest, ConflictingFinRejected) {
    auto data = payload(200);
    ASSERT_TRUE(feed(0, data, 100, true).has_value());

    auto conflicting = feed(100, data, 100, true);
    ASSERT_FALSE(conflicting.has_value());
    EXPECT_EQ(conflicting.error().code, error_code::invalid_range);
}

TEST_F(BridgeReceiveTest, DataBeyondFinRejected) {
    auto data = payload(200);
    ASSERT_TRUE(feed(0, data, 100, true).has_value());
    EXPECT_FALSE(feed(100, data, 50).has_value());
}

}  // namespace kcenon::path_migration::test

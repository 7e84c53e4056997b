/**
 * @file test_path_table.cpp
 * @brief Unit tests for path_table and network_path
 */

#include <gtest/gtest.h>

#include <kcenon/path_migration/connection/path_table.h>

#include <atomic>
#include <thread>

namespace kcenon::path_migration::test {

// =============================================================================
// Network Path Tests
// =============================================================================

class NetworkPathTest : public ::testing::Test {};

TEST_F(NetworkPathTest, DefaultPathValues) {
    network_path path;
    EXPECT_TRUE(path.local.empty());
    EXPECT_TRUE(path.remote.empty());
    EXPECT_EQ(path.state, path_state::unvalidated);
    EXPECT_FALSE(path.is_validated());
    EXPECT_EQ(path.rtt.count(), 0);
}

TEST_F(NetworkPathTest, PathToString) {
    network_path path;
    path.id = path_id{2};
    path.local = {"192.168.1.100", 12345};
    path.remote = {"10.0.0.1", 443};

    EXPECT_EQ(path.to_string(), "#2 192.168.1.100:12345 -> 10.0.0.1:443");
}

TEST_F(NetworkPathTest, SocketAddressEquality) {
    socket_address a{"10.0.0.1", 443};
    socket_address b{"10.0.0.1", 443};
    socket_address c{"10.0.0.1", 444};

    EXPECT_EQ(a, b);
    EXPECT_FALSE(a == c);
}

TEST_F(NetworkPathTest, PathStateToString) {
    EXPECT_STREQ(to_string(path_state::unvalidated), "unvalidated");
    EXPECT_STREQ(to_string(path_state::validating), "validating");
    EXPECT_STREQ(to_string(path_state::validated), "validated");
    EXPECT_STREQ(to_string(path_state::failed), "failed");
}

// =============================================================================
// Path Table Tests
// =============================================================================

class PathTableTest : public ::testing::Test {
protected:
    auto add_validated() -> network_path {
        auto path = table_.add({"10.0.0.2", 5000}, {"10.0.0.1", 4433}, "eth0");
        EXPECT_TRUE(table_.set_state(path.id, path_state::validated).has_value());
        return path;
    }

    path_table table_;
};

TEST_F(PathTableTest, AddAssignsIncreasingIds) {
    auto first = table_.add({"10.0.0.2", 5000}, {"10.0.0.1", 4433}, "eth0");
    auto second = table_.add({"10.0.1.2", 5001}, {"10.0.0.1", 4433}, "wlan0");

    EXPECT_EQ(first.id.value, 0u);
    EXPECT_EQ(second.id.value, 1u);
    EXPECT_EQ(second.interface_name, "wlan0");
    EXPECT_EQ(table_.size(), 2u);
}

TEST_F(PathTableTest, IdsNotReusedAfterRemove) {
    auto first = table_.add({}, {"10.0.0.1", 4433}, "");
    ASSERT_TRUE(table_.remove(first.id).has_value());

    auto second = table_.add({}, {"10.0.0.1", 4433}, "");
    EXPECT_EQ(second.id.value, 1u);
    EXPECT_FALSE(table_.contains(first.id));
}

TEST_F(PathTableTest, RemovedPathsDoNotAccumulate) {
    auto active = add_validated();
    ASSERT_TRUE(table_.activate(active.id).has_value());

    for (int i = 0; i < 50; ++i) {
        auto candidate = table_.add({}, {"10.0.0.1", 4433}, "wlan0");
        ASSERT_TRUE(table_.remove(candidate.id).has_value());
    }

    EXPECT_EQ(table_.size(), 1u);
    ASSERT_EQ(table_.paths().size(), 1u);
    EXPECT_EQ(table_.paths().front().id, active.id);
    EXPECT_EQ(table_.add({}, {"10.0.0.1", 4433}, "").id.value, 51u);
}

TEST_F(PathTableTest, GetUnknown) {
    auto path = table_.get(path_id{9});
    ASSERT_FALSE(path.has_value());
    EXPECT_EQ(path.error().code, error_code::unknown_path);
}

TEST_F(PathTableTest, Setters) {
    auto path = table_.add({}, {"10.0.0.1", 4433}, "");

    ASSERT_TRUE(table_.set_local(path.id, {"10.0.0.2", 6000}).has_value());
    ASSERT_TRUE(table_.set_remote(path.id, {"10.0.0.9", 4433}).has_value());
    ASSERT_TRUE(table_.set_rtt(path.id, std::chrono::milliseconds(12)).has_value());

    auto updated = table_.get(path.id);
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated.value().local, (socket_address{"10.0.0.2", 6000}));
    EXPECT_EQ(updated.value().remote, (socket_address{"10.0.0.9", 4433}));
    EXPECT_EQ(updated.value().rtt.count(), 12);
}

TEST_F(PathTableTest, ActivateRequiresValidation) {
    auto path = table_.add({}, {"10.0.0.1", 4433}, "");

    auto activated = table_.activate(path.id);
    ASSERT_FALSE(activated.has_value());
    EXPECT_EQ(activated.error().code, error_code::path_not_validated);
    EXPECT_FALSE(table_.active_id().has_value());
}

TEST_F(PathTableTest, ActivateReturnsPrevious) {
    auto first = add_validated();
    auto second = add_validated();

    auto initial = table_.activate(first.id);
    ASSERT_TRUE(initial.has_value());
    EXPECT_FALSE(initial.value().has_value());

    auto swapped = table_.activate(second.id);
    ASSERT_TRUE(swapped.has_value());
    ASSERT_TRUE(swapped.value().has_value());
    EXPECT_EQ(*swapped.value(), first.id);

    auto active = table_.active();
    ASSERT_TRUE(active.has_value());
    EXPECT_EQ(active.value().id, second.id);
}

TEST_F(PathTableTest, ActivePathCannotBeRemoved) {
    auto path = add_validated();
    ASSERT_TRUE(table_.activate(path.id).has_value());

    EXPECT_FALSE(table_.remove(path.id).has_value());
    EXPECT_TRUE(table_.contains(path.id));
}

TEST_F(PathTableTest, NoActivePath) {
    auto active = table_.active();
    ASSERT_FALSE(active.has_value());
    EXPECT_EQ(active.error().code, error_code::unknown_path);
}

TEST_F(PathTableTest, ReadersSeeOldOrNewActivePath) {
    auto first = add_validated();
    auto second = add_validated();
    ASSERT_TRUE(table_.activate(first.id).has_value());

    std::atomic<bool> stop{false};
    std::atomic<int> torn{0};
    std::thread reader([&] {
        while (!stop.load()) {
            auto id = table_.active_id();
            if (!id || (*id != first.id && *id != second.id)) {
                torn++;
            }
        }
    });

    for (int i = 0; i < 1000; ++i) {
        EXPECT_TRUE(table_.activate(i % 2 == 0 ? second.id : first.id).has_value());
    }
    stop = true;
    reader.join();

    EXPECT_EQ(torn.load(), 0);
}

}  // namespace kcenon::path_migration::test

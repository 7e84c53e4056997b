/**
 * @file test_interface_resolver.cpp
 * @brief Unit tests for system_interface_resolver
 */

#include <gtest/gtest.h>

#include <kcenon/path_migration/transport/interface_resolver.h>

#include <algorithm>

namespace kcenon::path_migration::test {

class SystemInterfaceResolverTest : public ::testing::Test {
protected:
    std::unique_ptr<system_interface_resolver> resolver_ = system_interface_resolver::create();
};

TEST_F(SystemInterfaceResolverTest, LoopbackResolves) {
    auto address = resolver_->resolve("lo");
    ASSERT_TRUE(address.has_value()) << address.error().message;
    EXPECT_EQ(address.value(), "127.0.0.1");
}

TEST_F(SystemInterfaceResolverTest, ListIncludesLoopback) {
    auto interfaces = resolver_->list();
    auto loopback = std::find_if(interfaces.begin(), interfaces.end(),
        [](const network_interface& iface) { return iface.name == "lo"; });
    ASSERT_NE(loopback, interfaces.end());
    EXPECT_TRUE(loopback->is_loopback);
    EXPECT_TRUE(loopback->is_up);
}

TEST_F(SystemInterfaceResolverTest, UnknownInterfaceHasNoRoute) {
    auto address = resolver_->resolve("pm-no-such-if0");
    ASSERT_FALSE(address.has_value());
    EXPECT_EQ(address.error().code, error_code::migration_failed);
    EXPECT_EQ(address.error().reason, failure_reason::no_route);
}

}  // namespace kcenon::path_migration::test

#include "server/BindingRegistry.h"
#include "support/ManualTimerService.h"

#include <gtest/gtest.h>

namespace portal::server {
namespace {

using namespace std::chrono_literals;
using networking::ConnectionId;

class BindingRegistryTest : public ::testing::Test {
protected:
    test::ManualTimerService timers;
    BindingRegistry bindings{timers};
};

TEST_F(BindingRegistryTest, BindIsVisibleBothWays) {
    EXPECT_FALSE(bindings.bind("a", 1));

    EXPECT_EQ(bindings.connection_of("a"), ConnectionId{1});
    EXPECT_EQ(bindings.device_of(1), "a");
    EXPECT_EQ(bindings.bound_devices(), 1u);
    EXPECT_FALSE(bindings.connection_of("b"));
    EXPECT_FALSE(bindings.device_of(2));
}

TEST_F(BindingRegistryTest, RebindReturnsPreviousConnection) {
    bindings.bind("a", 1);
    EXPECT_EQ(bindings.bind("a", 2), ConnectionId{1});
    EXPECT_EQ(bindings.connection_of("a"), ConnectionId{2});

    // Registering again on the same connection is not a supersede.
    EXPECT_FALSE(bindings.bind("a", 2));
}

TEST_F(BindingRegistryTest, ReleaseOfCurrentConnection) {
    bindings.bind("a", 1);

    const auto result = bindings.release(1);

    EXPECT_EQ(result.outcome, BindingRegistry::Release::Released);
    EXPECT_EQ(result.device_id, "a");
    EXPECT_FALSE(bindings.connection_of("a"));
    EXPECT_EQ(bindings.bound_devices(), 0u);
}

TEST_F(BindingRegistryTest, ReleaseOfSupersededConnection) {
    bindings.bind("a", 1);
    bindings.bind("a", 2);

    const auto result = bindings.release(1);

    EXPECT_EQ(result.outcome, BindingRegistry::Release::Superseded);
    EXPECT_EQ(result.device_id, "a");
    EXPECT_EQ(bindings.connection_of("a"), ConnectionId{2});

    EXPECT_EQ(bindings.release(2).outcome, BindingRegistry::Release::Released);
}

TEST_F(BindingRegistryTest, ReleaseOfUnknownConnection) {
    const auto result = bindings.release(42);
    EXPECT_EQ(result.outcome, BindingRegistry::Release::NotBound);
    EXPECT_TRUE(result.device_id.empty());
}

TEST_F(BindingRegistryTest, ConnectionSwitchingDeviceDropsOldClaim) {
    bindings.bind("a", 1);
    bindings.bind("b", 1);

    EXPECT_FALSE(bindings.connection_of("a"));
    EXPECT_EQ(bindings.connection_of("b"), ConnectionId{1});
    EXPECT_EQ(bindings.device_of(1), "b");
}

TEST_F(BindingRegistryTest, ReleaseReportsConnectionAgeAndIdleTime) {
    bindings.bind("a", 1);

    timers.advance(5s);
    bindings.touch(1);
    bindings.touch(99);
    timers.advance(2s);

    const auto result = bindings.release(1);
    EXPECT_EQ(result.outcome, BindingRegistry::Release::Released);
    EXPECT_EQ(result.bound_for, 7000ms);
    EXPECT_EQ(result.idle_for, 2000ms);

    EXPECT_EQ(bindings.release(99).outcome, BindingRegistry::Release::NotBound);
}

TEST_F(BindingRegistryTest, RebindRestartsConnectionAge) {
    bindings.bind("a", 1);
    timers.advance(10s);
    bindings.bind("b", 1);
    timers.advance(1s);

    const auto result = bindings.release(1);
    EXPECT_EQ(result.device_id, "b");
    EXPECT_EQ(result.bound_for, 1000ms);
    EXPECT_EQ(result.idle_for, 1000ms);
}

} // namespace
} // namespace portal::server

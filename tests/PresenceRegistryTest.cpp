#include "server/PresenceRegistry.h"
#include "support/ManualTimerService.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace portal::server {
namespace {

using namespace std::chrono_literals;

common::Device device(const std::string& id, const std::string& group = "family") {
    common::Device d;
    d.id = id;
    d.group_id = group;
    d.name = id + "-name";
    return d;
}

std::vector<std::string> ids(const std::vector<common::Device>& devices) {
    std::vector<std::string> out;
    for (const auto& d : devices) out.push_back(d.id);
    return out;
}

class PresenceRegistryTest : public ::testing::Test {
protected:
    test::ManualTimerService timers;
    std::vector<std::string> events;
    PresenceRegistry registry{timers, 30s, [this](const std::string& group) { events.push_back(group); }};
};

TEST_F(PresenceRegistryTest, FirstMarkPresentNotifiesOnce) {
    registry.mark_present(device("a"));

    EXPECT_TRUE(registry.is_present("a"));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0], "family");

    const auto present = registry.present_in_group("family");
    ASSERT_EQ(present.size(), 1u);
    EXPECT_TRUE(present[0].is_present);
    EXPECT_TRUE(present[0].last_motion_at.has_value());
}

TEST_F(PresenceRegistryTest, RefreshDoesNotNotify) {
    registry.mark_present(device("a"));
    timers.advance(10s);
    registry.mark_present(device("a"));
    registry.mark_present(device("a"));

    EXPECT_EQ(events.size(), 1u);
}

TEST_F(PresenceRegistryTest, RefreshRestartsTheFullLease) {
    registry.mark_present(device("a"));
    timers.advance(20s);
    registry.mark_present(device("a"));

    timers.advance(20s);  // 40s after the first mark, 20s after the refresh
    EXPECT_TRUE(registry.is_present("a"));

    timers.advance(10s);
    EXPECT_FALSE(registry.is_present("a"));
    EXPECT_EQ(events.size(), 2u);
}

TEST_F(PresenceRegistryTest, RepeatedRefreshKeepsASingleTimer) {
    for (int i = 0; i < 5; ++i) {
        registry.mark_present(device("a"));
        timers.advance(1s);
    }
    EXPECT_EQ(timers.pending(), 1u);

    timers.advance(60s);
    // One expiry, one absent transition.
    EXPECT_EQ(events.size(), 2u);
    EXPECT_EQ(timers.pending(), 0u);
}

TEST_F(PresenceRegistryTest, MarkNotPresentNotifiesOnlyWhenPresent) {
    registry.mark_not_present("ghost");
    EXPECT_TRUE(events.empty());

    registry.mark_present(device("a"));
    registry.mark_not_present("a");
    registry.mark_not_present("a");

    EXPECT_EQ(events.size(), 2u);
    EXPECT_EQ(timers.pending(), 0u);
}

TEST_F(PresenceRegistryTest, ExplicitStopCancelsTheLease) {
    registry.mark_present(device("a"));
    registry.mark_not_present("a");
    timers.advance(60s);

    EXPECT_EQ(events.size(), 2u);
}

TEST_F(PresenceRegistryTest, PresentInGroupFiltersByGroup) {
    registry.mark_present(device("b", "family"));
    registry.mark_present(device("a", "family"));
    registry.mark_present(device("x", "neighbours"));

    EXPECT_EQ(ids(registry.present_in_group("family")), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(ids(registry.present_in_group("neighbours")), (std::vector<std::string>{"x"}));
    EXPECT_TRUE(registry.present_in_group("nobody").empty());
}

TEST_F(PresenceRegistryTest, TwoDevicesJoinThenExpire) {
    registry.mark_present(device("a"));
    timers.advance(5s);
    registry.mark_present(device("b"));

    EXPECT_EQ(ids(registry.present_in_group("family")), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(events.size(), 2u);

    timers.advance(25s);  // t=30s
    EXPECT_EQ(ids(registry.present_in_group("family")), (std::vector<std::string>{"b"}));

    timers.advance(5s);  // t=35s
    EXPECT_TRUE(registry.present_in_group("family").empty());
    EXPECT_EQ(events.size(), 4u);
}

TEST_F(PresenceRegistryTest, GroupChangeNotifiesBothGroups) {
    registry.mark_present(device("a", "old"));
    events.clear();

    registry.mark_present(device("a", "new"));

    EXPECT_EQ(events, (std::vector<std::string>{"old", "new"}));
    EXPECT_TRUE(registry.present_in_group("old").empty());
    EXPECT_EQ(registry.present_in_group("new").size(), 1u);
}

TEST_F(PresenceRegistryTest, InterleavedCallsFollowTheLastWrite) {
    registry.mark_present(device("a"));
    registry.mark_present(device("b"));
    registry.mark_not_present("a");
    registry.mark_present(device("c"));
    timers.advance(10s);
    registry.mark_present(device("a"));
    registry.mark_not_present("c");

    EXPECT_EQ(ids(registry.present_in_group("family")), (std::vector<std::string>{"a", "b"}));

    timers.advance(20s);  // b's lease (from t=0) runs out
    EXPECT_EQ(ids(registry.present_in_group("family")), (std::vector<std::string>{"a"}));
}

TEST_F(PresenceRegistryTest, ClearDropsEverythingSilently) {
    registry.mark_present(device("a"));
    registry.mark_present(device("b"));
    events.clear();

    registry.clear();
    timers.advance(60s);

    EXPECT_EQ(registry.size(), 0u);
    EXPECT_TRUE(events.empty());
}

} // namespace
} // namespace portal::server

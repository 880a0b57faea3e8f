#include "client/MotionInferrer.h"
#include "support/ManualTimerService.h"

#include <gtest/gtest.h>

#include <memory>
#include <optional>

namespace portal::client {
namespace {

using namespace std::chrono_literals;

constexpr int kWidth = 40;
constexpr int kHeight = 30;

Frame blank(std::uint8_t value = 0) {
    Frame frame;
    frame.width = kWidth;
    frame.height = kHeight;
    frame.channels = 1;
    frame.pixels.assign(static_cast<std::size_t>(kWidth * kHeight), value);
    return frame;
}

// A bright square of side `size` at (x, y) on a dark frame.
Frame square(int x, int y, int size) {
    Frame frame = blank();
    for (int row = y; row < y + size && row < kHeight; ++row) {
        for (int col = x; col < x + size && col < kWidth; ++col) {
            frame.pixels[static_cast<std::size_t>(row * kWidth + col)] = 255;
        }
    }
    return frame;
}

class MotionInferrerTest : public ::testing::Test {
protected:
    MotionInferrerTest() {
        settings.motion_timeout = 10s;
        settings.heartbeat_interval = 4s;
    }

    MotionInferrer& inferrer() {
        if (!inferrer_) {
            inferrer_ = std::make_unique<MotionInferrer>(
                timers, settings, [this] { ++detected; }, [this] { ++stopped; });
        }
        return *inferrer_;
    }

    // Feeds one frame a sampling interval after the previous one.
    std::optional<MotionSample> feed(const Frame& frame) {
        timers.advance(settings.min_sample_interval);
        return inferrer().process_frame(frame);
    }

    // A square jumping between two spots: after the first step every sample
    // differs from the last in 200 of 1200 pixels.
    std::optional<MotionSample> feed_next() {
        return feed(square((step_++ % 2) * 20, 5, 10));
    }

    void feed_moving(int samples) {
        for (int i = 0; i < samples; ++i) feed_next();
    }

    test::ManualTimerService timers;
    MotionSettings settings;
    int detected = 0;
    int stopped = 0;

private:
    std::unique_ptr<MotionInferrer> inferrer_;
    int step_ = 0;
};

TEST_F(MotionInferrerTest, FirstFrameOnlySeedsTheReference) {
    EXPECT_FALSE(feed(blank()));
    auto sample = feed(blank());
    ASSERT_TRUE(sample);
    EXPECT_DOUBLE_EQ(sample->motion_percentage, 0.0);
}

TEST_F(MotionInferrerTest, IdenticalFramesNeverReportMotion) {
    for (int i = 0; i < 100; ++i) feed(blank(40));
    timers.advance(60s);

    EXPECT_EQ(detected, 0);
    EXPECT_EQ(stopped, 0);
    EXPECT_FALSE(inferrer().active());
}

TEST_F(MotionInferrerTest, SubThresholdIntensityChangeIsNotMotion) {
    feed(blank(100));
    auto sample = feed(blank(150));  // delta 50 < 60

    ASSERT_TRUE(sample);
    EXPECT_DOUBLE_EQ(sample->motion_percentage, 0.0);
}

TEST_F(MotionInferrerTest, SustainedMovementRaisesOneRisingEdge) {
    feed(blank());
    auto first = feed_next();
    ASSERT_TRUE(first);
    EXPECT_NEAR(first->motion_percentage, 100.0 / 12.0, 1e-9);
    EXPECT_FALSE(first->real_motion);

    auto second = feed_next();
    ASSERT_TRUE(second);
    EXPECT_NEAR(second->motion_percentage, 100.0 / 6.0, 1e-9);
    EXPECT_EQ(second->hits, 2u);
    EXPECT_EQ(detected, 0);

    auto third = feed_next();
    ASSERT_TRUE(third);
    EXPECT_TRUE(third->real_motion);
    EXPECT_EQ(detected, 1);
    EXPECT_TRUE(inferrer().active());

    feed_moving(20);
    EXPECT_EQ(detected, 1);
}

TEST_F(MotionInferrerTest, SingleFlickerIsFilteredOut) {
    feed(blank());
    feed(square(0, 0, 20));
    feed(blank());
    for (int i = 0; i < 10; ++i) feed(blank());

    EXPECT_EQ(detected, 0);
}

TEST_F(MotionInferrerTest, StopsAfterTimeoutWithoutMotion) {
    feed(blank());
    feed_moving(3);
    ASSERT_EQ(detected, 1);

    timers.advance(9s);
    EXPECT_EQ(stopped, 0);
    timers.advance(1s);

    EXPECT_EQ(stopped, 1);
    EXPECT_FALSE(inferrer().active());
    EXPECT_EQ(timers.pending(), 0u);
}

TEST_F(MotionInferrerTest, HeartbeatRepeatsDetectedButNotTheTimeout) {
    feed(blank());
    feed_moving(3);
    ASSERT_EQ(detected, 1);

    timers.advance(4s);
    EXPECT_EQ(detected, 2);
    timers.advance(4s);
    EXPECT_EQ(detected, 3);

    // Timeout counts from the last real motion, heartbeats notwithstanding.
    timers.advance(2s);
    EXPECT_EQ(stopped, 1);

    timers.advance(20s);
    EXPECT_EQ(detected, 3);
}

TEST_F(MotionInferrerTest, ContinuedMotionPushesTheTimeoutBack) {
    feed(blank());
    feed_moving(3);

    timers.advance(8s);
    feed_moving(3);
    timers.advance(8s);

    EXPECT_EQ(stopped, 0);
    EXPECT_TRUE(inferrer().active());
    // One timeout and one heartbeat.
    EXPECT_EQ(timers.pending(), 2u);
}

TEST_F(MotionInferrerTest, DisablingWhileActiveStopsImmediately) {
    feed(blank());
    feed_moving(3);
    ASSERT_TRUE(inferrer().active());

    inferrer().set_enabled(false);

    EXPECT_EQ(stopped, 1);
    EXPECT_FALSE(inferrer().active());
    EXPECT_EQ(timers.pending(), 0u);
    EXPECT_FALSE(feed(square(0, 0, 10)));

    timers.advance(60s);
    EXPECT_EQ(stopped, 1);
    EXPECT_EQ(detected, 1);
}

TEST_F(MotionInferrerTest, ReEnablingStartsFromAFreshReference) {
    feed(blank());
    inferrer().toggle();
    EXPECT_FALSE(inferrer().enabled());
    EXPECT_EQ(stopped, 0);

    inferrer().toggle();
    EXPECT_TRUE(inferrer().enabled());
    EXPECT_FALSE(feed(square(0, 0, 10)));
    EXPECT_TRUE(feed(square(0, 0, 10)));
}

TEST_F(MotionInferrerTest, FramesFasterThanTheMinimumIntervalAreDropped) {
    feed(blank());
    EXPECT_TRUE(feed(blank()));
    EXPECT_FALSE(inferrer().process_frame(blank()));
    timers.advance(50ms);
    EXPECT_FALSE(inferrer().process_frame(blank()));
    timers.advance(50ms);
    EXPECT_TRUE(inferrer().process_frame(blank()));
}

TEST_F(MotionInferrerTest, MalformedAndResizedFrames) {
    Frame broken = blank();
    broken.pixels.resize(10);
    EXPECT_FALSE(feed(broken));

    feed(blank());
    Frame smaller;
    smaller.width = 20;
    smaller.height = 10;
    smaller.pixels.assign(200, 0);
    // A geometry change reseeds the reference.
    EXPECT_FALSE(feed(smaller));
    EXPECT_TRUE(feed(smaller));
}

TEST_F(MotionInferrerTest, AdaptiveThresholdLearnsFromQuietSamples) {
    EXPECT_DOUBLE_EQ(inferrer().adaptive_threshold(), settings.min_adaptive_threshold);

    // Three flickering pixels of 1200: 0.25% per sample.
    Frame noisy = blank();
    noisy.pixels[0] = noisy.pixels[1] = noisy.pixels[2] = 255;
    feed(blank());
    for (int i = 0; i < 10; ++i) feed(i % 2 == 0 ? noisy : blank());

    EXPECT_NEAR(inferrer().adaptive_threshold(), 0.75, 1e-9);
}

TEST_F(MotionInferrerTest, ChangesBelowTheThresholdFloorNeverFire) {
    auto lit = [](int count) {
        Frame frame = blank();
        for (int i = 0; i < count; ++i) frame.pixels[static_cast<std::size_t>(i)] = 255;
        return frame;
    };

    // 2 and 5 of 1200 pixels: 0.17% and 0.42%, always under the 0.5% floor.
    feed(blank());
    const Frame faint[] = {lit(2), blank(), lit(5), blank()};
    for (int i = 0; i < 20; ++i) {
        auto sample = feed(faint[i % 4]);
        ASSERT_TRUE(sample);
        EXPECT_GT(sample->motion_percentage, 0.1);
        EXPECT_EQ(sample->hits, 0u);
        EXPECT_FALSE(sample->real_motion);
    }
    EXPECT_EQ(detected, 0);

    // 8 and 16 pixels clear the floor.
    const Frame strong[] = {lit(8), blank(), lit(16), blank()};
    for (const auto& frame : strong) feed(frame);
    EXPECT_EQ(detected, 1);
}

TEST_F(MotionInferrerTest, ColourFramesUseTheMeanChannelDelta) {
    Frame a;
    a.width = 2;
    a.height = 1;
    a.channels = 3;
    a.pixels = {0, 0, 0, 0, 0, 0};
    Frame b = a;
    b.pixels = {200, 0, 0, 70, 70, 70};  // means 66.7 and 70

    feed(a);
    auto sample = feed(b);
    ASSERT_TRUE(sample);
    EXPECT_DOUBLE_EQ(sample->motion_percentage, 100.0);

    Frame c = a;
    c.pixels = {170, 0, 0, 0, 0, 0};  // mean 56.7
    feed(a);
    sample = feed(c);
    ASSERT_TRUE(sample);
    EXPECT_DOUBLE_EQ(sample->motion_percentage, 0.0);
}

} // namespace
} // namespace portal::client

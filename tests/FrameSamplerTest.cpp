#include "client/FrameSampler.h"
#include "support/ManualTimerService.h"

#include <gtest/gtest.h>

#include <deque>
#include <vector>

namespace portal::client {
namespace {

using namespace std::chrono_literals;

class ScriptedFrameSource : public FrameSource {
public:
    std::optional<Frame> grab() override {
        ++grabs;
        if (script.empty()) return std::nullopt;
        auto next = std::move(script.front());
        script.pop_front();
        return next;
    }

    std::deque<std::optional<Frame>> script;
    int grabs = 0;
};

Frame gray(std::uint8_t value) {
    Frame frame;
    frame.width = 8;
    frame.height = 8;
    frame.pixels.assign(64, value);
    return frame;
}

class FrameSamplerTest : public ::testing::Test {
protected:
    test::ManualTimerService timers;
    ScriptedFrameSource source;
    MotionInferrer inferrer{timers, MotionSettings{}, nullptr, nullptr};
};

TEST_F(FrameSamplerTest, PullsOneFramePerInterval) {
    FrameSampler sampler(timers, source, inferrer, 200ms);
    source.script = {gray(0), gray(0), std::nullopt, gray(0)};

    sampler.start();
    EXPECT_TRUE(sampler.running());
    timers.advance(800ms);

    EXPECT_EQ(source.grabs, 4);
    EXPECT_EQ(sampler.frames_sampled(), 3u);
    EXPECT_EQ(sampler.frames_missed(), 1u);
}

TEST_F(FrameSamplerTest, StopCancelsTheLoop) {
    FrameSampler sampler(timers, source, inferrer, 200ms);
    sampler.start();
    timers.advance(200ms);

    sampler.stop();
    timers.advance(2s);

    EXPECT_FALSE(sampler.running());
    EXPECT_EQ(source.grabs, 1);
    EXPECT_EQ(timers.pending(), 0u);
}

TEST_F(FrameSamplerTest, StartIsIdempotent) {
    FrameSampler sampler(timers, source, inferrer, 200ms);
    sampler.start();
    sampler.start();
    timers.advance(200ms);

    EXPECT_EQ(source.grabs, 1);
}

TEST_F(FrameSamplerTest, IntervalIsClampedToTheInferrerMinimum) {
    FrameSampler sampler(timers, source, inferrer, 10ms);
    EXPECT_EQ(sampler.interval(), 100ms);
    sampler.start();
    timers.advance(250ms);

    EXPECT_EQ(source.grabs, 2);
}

TEST_F(FrameSamplerTest, FramesReachTheInferrer) {
    int detected = 0;
    MotionSettings settings;
    MotionInferrer counting(timers, settings, [&] { ++detected; }, nullptr);
    FrameSampler sampler(timers, source, counting, 100ms);

    Frame left = gray(0);
    Frame right = gray(0);
    for (int i = 0; i < 16; ++i) {
        left.pixels[static_cast<std::size_t>(i)] = 255;
        right.pixels[static_cast<std::size_t>(63 - i)] = 255;
    }
    source.script = {gray(0), left, right, left, right};

    sampler.start();
    timers.advance(500ms);

    EXPECT_EQ(sampler.frames_sampled(), 5u);
    EXPECT_EQ(detected, 1);
    EXPECT_TRUE(counting.active());
}

TEST_F(FrameSamplerTest, ObserverSeesEverySampledFrame) {
    FrameSampler sampler(timers, source, inferrer, 100ms);
    std::vector<std::uint8_t> seen;
    sampler.set_frame_observer([&](const Frame& frame) { seen.push_back(frame.pixels[0]); });
    source.script = {gray(1), std::nullopt, gray(2)};

    sampler.start();
    timers.advance(300ms);

    EXPECT_EQ(seen, (std::vector<std::uint8_t>{1, 2}));
}

} // namespace
} // namespace portal::client

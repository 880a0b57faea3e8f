#pragma once

#include "client/FrameSource.hpp"
#include "client/MotionInferrer.h"
#include "common/TimerService.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace portal::client {

// Periodic pull of frames from a source into the inferrer. The loop is a
// single repeating timer; stop() cancels it.
class FrameSampler {
public:
    using FrameObserver = std::function<void(const Frame&)>;

    FrameSampler(common::TimerService& timers, FrameSource& source, MotionInferrer& inferrer,
                 std::chrono::milliseconds interval);

    FrameSampler(const FrameSampler&) = delete;
    FrameSampler& operator=(const FrameSampler&) = delete;

    // Sees every sampled frame after the inferrer.
    void set_frame_observer(FrameObserver observer) { observer_ = std::move(observer); }

    void start();
    void stop();
    bool running() const noexcept { return static_cast<bool>(task_); }
    std::chrono::milliseconds interval() const noexcept { return interval_; }

    std::uint64_t frames_sampled() const noexcept { return sampled_; }
    std::uint64_t frames_missed() const noexcept { return missed_; }

private:
    void tick();

    common::TimerService& timers_;
    FrameSource& source_;
    MotionInferrer& inferrer_;
    std::chrono::milliseconds interval_;
    FrameObserver observer_;

    std::unique_ptr<common::Timer> task_;
    std::uint64_t sampled_ = 0;
    std::uint64_t missed_ = 0;
};

} // namespace portal::client

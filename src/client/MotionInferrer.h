#pragma once

#include "client/Frame.h"
#include "common/TimerService.hpp"

#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <optional>

namespace portal::client {

struct MotionSettings {
    int pixel_threshold = 60;                           // mean channel delta, 0-255
    std::chrono::milliseconds motion_timeout{60000};    // local active period
    std::chrono::milliseconds heartbeat_interval{30000};
    std::chrono::milliseconds min_sample_interval{100};

    std::size_t history_size = 5;
    std::size_t required_hits = 3;
    std::size_t baseline_size = 30;
    double low_motion_cutoff = 0.3;     // percent
    double min_adaptive_threshold = 0.5;
    double adaptive_factor = 3.0;
    double velocity_floor = 0.1;        // percentage points per sample
};

// Result of analysing one sample.
struct MotionSample {
    double motion_percentage = 0.0;
    double adaptive_threshold = 0.0;
    double velocity = 0.0;
    std::size_t hits = 0;
    bool real_motion = false;
};

// Debounced presence signal from camera frames.
//
// A sample counts as real motion when it passes three filters: a temporal
// vote over the last few samples, an adaptive threshold learned from quiet
// samples, and a velocity check separating movement from lighting drift. The
// first real-motion sample raises the active state (on_detected); the state
// drops (on_stopped) once no real motion was seen for motion_timeout. While
// active, on_detected is repeated every heartbeat_interval so that the remote
// lease stays alive; the heartbeat never extends the local timeout.
class MotionInferrer {
public:
    using Callback = std::function<void()>;

    MotionInferrer(common::TimerService& timers, MotionSettings settings,
                   Callback on_detected, Callback on_stopped);

    MotionInferrer(const MotionInferrer&) = delete;
    MotionInferrer& operator=(const MotionInferrer&) = delete;

    // Returns nullopt when the frame only seeded the reference, was throttled,
    // or detection is disabled.
    std::optional<MotionSample> process_frame(const Frame& frame);

    // Disabling while active reports on_stopped before returning.
    void set_enabled(bool enabled);
    void toggle() { set_enabled(!enabled_); }

    bool enabled() const noexcept { return enabled_; }
    bool active() const noexcept { return active_; }
    double adaptive_threshold() const;

    const MotionSettings& settings() const noexcept { return settings_; }

private:
    double motion_percentage(const Frame& current) const;
    void on_real_motion();
    void on_timeout();
    void deactivate();
    void reset_analysis();

    common::TimerService& timers_;
    MotionSettings settings_;
    Callback on_detected_;
    Callback on_stopped_;

    bool enabled_ = true;
    bool active_ = false;

    std::optional<Frame> previous_;
    std::optional<common::TimerService::Clock::time_point> last_sample_at_;
    std::deque<double> history_;
    std::deque<double> baseline_;

    std::unique_ptr<common::Timer> timeout_;
    std::unique_ptr<common::Timer> heartbeat_;
};

} // namespace portal::client

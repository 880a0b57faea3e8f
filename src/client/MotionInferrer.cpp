#include "client/MotionInferrer.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <numeric>
#include <utility>

namespace portal::client {

MotionInferrer::MotionInferrer(common::TimerService& timers, MotionSettings settings,
                               Callback on_detected, Callback on_stopped)
    : timers_(timers),
      settings_(std::move(settings)),
      on_detected_(std::move(on_detected)),
      on_stopped_(std::move(on_stopped)) {}

std::optional<MotionSample> MotionInferrer::process_frame(const Frame& frame) {
    if (!enabled_) return std::nullopt;
    if (!frame.valid()) {
        spdlog::debug("[Motion] ignoring malformed frame {}x{}", frame.width, frame.height);
        return std::nullopt;
    }

    const auto now = timers_.now();
    if (last_sample_at_ && now - *last_sample_at_ < settings_.min_sample_interval) return std::nullopt;
    last_sample_at_ = now;

    if (!previous_ || !previous_->same_geometry(frame)) {
        previous_ = frame;
        return std::nullopt;
    }

    MotionSample sample;
    sample.motion_percentage = motion_percentage(frame);
    previous_ = frame;

    // Threshold comes from the quiet samples seen so far, not this one.
    sample.adaptive_threshold = adaptive_threshold();

    if (sample.motion_percentage < settings_.low_motion_cutoff) {
        baseline_.push_back(sample.motion_percentage);
        if (baseline_.size() > settings_.baseline_size) baseline_.pop_front();
    }

    history_.push_back(sample.motion_percentage);
    if (history_.size() > settings_.history_size) history_.pop_front();

    sample.hits = static_cast<std::size_t>(std::count_if(
        history_.begin(), history_.end(),
        [&](double pct) { return pct > sample.adaptive_threshold; }));

    if (history_.size() > 1) {
        double total = 0.0;
        for (std::size_t i = 1; i < history_.size(); ++i) total += std::fabs(history_[i] - history_[i - 1]);
        sample.velocity = total / static_cast<double>(history_.size() - 1);
    }

    const bool sustained = sample.hits >= settings_.required_hits;
    const bool fast = sample.velocity > settings_.velocity_floor ||
                      sample.motion_percentage > 2.0 * sample.adaptive_threshold;
    sample.real_motion = sustained && fast;

    if (sample.motion_percentage > 0.0) {
        spdlog::debug("[Motion] {:.2f}% (threshold {:.2f}, velocity {:.2f}, hits {})",
                      sample.motion_percentage, sample.adaptive_threshold, sample.velocity, sample.hits);
    }

    if (sample.real_motion) on_real_motion();
    return sample;
}

void MotionInferrer::set_enabled(bool enabled) {
    if (enabled == enabled_) return;
    enabled_ = enabled;

    if (!enabled_) {
        spdlog::info("[Motion] detection disabled");
        reset_analysis();
        if (active_) {
            deactivate();
            if (on_stopped_) on_stopped_();
        }
    } else {
        spdlog::info("[Motion] detection enabled");
    }
}

double MotionInferrer::adaptive_threshold() const {
    if (baseline_.empty()) return settings_.min_adaptive_threshold;
    const double average = std::accumulate(baseline_.begin(), baseline_.end(), 0.0) /
                           static_cast<double>(baseline_.size());
    return std::max(settings_.min_adaptive_threshold, settings_.adaptive_factor * average);
}

double MotionInferrer::motion_percentage(const Frame& current) const {
    const auto& prev = previous_->pixels;
    const auto& cur = current.pixels;
    const std::size_t channels = static_cast<std::size_t>(current.channels);
    const int limit = settings_.pixel_threshold * current.channels;

    std::size_t changed = 0;
    for (std::size_t px = 0, i = 0; px < current.pixel_count(); ++px, i += channels) {
        int delta = 0;
        for (std::size_t c = 0; c < channels; ++c) {
            delta += std::abs(static_cast<int>(cur[i + c]) - static_cast<int>(prev[i + c]));
        }
        // mean channel delta > threshold
        if (delta > limit) ++changed;
    }
    return 100.0 * static_cast<double>(changed) / static_cast<double>(current.pixel_count());
}

void MotionInferrer::on_real_motion() {
    // Clear-then-rearm: one local timeout at most.
    timeout_.reset();
    timeout_ = timers_.schedule(settings_.motion_timeout, [this] { on_timeout(); });

    if (active_) return;

    active_ = true;
    heartbeat_ = timers_.schedule_every(settings_.heartbeat_interval, [this] {
        if (!active_) return;
        spdlog::debug("[Motion] refreshing presence");
        if (on_detected_) on_detected_();
    });

    spdlog::info("[Motion] motion detected");
    if (on_detected_) on_detected_();
}

void MotionInferrer::on_timeout() {
    if (!active_) return;
    spdlog::info("[Motion] motion stopped (timeout)");
    deactivate();
    if (on_stopped_) on_stopped_();
}

void MotionInferrer::deactivate() {
    active_ = false;
    timeout_.reset();
    heartbeat_.reset();
}

void MotionInferrer::reset_analysis() {
    previous_.reset();
    last_sample_at_.reset();
    history_.clear();
    baseline_.clear();
}

} // namespace portal::client

#include "client/FrameSampler.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace portal::client {

FrameSampler::FrameSampler(common::TimerService& timers, FrameSource& source, MotionInferrer& inferrer,
                           std::chrono::milliseconds interval)
    : timers_(timers),
      source_(source),
      inferrer_(inferrer),
      interval_(std::max(interval, inferrer.settings().min_sample_interval)) {}

void FrameSampler::start() {
    if (task_) return;
    spdlog::info("[Sampler] sampling every {} ms", interval_.count());
    task_ = timers_.schedule_every(interval_, [this] { tick(); });
}

void FrameSampler::stop() {
    task_.reset();
}

void FrameSampler::tick() {
    auto frame = source_.grab();
    if (!frame) {
        ++missed_;
        spdlog::debug("[Sampler] camera not ready");
        return;
    }
    ++sampled_;
    inferrer_.process_frame(*frame);
    if (observer_) observer_(*frame);
}

} // namespace portal::client

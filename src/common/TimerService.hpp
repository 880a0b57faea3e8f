#pragma once

#include <chrono>
#include <functional>
#include <memory>

namespace portal::common {

// Handle of a scheduled callback. Destroying the handle cancels it; a
// cancelled callback never runs, even if its expiry was already queued.
class Timer {
public:
    virtual ~Timer() = default;
    virtual void cancel() noexcept = 0;
};

// Source of time and timers for everything with a deadline. Production code
// uses AsioTimerService; tests drive a manual clock.
class TimerService {
public:
    using Clock = std::chrono::steady_clock;
    using WallClock = std::chrono::system_clock;
    using Callback = std::function<void()>;

    virtual ~TimerService() = default;

    virtual Clock::time_point now() const = 0;
    virtual WallClock::time_point wall_now() const = 0;

    // One-shot.
    virtual std::unique_ptr<Timer> schedule(std::chrono::milliseconds delay, Callback fn) = 0;

    // Fires every `interval` until cancelled; the first run is one interval out.
    virtual std::unique_ptr<Timer> schedule_every(std::chrono::milliseconds interval, Callback fn) = 0;
};

} // namespace portal::common

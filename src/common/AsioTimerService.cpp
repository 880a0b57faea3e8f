#include "common/AsioTimerService.h"

#include <boost/asio/steady_timer.hpp>

#include <utility>

namespace portal::common {

namespace asio = boost::asio;

namespace {

// Shared between the handle and the pending wait so that the handler can
// outlive the handle (and vice versa).
struct TimerState : std::enable_shared_from_this<TimerState> {
    TimerState(asio::io_context& ioc, std::chrono::milliseconds period, TimerService::Callback fn, bool repeat)
        : timer(ioc), period(period), fn(std::move(fn)), repeat(repeat) {}

    void arm() {
        timer.expires_after(period);
        timer.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
            if (ec == asio::error::operation_aborted || self->cancelled) return;
            if (self->repeat) self->arm();
            // Copy: the callback may destroy the handle that owns this state.
            auto fn = self->fn;
            fn();
        });
    }

    void cancel() noexcept {
        cancelled = true;
        boost::system::error_code ignored;
        timer.cancel(ignored);
    }

    asio::steady_timer timer;
    std::chrono::milliseconds period;
    TimerService::Callback fn;
    bool repeat;
    bool cancelled = false;
};

class AsioTimer : public Timer {
public:
    explicit AsioTimer(std::shared_ptr<TimerState> state)
        : state_(std::move(state)) {}

    ~AsioTimer() override { cancel(); }

    void cancel() noexcept override { state_->cancel(); }

private:
    std::shared_ptr<TimerState> state_;
};

} // namespace

AsioTimerService::AsioTimerService(asio::io_context& ioc)
    : ioc_(ioc) {}

TimerService::Clock::time_point AsioTimerService::now() const {
    return Clock::now();
}

TimerService::WallClock::time_point AsioTimerService::wall_now() const {
    return WallClock::now();
}

std::unique_ptr<Timer> AsioTimerService::schedule(std::chrono::milliseconds delay, Callback fn) {
    auto state = std::make_shared<TimerState>(ioc_, delay, std::move(fn), false);
    state->arm();
    return std::make_unique<AsioTimer>(std::move(state));
}

std::unique_ptr<Timer> AsioTimerService::schedule_every(std::chrono::milliseconds interval, Callback fn) {
    auto state = std::make_shared<TimerState>(ioc_, interval, std::move(fn), true);
    state->arm();
    return std::make_unique<AsioTimer>(std::move(state));
}

} // namespace portal::common

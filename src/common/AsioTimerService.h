#pragma once

#include "common/TimerService.hpp"

#include <boost/asio/io_context.hpp>

namespace portal::common {

// Timers on a boost::asio::steady_timer. Callbacks run on the io_context.
class AsioTimerService : public TimerService {
public:
    explicit AsioTimerService(boost::asio::io_context& ioc);

    AsioTimerService(const AsioTimerService&) = delete;
    AsioTimerService& operator=(const AsioTimerService&) = delete;

    Clock::time_point now() const override;
    WallClock::time_point wall_now() const override;

    std::unique_ptr<Timer> schedule(std::chrono::milliseconds delay, Callback fn) override;
    std::unique_ptr<Timer> schedule_every(std::chrono::milliseconds interval, Callback fn) override;

private:
    boost::asio::io_context& ioc_;
};

} // namespace portal::common

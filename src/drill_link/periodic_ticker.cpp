#include "drill_link/periodic_ticker.hpp"

#include <stdexcept>

namespace drill_link {

PeriodicTicker::PeriodicTicker(Duration period)
    : period_(std::chrono::duration_cast<SteadyClock::duration>(period)),
      next_tick_(SteadyClock::now() + period_) {
    if (period_ <= SteadyClock::duration::zero()) {
        throw std::invalid_argument("PeriodicTicker period must be positive");
    }
}

Duration PeriodicTicker::period() const noexcept {
    return Duration{period_};
}

bool PeriodicTicker::wait_next() {
    std::unique_lock lock(mutex_);
    condition_.wait_until(lock, next_tick_, [this] { return cancelled_; });
    if (cancelled_) {
        return false;
    }
    next_tick_ += period_;
    const TimePoint now = SteadyClock::now();
    if (next_tick_ <= now) {
        next_tick_ = now + period_;
    }
    return true;
}

void PeriodicTicker::cancel() {
    {
        std::scoped_lock lock(mutex_);
        cancelled_ = true;
    }
    condition_.notify_all();
}

void PeriodicTicker::reset() {
    std::scoped_lock lock(mutex_);
    cancelled_ = false;
    next_tick_ = SteadyClock::now() + period_;
}

}  // namespace drill_link

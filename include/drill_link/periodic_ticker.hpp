// === Periodic Ticker =========================================================
//
// Fixed-rate wakeup primitive for background workers. Ticks are scheduled on
// absolute steady-clock deadlines so processing time does not drift the
// cadence; missed deadlines are skipped rather than replayed. `cancel()` wakes
// a blocked waiter immediately.

#pragma once

#include <condition_variable>
#include <mutex>

#include "drill_link/types.hpp"

namespace drill_link {

class PeriodicTicker final {
  public:
    explicit PeriodicTicker(Duration period);

    [[nodiscard]] Duration period() const noexcept;

    /**
     * @brief Block until the next tick.
     *
     * @return true on a tick, false once the ticker has been cancelled.
     */
    bool wait_next();
    /** @brief Wake any waiter and make further waits return false. */
    void cancel();
    /** @brief Clear cancellation and schedule the first tick one period from now. */
    void reset();

  private:
    SteadyClock::duration period_;
    std::mutex mutex_;
    std::condition_variable condition_;
    TimePoint next_tick_;
    bool cancelled_{false};
};

}  // namespace drill_link

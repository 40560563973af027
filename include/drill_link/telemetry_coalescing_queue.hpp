// === Telemetry Coalescing Queue ==============================================
//
// Bounded buffer between the local sensor pipeline and the remote
// drilling-speed endpoint. Samples may arrive at any rate from any thread; a
// background worker periodically delivers only the newest one.
//
// Delivery contract: at most the freshest value per flush. Older queued
// samples are superseded, never sent. A successful delivery clears the whole
// queue; a failed one leaves it intact so the next flush retries with
// whatever is newest by then. This is suitable for a live feed, not for
// auditing.

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "drill_link/drilling_api.hpp"
#include "drill_link/logging.hpp"
#include "drill_link/periodic_ticker.hpp"
#include "drill_link/types.hpp"

namespace drill_link {

/** @brief Where queued telemetry is delivered. */
struct TelemetryTarget final {
    std::string project_id{};
    std::string hole_id{};                  /**< Empty until a hole is selected. */
    std::string sensor_id{"LASER_SENSOR"};  /**< Tag attached to every submission. */
};

/** @brief Capacity and cadence of the queue and its worker. */
struct QueueSettings final {
    std::size_t capacity{1000};
    Duration flush_interval{2.0};    /**< Minimum spacing between flush attempts. */
    Duration tick_interval{0.5};     /**< Worker wakeup period. */
    Duration shutdown_timeout{5.0};  /**< Bounded wait for the worker in stop(). */
};

/** @brief Delivery counters; `sent` and `failed` only ever grow. */
struct DeliveryStats final {
    std::uint64_t sent{};
    std::uint64_t failed{};
    std::optional<WallTimePoint> last_send_time{};
};

/** @brief Outcome of a single flush attempt. */
enum class FlushOutcome {
    Idle,       /**< Nothing queued or no hole targeted; no request made. */
    Delivered,  /**< Newest sample accepted; queue cleared. */
    Failed      /**< Submission failed; queue untouched. */
};

class TelemetryCoalescingQueue final {
  public:
    TelemetryCoalescingQueue(DrillingApiPtr api, TelemetryTarget target, QueueSettings settings = {});
    ~TelemetryCoalescingQueue();

    TelemetryCoalescingQueue(const TelemetryCoalescingQueue&) = delete;
    TelemetryCoalescingQueue& operator=(const TelemetryCoalescingQueue&) = delete;

    [[nodiscard]] const QueueSettings& settings() const noexcept;

    /** @brief Re-target subsequent deliveries. */
    void set_hole_id(std::string hole_id);
    [[nodiscard]] std::string hole_id() const;

    /** @brief Append a sample, evicting the oldest one when full. */
    void add(const TelemetrySample& sample);
    /** @brief Append a sample captured now. */
    void add(double velocity_mps, double depth_m);

    /**
     * @brief Launch the delivery worker.
     *
     * @return false (with a warning) when no hole is targeted yet.
     */
    bool start();
    /**
     * @brief Stop the worker after one final flush attempt.
     *
     * Waits at most `shutdown_timeout`; if the worker is still busy the stop
     * is best-effort and the thread is joined on destruction.
     */
    void stop();
    [[nodiscard]] bool running() const noexcept;

    /** @brief Perform one flush on the calling thread. */
    FlushOutcome flush_now();

    [[nodiscard]] std::size_t size() const;
    /** @brief Copy of the queued samples, oldest first. */
    [[nodiscard]] std::vector<TelemetrySample> pending() const;
    [[nodiscard]] DeliveryStats stats() const;

  private:
    void worker_loop(std::promise<void> worker_done);
    FlushOutcome flush();
    void guarded_flush();

    DrillingApiPtr api_;
    QueueSettings settings_;
    mutable std::mutex queue_mutex_;
    TelemetryTarget target_;
    std::deque<TelemetrySample> queue_samples_;
    DeliveryStats struct_stats_;
    PeriodicTicker ticker_;
    std::atomic<bool> flag_running_{false};
    std::thread worker_thread_;
    std::future<void> future_worker_done_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace drill_link

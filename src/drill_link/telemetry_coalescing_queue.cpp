#include "drill_link/telemetry_coalescing_queue.hpp"

#include <stdexcept>

namespace drill_link {

TelemetryCoalescingQueue::TelemetryCoalescingQueue(DrillingApiPtr api, TelemetryTarget target, QueueSettings settings)
    : api_(std::move(api)),
      settings_(settings),
      target_(std::move(target)),
      ticker_(settings.tick_interval),
      logger_(get_logger()) {
    if (api_ == nullptr) {
        throw std::invalid_argument("TelemetryCoalescingQueue requires an API client");
    }
    if (settings_.capacity == 0) {
        throw std::invalid_argument("TelemetryCoalescingQueue capacity must be positive");
    }
    if (settings_.flush_interval.count() <= 0.0 || settings_.shutdown_timeout.count() <= 0.0) {
        throw std::invalid_argument("TelemetryCoalescingQueue intervals must be positive");
    }
}

TelemetryCoalescingQueue::~TelemetryCoalescingQueue() {
    stop();
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
}

const QueueSettings& TelemetryCoalescingQueue::settings() const noexcept {
    return settings_;
}

void TelemetryCoalescingQueue::set_hole_id(std::string hole_id) {
    std::scoped_lock lock(queue_mutex_);
    logger_->info("Telemetry queue retargeted from hole '{}' to '{}'", target_.hole_id, hole_id);
    target_.hole_id = std::move(hole_id);
}

std::string TelemetryCoalescingQueue::hole_id() const {
    std::scoped_lock lock(queue_mutex_);
    return target_.hole_id;
}

void TelemetryCoalescingQueue::add(const TelemetrySample& sample) {
    std::scoped_lock lock(queue_mutex_);
    if (queue_samples_.size() >= settings_.capacity) {
        queue_samples_.pop_front();
    }
    queue_samples_.push_back(sample);
}

void TelemetryCoalescingQueue::add(double velocity_mps, double depth_m) {
    add(TelemetrySample{velocity_mps, depth_m, WallClock::now()});
}

bool TelemetryCoalescingQueue::start() {
    if (flag_running_.load()) {
        return true;
    }
    const std::string current_hole_id = hole_id();
    if (current_hole_id.empty()) {
        logger_->warn("Telemetry queue for project {} not started: no hole selected", target_.project_id);
        return false;
    }
    // A previous stop() may have timed out while the worker finished its flush.
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }

    ticker_.reset();
    flag_running_.store(true);
    std::promise<void> worker_done;
    future_worker_done_ = worker_done.get_future();
    worker_thread_ = std::thread(&TelemetryCoalescingQueue::worker_loop, this, std::move(worker_done));
    logger_->info("Telemetry queue started for project {}, hole {}", target_.project_id, current_hole_id);
    return true;
}

void TelemetryCoalescingQueue::stop() {
    if (!flag_running_.exchange(false)) {
        return;
    }
    ticker_.cancel();

    const auto timeout = std::chrono::duration_cast<SteadyClock::duration>(settings_.shutdown_timeout);
    if (future_worker_done_.valid() && future_worker_done_.wait_for(timeout) == std::future_status::ready) {
        worker_thread_.join();
    } else {
        logger_->warn("Telemetry queue worker still flushing after {:.1f}s; stop is best-effort",
                      settings_.shutdown_timeout.count());
    }

    const DeliveryStats final_stats = stats();
    logger_->info("Telemetry queue stopped: sent={} failed={}", final_stats.sent, final_stats.failed);
}

bool TelemetryCoalescingQueue::running() const noexcept {
    return flag_running_.load();
}

FlushOutcome TelemetryCoalescingQueue::flush_now() {
    return flush();
}

std::size_t TelemetryCoalescingQueue::size() const {
    std::scoped_lock lock(queue_mutex_);
    return queue_samples_.size();
}

std::vector<TelemetrySample> TelemetryCoalescingQueue::pending() const {
    std::scoped_lock lock(queue_mutex_);
    return {queue_samples_.begin(), queue_samples_.end()};
}

DeliveryStats TelemetryCoalescingQueue::stats() const {
    std::scoped_lock lock(queue_mutex_);
    return struct_stats_;
}

void TelemetryCoalescingQueue::worker_loop(std::promise<void> worker_done) {
    const auto flush_interval = std::chrono::duration_cast<SteadyClock::duration>(settings_.flush_interval);
    // The first tick is due for a flush.
    TimePoint last_flush_attempt = SteadyClock::now() - flush_interval;
    while (ticker_.wait_next()) {
        if (!flag_running_.load()) {
            break;
        }
        const TimePoint now = SteadyClock::now();
        if (now - last_flush_attempt < flush_interval) {
            continue;
        }
        guarded_flush();
        last_flush_attempt = now;
    }

    // Final best-effort delivery of whatever is newest at shutdown.
    guarded_flush();
    worker_done.set_value();
}

void TelemetryCoalescingQueue::guarded_flush() {
    try {
        flush();
    } catch (const std::exception& exc) {
        logger_->error("Telemetry flush error: {}", exc.what());
        std::scoped_lock lock(queue_mutex_);
        ++struct_stats_.failed;
    }
}

FlushOutcome TelemetryCoalescingQueue::flush() {
    TelemetrySample latest_sample{};
    TelemetryTarget target{};
    {
        std::scoped_lock lock(queue_mutex_);
        if (queue_samples_.empty()) {
            return FlushOutcome::Idle;
        }
        if (target_.hole_id.empty()) {
            logger_->debug("Telemetry flush skipped: no hole selected");
            return FlushOutcome::Idle;
        }
        latest_sample = queue_samples_.back();
        target = target_;
    }

    DrillingSpeedReport report{};
    report.speed = latest_sample.velocity_mps;
    report.depth = latest_sample.depth_m;
    report.timestamp = latest_sample.captured_at;
    report.sensor_id = target.sensor_id;

    bool delivered = false;
    try {
        delivered = api_->post_drilling_speed(target.project_id, target.hole_id, report);
    } catch (const std::exception& exc) {
        logger_->error("drilling-speed submission for hole {} raised: {}", target.hole_id, exc.what());
    }

    std::scoped_lock lock(queue_mutex_);
    if (!delivered) {
        ++struct_stats_.failed;
        logger_->warn("Failed to deliver drilling data to hole {} ({} queued)", target.hole_id, queue_samples_.size());
        return FlushOutcome::Failed;
    }
    queue_samples_.clear();
    ++struct_stats_.sent;
    struct_stats_.last_send_time = WallClock::now();
    logger_->debug("Delivered speed={:.4f} depth={:.2f} to hole {}", report.speed, report.depth, target.hole_id);
    return FlushOutcome::Delivered;
}

}  // namespace drill_link

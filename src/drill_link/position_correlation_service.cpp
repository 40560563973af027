#include "drill_link/position_correlation_service.hpp"

#include <stdexcept>

#include "drill_link/geo_math.hpp"
#include "drill_link/nearest_hole_matcher.hpp"
#include "drill_link/position_message_parser.hpp"

namespace drill_link {

namespace {
constexpr std::size_t k_logged_payload_chars{120}; /**< Truncation for unparseable payloads in logs. */
}  // namespace

PositionCorrelationService::PositionCorrelationService(MessageTransport& transport,
                                                       CorrelationSettings settings,
                                                       std::optional<DrillingLink> link)
    : transport_(transport),
      settings_(std::move(settings)),
      optional_link_(std::move(link)),
      logger_(get_logger()) {
    if (settings_.topic.empty()) {
        throw std::invalid_argument("PositionCorrelationService requires a topic");
    }
    if (settings_.max_distance_m < 0.0) {
        throw std::invalid_argument("PositionCorrelationService distance gate cannot be negative");
    }
    if (optional_link_.has_value()) {
        if (optional_link_->api == nullptr || optional_link_->project_id.empty()) {
            logger_->warn("Drilling link incomplete; running in position-monitoring mode");
            optional_link_.reset();
        } else {
            hole_directory_ = std::make_unique<HoleDirectory>(
                optional_link_->api, optional_link_->project_id, settings_.cache_ttl
            );
        }
    }
    transport_.set_listener(this);
}

PositionCorrelationService::~PositionCorrelationService() {
    stop();
    transport_.set_listener(nullptr);
}

const CorrelationSettings& PositionCorrelationService::settings() const noexcept {
    return settings_;
}

bool PositionCorrelationService::start() {
    if (flag_running_.load()) {
        return true;
    }
    if (!transport_.connect()) {
        logger_->error("Position correlation not started: broker connection failed");
        return false;
    }
    if (!transport_.subscribe(settings_.topic, settings_.qos)) {
        logger_->error("Position correlation not started: subscription to {} failed", settings_.topic);
        transport_.disconnect();
        return false;
    }
    flag_running_.store(true);
    logger_->info("Position correlation running on topic {} (gate {} m, {})",
                  settings_.topic,
                  settings_.max_distance_m,
                  optional_link_.has_value() ? "project " + optional_link_->project_id : std::string{"monitoring only"});
    return true;
}

void PositionCorrelationService::stop() {
    if (!flag_running_.exchange(false)) {
        return;
    }
    transport_.disconnect();
    const CorrelationStats final_stats = stats();
    logger_->info("Position correlation stopped: received={} processed={} updated={}",
                  final_stats.messages_received,
                  final_stats.fixes_processed,
                  final_stats.holes_updated);
}

bool PositionCorrelationService::running() const noexcept {
    return flag_running_.load();
}

void PositionCorrelationService::on_message(const std::string& topic, const std::string& payload) {
    if (!flag_running_.load()) {
        return;
    }
    {
        std::scoped_lock lock(stats_mutex_);
        ++struct_stats_.messages_received;
    }

    try {
        const std::optional<PositionFix> fix = PositionMessageParser::parse(payload);
        if (!fix.has_value()) {
            logger_->warn("No position found in message on {}: {}", topic, payload.substr(0, k_logged_payload_chars));
            return;
        }
        process_fix(*fix);
    } catch (const std::exception& exc) {
        logger_->error("Error handling message on {}: {}", topic, exc.what());
    }
}

void PositionCorrelationService::set_drilling_data(double velocity_mps, double depth_m) {
    std::scoped_lock lock(sample_mutex_);
    optional_sample_ = DrillingSample{velocity_mps, depth_m};
}

std::optional<DrillingSample> PositionCorrelationService::drilling_data() const {
    std::scoped_lock lock(sample_mutex_);
    return optional_sample_;
}

CorrelationStats PositionCorrelationService::stats() const {
    std::scoped_lock lock(stats_mutex_);
    return struct_stats_;
}

void PositionCorrelationService::clear_hole_cache() {
    if (hole_directory_ != nullptr) {
        hole_directory_->invalidate();
    }
}

void PositionCorrelationService::process_fix(const PositionFix& fix) {
    {
        std::scoped_lock lock(stats_mutex_);
        ++struct_stats_.fixes_processed;
        struct_stats_.last_fix = fix;
    }
    logger_->debug("Fix lat={:.7f} lon={:.7f}", fix.latitude_deg, fix.longitude_deg);

    if (hole_directory_ == nullptr) {
        return;
    }

    const HoleList holes = hole_directory_->get_holes();
    if (holes.empty()) {
        logger_->warn("No holes available for project {}", hole_directory_->project_id());
        return;
    }

    const NearestHoleMatch match = NearestHoleMatcher::find_nearest(holes, fix);
    if (!match.hole.has_value()) {
        logger_->warn("No hole in project {} has coordinates", hole_directory_->project_id());
        return;
    }
    if (!NearestHoleMatcher::within_gate(match, settings_.max_distance_m)) {
        logger_->debug("Nearest hole {} too far ({} > {} m)",
                       match.hole->external_id,
                       format_distance(match.distance_m),
                       settings_.max_distance_m);
        return;
    }

    const std::optional<DrillingSample> sample = drilling_data();
    if (!sample.has_value()) {
        logger_->debug("At hole {} ({}), no drilling data yet", match.hole->external_id, format_distance(match.distance_m));
        return;
    }
    submit_to_hole(*match.hole, match.distance_m, *sample);
}

void PositionCorrelationService::submit_to_hole(const Hole& hole, double distance_m, const DrillingSample& sample) {
    if (hole.external_id.empty()) {
        logger_->warn("Nearest hole '{}' has no identifier; skipping submission", hole.name);
        return;
    }

    DrillingSpeedReport report{};
    report.speed = sample.velocity_mps;
    report.depth = sample.depth_m;
    report.timestamp = WallClock::now();
    report.sensor_id = settings_.sensor_id;

    bool delivered = false;
    try {
        delivered = optional_link_->api->post_drilling_speed(optional_link_->project_id, hole.external_id, report);
    } catch (const std::exception& exc) {
        logger_->error("drilling-speed submission for hole {} raised: {}", hole.external_id, exc.what());
    }
    if (!delivered) {
        logger_->warn("Unable to send drilling-speed for hole {}", hole.external_id);
        return;
    }

    {
        std::scoped_lock lock(stats_mutex_);
        ++struct_stats_.holes_updated;
        struct_stats_.last_update_time = WallClock::now();
    }
    logger_->info("Sent drilling-speed to hole {} (distance {}, speed {:.4f}, depth {:.2f} m)",
                  hole.external_id,
                  format_distance(distance_m),
                  sample.velocity_mps,
                  sample.depth_m);
}

}  // namespace drill_link

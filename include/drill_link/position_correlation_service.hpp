// === Position Correlation Service ============================================
//
// Listens for GNSS fixes on the message transport, finds the nearest known
// hole, and forwards the current drilling sample to the remote service for
// that hole. Without a drilling link the service only tracks positions.
//
// Lifecycle: Stopped -> Running -> Stopped. Messages arriving while Stopped
// are ignored. The listener callback never throws: parse failures, threshold
// rejects and remote failures all end in a log line and, where applicable, a
// stats counter.

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "drill_link/drilling_api.hpp"
#include "drill_link/hole_directory.hpp"
#include "drill_link/logging.hpp"
#include "drill_link/message_transport.hpp"
#include "drill_link/nearest_hole_matcher.hpp"
#include "drill_link/types.hpp"

namespace drill_link {

/** @brief Subscription and matching knobs. */
struct CorrelationSettings final {
    std::string topic{"device/+/upload"};
    int qos{0};
    double max_distance_m{NearestHoleMatcher::k_default_max_distance_m}; /**< Distance gate for a usable match. */
    Duration cache_ttl{300.0};             /**< Hole directory time-to-live. */
    std::string sensor_id{"GNSS_RIG"};     /**< Tag attached to forwarded samples. */
};

/** @brief Remote project the service reports into. */
struct DrillingLink final {
    DrillingApiPtr api{};
    std::string project_id{};
};

/** @brief Drilling sample most recently reported by the sensor pipeline. */
struct DrillingSample final {
    double velocity_mps{};
    double depth_m{};
};

/** @brief Processing counters; read with stats(). */
struct CorrelationStats final {
    std::uint64_t messages_received{};
    std::uint64_t fixes_processed{};
    std::uint64_t holes_updated{};
    std::optional<WallTimePoint> last_update_time{};
    std::optional<PositionFix> last_fix{};
};

class PositionCorrelationService final : public MessageListener {
  public:
    /**
     * @brief Bind the service to @p transport and register as its listener.
     *
     * @param transport Broker connection; must outlive the service.
     * @param settings Subscription and matching knobs.
     * @param link Remote project to report into; std::nullopt for
     *        position-monitoring only.
     */
    PositionCorrelationService(MessageTransport& transport,
                               CorrelationSettings settings,
                               std::optional<DrillingLink> link = std::nullopt);
    ~PositionCorrelationService() override;

    PositionCorrelationService(const PositionCorrelationService&) = delete;
    PositionCorrelationService& operator=(const PositionCorrelationService&) = delete;

    [[nodiscard]] const CorrelationSettings& settings() const noexcept;

    /** @brief Connect and subscribe; false if either step fails. No-op when running. */
    bool start();
    /** @brief Disconnect the transport and stop processing messages. */
    void stop();
    [[nodiscard]] bool running() const noexcept;

    /** @brief Transport callback. */
    void on_message(const std::string& topic, const std::string& payload) override;

    /** @brief Replace the sample forwarded on the next successful match. */
    void set_drilling_data(double velocity_mps, double depth_m);
    [[nodiscard]] std::optional<DrillingSample> drilling_data() const;

    [[nodiscard]] CorrelationStats stats() const;
    /** @brief Force the next fix to refetch the hole listing. */
    void clear_hole_cache();

  private:
    void process_fix(const PositionFix& fix);
    void submit_to_hole(const Hole& hole, double distance_m, const DrillingSample& sample);

    MessageTransport& transport_;
    CorrelationSettings settings_;
    std::optional<DrillingLink> optional_link_;
    std::unique_ptr<HoleDirectory> hole_directory_;
    std::atomic<bool> flag_running_{false};
    mutable std::mutex sample_mutex_;
    std::optional<DrillingSample> optional_sample_;
    mutable std::mutex stats_mutex_;
    CorrelationStats struct_stats_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace drill_link

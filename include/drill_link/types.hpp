// === Core Types ==============================================================
//
// Collects shared clock aliases and lightweight structs used throughout the
// bridge (position fixes, drillholes, telemetry samples).

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace drill_link {

/**
 * @brief Alias for the steady clock used for cache ages and flush cadence.
 */
using SteadyClock = std::chrono::steady_clock;

/**
 * @brief Alias for timestamps captured from the steady clock.
 */
using TimePoint = std::chrono::time_point<SteadyClock>;

/**
 * @brief Alias for the wall clock used for anything sent to the remote API.
 */
using WallClock = std::chrono::system_clock;

/**
 * @brief Alias for wall-clock timestamps.
 */
using WallTimePoint = std::chrono::time_point<WallClock>;

/**
 * @brief Alias for durations measured in seconds with double precision.
 */
using Duration = std::chrono::duration<double>;

/**
 * @brief Identifies which wire format produced a position fix.
 */
enum class FixSource {
    Sentence,   /**< ASCII GGA positioning sentence. */
    Structured  /**< JSON object with coordinate keys. */
};

/**
 * @brief A single GNSS-derived position observation.
 */
struct PositionFix final {
    double latitude_deg{};                      /**< Latitude in decimal degrees. */
    double longitude_deg{};                     /**< Longitude in decimal degrees. */
    std::optional<double> elevation_m{};        /**< Elevation in metres when reported. */
    WallTimePoint received_at{WallClock::now()}; /**< Time the message was decoded. */
    FixSource source{FixSource::Structured};    /**< Wire format of the originating message. */
};

/**
 * @brief Drillhole known to the remote project directory.
 */
struct Hole final {
    std::string external_id{};            /**< Identifier used in API paths (e.g. "HK_01"). */
    std::optional<double> latitude_deg{}; /**< Surveyed latitude, absent if never surveyed. */
    std::optional<double> longitude_deg{};/**< Surveyed longitude, absent if never surveyed. */
    std::optional<double> elevation_m{};  /**< Surveyed elevation in metres. */
    std::string name{};                   /**< Human-readable hole name. */

    [[nodiscard]] bool has_coordinates() const noexcept {
        return latitude_deg.has_value() && longitude_deg.has_value();
    }
};

using HoleList = std::vector<Hole>;

/**
 * @brief Drilling telemetry produced by the local sensor pipeline.
 */
struct TelemetrySample final {
    double velocity_mps{};                      /**< Instantaneous drilling speed in m/s. */
    double depth_m{};                           /**< Current depth in metres. */
    WallTimePoint captured_at{WallClock::now()}; /**< Capture time of the sample. */
};

}  // namespace drill_link

// === API Codec ===============================================================
//
// JSON encoding/decoding for the remote hole service wire formats. Kept apart
// from the HTTP adapter so the formats can be exercised without a network.

#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "drill_link/drilling_api.hpp"
#include "drill_link/types.hpp"

namespace drill_link {

/**
 * @brief Render seconds since the epoch as "YYYY-MM-DDTHH:MM:SSZ".
 *
 * std::nullopt when the calendar conversion fails (year out of range).
 */
[[nodiscard]] std::optional<std::string> format_utc_seconds(std::time_t seconds_since_epoch);

/**
 * @brief Render @p timestamp as "YYYY-MM-DDTHH:MM:SSZ" (UTC, whole seconds).
 *
 * A timestamp that cannot be converted is replaced by the current time.
 */
[[nodiscard]] std::string format_utc_timestamp(WallTimePoint timestamp);

/**
 * @brief Decode one hole object.
 *
 * Identity prefers `hole_id` over `id`; coordinates are read from the flat
 * `gps_lat`/`gps_lon`/`gps_elevation` keys or from a nested `gps` object.
 */
[[nodiscard]] Hole decode_hole(const nlohmann::json& hole_object);

/** @brief Decode `{success, holes:[...]}`; std::nullopt if malformed or unsuccessful. */
[[nodiscard]] std::optional<HoleList> decode_hole_list_response(std::string_view body);

/** @brief Decode `{success, hole:{...}}`; std::nullopt if malformed or unsuccessful. */
[[nodiscard]] std::optional<Hole> decode_hole_response(std::string_view body);

/** @brief True only for a JSON object carrying `"success": true`. */
[[nodiscard]] bool decode_success_flag(std::string_view body);

/** @brief Encode `{speed, depth, timestamp, sensor_id?}`. */
[[nodiscard]] std::string encode_drilling_speed_report(const DrillingSpeedReport& report);

}  // namespace drill_link

// === Geo Math ================================================================
//
// Stateless distance helpers shared by the hole matcher and log formatting.

#pragma once

#include <optional>
#include <string>

namespace drill_link {

/** @brief Mean Earth radius used by every distance helper. */
inline constexpr double k_earth_radius_m{6'371'000.0};

/**
 * @brief Haversine distance between two latitude/longitude pairs in metres.
 */
[[nodiscard]] double great_circle_distance_m(double lat1_deg, double lon1_deg, double lat2_deg, double lon2_deg);

/**
 * @brief Approximate 3D separation combining great-circle and vertical distance.
 *
 * Treats the elevation difference as orthogonal to the curved horizontal
 * distance. That is not geodetically exact but is accurate enough at the
 * sub-kilometre ranges used for hole matching. Falls back to the great-circle
 * distance when either elevation is unknown.
 */
[[nodiscard]] double distance_3d_m(double lat1_deg,
                                   double lon1_deg,
                                   std::optional<double> elevation1_m,
                                   double lat2_deg,
                                   double lon2_deg,
                                   std::optional<double> elevation2_m);

/** @brief Render a distance as "15.3m" below one kilometre, "1.20km" above. */
[[nodiscard]] std::string format_distance(double distance_m);

}  // namespace drill_link

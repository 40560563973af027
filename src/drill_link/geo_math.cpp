#include "drill_link/geo_math.hpp"

#include <cmath>
#include <numbers>

#include <fmt/format.h>

namespace drill_link {

namespace {

constexpr double k_metres_per_kilometre{1'000.0};

/**
 * @brief Convert degrees to radians.
 */
constexpr double degrees_to_radians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}

}  // namespace

double great_circle_distance_m(double lat1_deg, double lon1_deg, double lat2_deg, double lon2_deg) {
    const double lat1 = degrees_to_radians(lat1_deg);
    const double lat2 = degrees_to_radians(lat2_deg);
    const double delta_lat = degrees_to_radians(lat2_deg - lat1_deg);
    const double delta_lon = degrees_to_radians(lon2_deg - lon1_deg);

    const double a = std::pow(std::sin(delta_lat / 2.0), 2)
        + std::cos(lat1) * std::cos(lat2) * std::pow(std::sin(delta_lon / 2.0), 2);
    const double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
    return k_earth_radius_m * c;
}

double distance_3d_m(double lat1_deg,
                     double lon1_deg,
                     std::optional<double> elevation1_m,
                     double lat2_deg,
                     double lon2_deg,
                     std::optional<double> elevation2_m) {
    const double horizontal_m = great_circle_distance_m(lat1_deg, lon1_deg, lat2_deg, lon2_deg);
    if (!elevation1_m.has_value() || !elevation2_m.has_value()) {
        return horizontal_m;
    }
    const double vertical_m = std::abs(*elevation1_m - *elevation2_m);
    return std::hypot(horizontal_m, vertical_m);
}

std::string format_distance(double distance_m) {
    if (distance_m < k_metres_per_kilometre) {
        return fmt::format("{:.1f}m", distance_m);
    }
    return fmt::format("{:.2f}km", distance_m / k_metres_per_kilometre);
}

}  // namespace drill_link

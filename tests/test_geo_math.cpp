#include <catch2/catch.hpp>

#include <cmath>

#include "drill_link/geo_math.hpp"

using namespace drill_link;

TEST_CASE("great_circle_distance_m is symmetric and zero for identical points") {
    const double forward = great_circle_distance_m(21.0285, 105.8542, 21.0288, 105.8525);
    const double backward = great_circle_distance_m(21.0288, 105.8525, 21.0285, 105.8542);
    REQUIRE(forward == Approx(backward));
    REQUIRE(forward > 0.0);
    REQUIRE(great_circle_distance_m(21.0285, 105.8542, 21.0285, 105.8542) == Approx(0.0).margin(1e-9));
    REQUIRE(great_circle_distance_m(-33.9, 151.2, -33.9, 151.2) == Approx(0.0).margin(1e-9));
}

TEST_CASE("great_circle_distance_m matches reference distances") {
    // Hanoi Opera House to Hoan Kiem Lake, roughly 180 m apart.
    REQUIRE(great_circle_distance_m(21.0285, 105.8542, 21.0288, 105.8525) == Approx(179.568).epsilon(0.0001));
    // One millidegree of longitude on the equator.
    REQUIRE(great_circle_distance_m(0.0, 0.0, 0.0, 0.001) == Approx(111.1949).epsilon(0.0001));
    // Big Ben to the Statue of Liberty, about 5575 km.
    REQUIRE(great_circle_distance_m(51.5007, -0.1246, 40.6892, -74.0445) == Approx(5'575'000.0).epsilon(0.01));
}

TEST_CASE("distance_3d_m adds vertical separation only when both elevations are known") {
    const double horizontal = great_circle_distance_m(0.0, 0.0, 0.0, 0.001);

    REQUIRE(distance_3d_m(0.0, 0.0, std::nullopt, 0.0, 0.001, 50.0) == Approx(horizontal));
    REQUIRE(distance_3d_m(0.0, 0.0, 10.0, 0.0, 0.001, std::nullopt) == Approx(horizontal));

    const double combined = distance_3d_m(0.0, 0.0, 10.0, 0.0, 0.001, 40.0);
    REQUIRE(combined == Approx(std::sqrt(horizontal * horizontal + 30.0 * 30.0)));
    REQUIRE(distance_3d_m(5.0, 5.0, 100.0, 5.0, 5.0, 97.0) == Approx(3.0));
}

TEST_CASE("format_distance switches to kilometres at 1000 m") {
    REQUIRE(format_distance(15.34) == "15.3m");
    REQUIRE(format_distance(999.94) == "999.9m");
    REQUIRE(format_distance(1200.0) == "1.20km");
}

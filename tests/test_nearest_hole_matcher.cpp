#include <cmath>
#include <string>

#include <catch2/catch.hpp>

#include "drill_link/nearest_hole_matcher.hpp"

using namespace drill_link;

namespace {
Hole make_hole(const std::string& identifier,
               std::optional<double> latitude,
               std::optional<double> longitude,
               std::optional<double> elevation = std::nullopt) {
    Hole hole{};
    hole.external_id = identifier;
    hole.latitude_deg = latitude;
    hole.longitude_deg = longitude;
    hole.elevation_m = elevation;
    return hole;
}

PositionFix make_fix(double latitude, double longitude, std::optional<double> elevation = std::nullopt) {
    PositionFix fix{};
    fix.latitude_deg = latitude;
    fix.longitude_deg = longitude;
    fix.elevation_m = elevation;
    return fix;
}
}  // namespace

TEST_CASE("find_nearest picks the closest surveyed hole") {
    const HoleList holes{
        make_hole("far", 0.0, 10.0),
        make_hole("origin", 0.0, 0.0),
        make_hole("near", 0.0, 0.001),
    };
    const NearestHoleMatch match = NearestHoleMatcher::find_nearest(holes, make_fix(0.0, 0.0));

    REQUIRE(match.hole.has_value());
    REQUIRE(match.hole->external_id == "origin");
    REQUIRE(match.distance_m == Approx(0.0).margin(1e-6));
}

TEST_CASE("find_nearest reports the distance of the winner") {
    const HoleList holes{make_hole("near", 0.0, 0.001), make_hole("far", 0.0, 10.0)};
    const NearestHoleMatch match = NearestHoleMatcher::find_nearest(holes, make_fix(0.0, 0.0));

    REQUIRE(match.hole->external_id == "near");
    REQUIRE(match.distance_m == Approx(111.1949).epsilon(0.0001));
}

TEST_CASE("find_nearest keeps the first hole on exact ties") {
    const HoleList holes{make_hole("first", 0.0, 0.001), make_hole("second", 0.0, 0.001)};
    const NearestHoleMatch match = NearestHoleMatcher::find_nearest(holes, make_fix(0.0, 0.0));
    REQUIRE(match.hole->external_id == "first");
}

TEST_CASE("find_nearest ignores holes without coordinates") {
    const HoleList holes{
        make_hole("unsurveyed", std::nullopt, std::nullopt),
        make_hole("half", 0.0, std::nullopt),
        make_hole("surveyed", 0.0, 1.0),
    };
    const NearestHoleMatch match = NearestHoleMatcher::find_nearest(holes, make_fix(0.0, 0.0));
    REQUIRE(match.hole->external_id == "surveyed");

    const HoleList unsurveyed{make_hole("a", std::nullopt, std::nullopt)};
    const NearestHoleMatch none = NearestHoleMatcher::find_nearest(unsurveyed, make_fix(0.0, 0.0));
    REQUIRE_FALSE(none.hole.has_value());
    REQUIRE(std::isinf(none.distance_m));

    REQUIRE_FALSE(NearestHoleMatcher::find_nearest(HoleList{}, make_fix(0.0, 0.0)).hole.has_value());
}

TEST_CASE("within_gate compares the match distance against the threshold") {
    const HoleList holes{make_hole("HK_01", 0.0, 0.00045)};  // about 50 m east
    const NearestHoleMatch match = NearestHoleMatcher::find_nearest(holes, make_fix(0.0, 0.0));

    REQUIRE(match.distance_m == Approx(50.0).epsilon(0.01));
    REQUIRE_FALSE(NearestHoleMatcher::within_gate(match, 5.0));
    REQUIRE(NearestHoleMatcher::within_gate(match, 60.0));
    REQUIRE(NearestHoleMatcher::within_gate(match, match.distance_m));
    REQUIRE_FALSE(NearestHoleMatcher::within_gate(NearestHoleMatch{}, 1e9));
}

TEST_CASE("rank_by_distance orders candidates and applies filters") {
    const HoleList holes{
        make_hole("c", 0.0, 0.003),
        make_hole("unsurveyed", std::nullopt, std::nullopt),
        make_hole("a", 0.0, 0.001),
        make_hole("b", 0.0, 0.002),
    };
    const PositionFix fix = make_fix(0.0, 0.0);

    SECTION("ascending distance without options") {
        const auto ranked = NearestHoleMatcher::rank_by_distance(holes, fix);
        REQUIRE(ranked.size() == 3);
        REQUIRE(ranked[0].hole.external_id == "a");
        REQUIRE(ranked[1].hole.external_id == "b");
        REQUIRE(ranked[2].hole.external_id == "c");
        REQUIRE(ranked[0].distance_m < ranked[1].distance_m);
    }
    SECTION("limit keeps the closest") {
        RankingOptions options{};
        options.limit = 2;
        const auto ranked = NearestHoleMatcher::rank_by_distance(holes, fix, options);
        REQUIRE(ranked.size() == 2);
        REQUIRE(ranked[1].hole.external_id == "b");
    }
    SECTION("distance gate drops far candidates") {
        RankingOptions options{};
        options.max_distance_m = 250.0;
        const auto ranked = NearestHoleMatcher::rank_by_distance(holes, fix, options);
        REQUIRE(ranked.size() == 2);
        REQUIRE(ranked[0].hole.external_id == "a");
    }
}

TEST_CASE("rank_by_distance uses elevation only when requested") {
    const HoleList holes{make_hole("deep", 0.0, 0.0, -30.0), make_hole("level", 0.0, 0.0001, 0.0)};
    const PositionFix fix = make_fix(0.0, 0.0, 0.0);

    const auto ranked_3d = NearestHoleMatcher::rank_by_distance(holes, fix);
    REQUIRE(ranked_3d[0].hole.external_id == "level");
    REQUIRE(ranked_3d[1].distance_m == Approx(30.0));

    RankingOptions flat{};
    flat.use_3d = false;
    const auto ranked_2d = NearestHoleMatcher::rank_by_distance(holes, fix, flat);
    REQUIRE(ranked_2d[0].hole.external_id == "deep");
}

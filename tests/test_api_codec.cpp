#include <chrono>
#include <ctime>
#include <optional>
#include <string>

#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>

#include "drill_link/api_codec.hpp"

using namespace drill_link;

TEST_CASE("format_utc_timestamp renders whole-second UTC") {
    REQUIRE(format_utc_timestamp(WallTimePoint{}) == "1970-01-01T00:00:00Z");

    const WallTimePoint timestamp = WallTimePoint{std::chrono::seconds{1'700'000'000}} + std::chrono::milliseconds{750};
    REQUIRE(format_utc_timestamp(timestamp) == "2023-11-14T22:13:20Z");
}

TEST_CASE("format_utc_seconds reports calendar overflow") {
    REQUIRE(format_utc_seconds(0) == std::optional<std::string>{"1970-01-01T00:00:00Z"});
    REQUIRE(format_utc_seconds(951'782'400) == std::optional<std::string>{"2000-02-29T00:00:00Z"});
    // Roughly three billion years; the year no longer fits in std::tm.
    REQUIRE_FALSE(format_utc_seconds(std::time_t{100'000'000'000'000'000}).has_value());
}

TEST_CASE("decode_hole prefers hole_id and reads flat coordinates") {
    const auto document = nlohmann::json::parse(
        R"({"hole_id": "HK_01", "id": 17, "name": "North pad", "gps_lat": 21.03, "gps_lon": 105.85, "gps_elevation": 12.5})"
    );
    const Hole hole = decode_hole(document);

    REQUIRE(hole.external_id == "HK_01");
    REQUIRE(hole.name == "North pad");
    REQUIRE(hole.has_coordinates());
    REQUIRE(*hole.latitude_deg == Approx(21.03));
    REQUIRE(*hole.longitude_deg == Approx(105.85));
    REQUIRE(*hole.elevation_m == Approx(12.5));
}

TEST_CASE("decode_hole falls back to numeric id and nested gps") {
    const auto document = nlohmann::json::parse(R"({"id": 42, "gps": {"lat": -12.5, "lon": 130.8}})");
    const Hole hole = decode_hole(document);

    REQUIRE(hole.external_id == "42");
    REQUIRE(hole.has_coordinates());
    REQUIRE(*hole.latitude_deg == Approx(-12.5));
    REQUIRE_FALSE(hole.elevation_m.has_value());
}

TEST_CASE("decode_hole leaves unsurveyed holes without coordinates") {
    const Hole hole = decode_hole(nlohmann::json::parse(R"({"hole_id": "HK_02", "gps_lat": null})"));
    REQUIRE(hole.external_id == "HK_02");
    REQUIRE_FALSE(hole.has_coordinates());
}

TEST_CASE("decode_hole_list_response requires a successful envelope") {
    const auto holes = decode_hole_list_response(
        R"({"success": true, "holes": [{"hole_id": "A", "gps_lat": 1, "gps_lon": 2}, {"id": "B"}]})"
    );
    REQUIRE(holes.has_value());
    REQUIRE(holes->size() == 2);
    REQUIRE(holes->at(0).external_id == "A");
    REQUIRE(holes->at(1).external_id == "B");

    REQUIRE(decode_hole_list_response(R"({"success": true})")->empty());
    REQUIRE_FALSE(decode_hole_list_response(R"({"success": false, "holes": []})").has_value());
    REQUIRE_FALSE(decode_hole_list_response(R"({"holes": []})").has_value());
    REQUIRE_FALSE(decode_hole_list_response(R"({"success": true, "holes": {}})").has_value());
    REQUIRE_FALSE(decode_hole_list_response("<html>502</html>").has_value());
}

TEST_CASE("decode_hole_response unwraps a single hole") {
    const auto hole = decode_hole_response(R"({"success": true, "hole": {"hole_id": "HK_03", "name": "South"}})");
    REQUIRE(hole.has_value());
    REQUIRE(hole->external_id == "HK_03");
    REQUIRE_FALSE(decode_hole_response(R"({"success": true})").has_value());
}

TEST_CASE("decode_success_flag accepts only a literal true") {
    REQUIRE(decode_success_flag(R"({"success": true, "message": "ok"})"));
    REQUIRE_FALSE(decode_success_flag(R"({"success": false})"));
    REQUIRE_FALSE(decode_success_flag(R"({"success": "true"})"));
    REQUIRE_FALSE(decode_success_flag(""));
}

TEST_CASE("encode_drilling_speed_report omits an absent sensor id") {
    DrillingSpeedReport report{};
    report.speed = 0.25;
    report.depth = 12.5;
    report.timestamp = WallTimePoint{};

    const auto without_sensor = nlohmann::json::parse(encode_drilling_speed_report(report));
    REQUIRE(without_sensor.at("speed").get<double>() == Approx(0.25));
    REQUIRE(without_sensor.at("depth").get<double>() == Approx(12.5));
    REQUIRE(without_sensor.at("timestamp") == "1970-01-01T00:00:00Z");
    REQUIRE_FALSE(without_sensor.contains("sensor_id"));

    report.sensor_id = "GNSS_RIG";
    const auto with_sensor = nlohmann::json::parse(encode_drilling_speed_report(report));
    REQUIRE(with_sensor.at("sensor_id") == "GNSS_RIG");
}

#include "drill_link/api_codec.hpp"

#include <cmath>
#include <ctime>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace drill_link {

namespace {

std::optional<double> optional_number(const nlohmann::json& container, const char* key) {
    const auto iterator_value = container.find(key);
    if (iterator_value == container.end() || !iterator_value->is_number()) {
        return std::nullopt;
    }
    return iterator_value->get<double>();
}

/**
 * @brief Render a JSON identifier (string or integer) as text; empty if unusable.
 */
std::string identifier_text(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<long long>());
    }
    if (value.is_number_float()) {
        const double number = value.get<double>();
        if (std::isfinite(number) && std::floor(number) == number) {
            return fmt::format("{:.0f}", number);
        }
    }
    return {};
}

std::optional<nlohmann::json> parse_successful_object(std::string_view body) {
    nlohmann::json document = nlohmann::json::parse(body.begin(), body.end(), nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return std::nullopt;
    }
    const auto iterator_success = document.find("success");
    if (iterator_success == document.end() || !iterator_success->is_boolean() || !iterator_success->get<bool>()) {
        return std::nullopt;
    }
    return document;
}

}  // namespace

std::optional<std::string> format_utc_seconds(std::time_t seconds_since_epoch) {
    std::tm utc_time{};
    if (gmtime_r(&seconds_since_epoch, &utc_time) == nullptr) {
        return std::nullopt;
    }
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}Z",
                       static_cast<long long>(utc_time.tm_year) + 1900,
                       utc_time.tm_mon + 1,
                       utc_time.tm_mday,
                       utc_time.tm_hour,
                       utc_time.tm_min,
                       utc_time.tm_sec);
}

std::string format_utc_timestamp(WallTimePoint timestamp) {
    const std::time_t seconds_since_epoch = WallClock::to_time_t(
        std::chrono::time_point_cast<std::chrono::seconds>(timestamp)
    );
    if (std::optional<std::string> rendered = format_utc_seconds(seconds_since_epoch); rendered.has_value()) {
        return std::move(*rendered);
    }
    return format_utc_seconds(WallClock::to_time_t(WallClock::now())).value_or("1970-01-01T00:00:00Z");
}

Hole decode_hole(const nlohmann::json& hole_object) {
    Hole hole{};
    if (!hole_object.is_object()) {
        return hole;
    }

    for (const char* id_key : {"hole_id", "id"}) {
        const auto iterator_id = hole_object.find(id_key);
        if (iterator_id == hole_object.end()) {
            continue;
        }
        hole.external_id = identifier_text(*iterator_id);
        if (!hole.external_id.empty()) {
            break;
        }
    }

    hole.latitude_deg = optional_number(hole_object, "gps_lat");
    hole.longitude_deg = optional_number(hole_object, "gps_lon");
    hole.elevation_m = optional_number(hole_object, "gps_elevation");

    const auto iterator_gps = hole_object.find("gps");
    if (iterator_gps != hole_object.end() && iterator_gps->is_object()) {
        if (!hole.latitude_deg.has_value()) {
            hole.latitude_deg = optional_number(*iterator_gps, "lat");
        }
        if (!hole.longitude_deg.has_value()) {
            hole.longitude_deg = optional_number(*iterator_gps, "lon");
        }
        if (!hole.elevation_m.has_value()) {
            hole.elevation_m = optional_number(*iterator_gps, "elevation");
        }
    }

    const auto iterator_name = hole_object.find("name");
    if (iterator_name != hole_object.end() && iterator_name->is_string()) {
        hole.name = iterator_name->get<std::string>();
    }
    return hole;
}

std::optional<HoleList> decode_hole_list_response(std::string_view body) {
    const std::optional<nlohmann::json> document = parse_successful_object(body);
    if (!document.has_value()) {
        return std::nullopt;
    }
    const auto iterator_holes = document->find("holes");
    if (iterator_holes == document->end()) {
        return HoleList{};
    }
    if (!iterator_holes->is_array()) {
        return std::nullopt;
    }

    HoleList holes;
    holes.reserve(iterator_holes->size());
    for (const nlohmann::json& hole_object : *iterator_holes) {
        holes.push_back(decode_hole(hole_object));
    }
    return holes;
}

std::optional<Hole> decode_hole_response(std::string_view body) {
    const std::optional<nlohmann::json> document = parse_successful_object(body);
    if (!document.has_value()) {
        return std::nullopt;
    }
    const auto iterator_hole = document->find("hole");
    if (iterator_hole == document->end() || !iterator_hole->is_object()) {
        return std::nullopt;
    }
    return decode_hole(*iterator_hole);
}

bool decode_success_flag(std::string_view body) {
    return parse_successful_object(body).has_value();
}

std::string encode_drilling_speed_report(const DrillingSpeedReport& report) {
    nlohmann::json body{
        {"speed", report.speed},
        {"depth", report.depth},
        {"timestamp", format_utc_timestamp(report.timestamp)},
    };
    if (report.sensor_id.has_value() && !report.sensor_id->empty()) {
        body["sensor_id"] = *report.sensor_id;
    }
    return body.dump();
}

}  // namespace drill_link

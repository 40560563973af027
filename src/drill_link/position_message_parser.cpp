#include "drill_link/position_message_parser.hpp"

#include <array>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace drill_link {

namespace {

constexpr std::size_t k_talker_window{7};        /**< "$" + talker + "GGA" fits in the first 7 characters. */
constexpr std::size_t k_min_sentence_fields{10}; /**< Altitude is field 9, so fewer fields cannot carry a fix. */
constexpr std::size_t k_latitude_field{2};
constexpr std::size_t k_latitude_hemisphere_field{3};
constexpr std::size_t k_longitude_field{4};
constexpr std::size_t k_longitude_hemisphere_field{5};
constexpr std::size_t k_altitude_field{9};
constexpr std::size_t k_minute_integer_digits{2}; /**< Minutes always carry two integer digits (MM.mmmm). */
constexpr double k_minutes_per_degree{60.0};

/**
 * @brief Location of a JSON object that may hold coordinate keys.
 *
 * Segments are followed from the document root; empty segments are ignored,
 * so a rule with no segments addresses the root itself.
 */
struct ContainerRule final {
    std::array<std::string_view, 2> path{};
};

/**
 * @brief Containers searched for coordinates, in priority order. The first
 *        container yielding both latitude and longitude wins.
 */
constexpr std::array<ContainerRule, 4> k_container_rules{{
    {{}},
    {{"gps"}},
    {{"location"}},
    {{"gnss"}},
}};

constexpr std::array<std::string_view, 3> k_latitude_aliases{"lat", "latitude", "gps_lat"};
constexpr std::array<std::string_view, 3> k_longitude_aliases{"lon", "longitude", "gps_lon"};
constexpr std::array<std::string_view, 3> k_elevation_aliases{"elevation", "alt", "gps_elevation"};

std::string_view trim(std::string_view text) {
    constexpr std::string_view k_whitespace{" \t\r\n\v\f"};
    const std::size_t first = text.find_first_not_of(k_whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const std::size_t last = text.find_last_not_of(k_whitespace);
    return text.substr(first, last - first + 1);
}

std::optional<double> parse_number(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    const std::string owned_text{text};
    try {
        std::size_t consumed = 0;
        const double value = std::stod(owned_text, &consumed);
        if (consumed != owned_text.size() || !std::isfinite(value)) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::vector<std::string_view> split_fields(std::string_view sentence) {
    std::vector<std::string_view> fields;
    std::size_t start = 0;
    while (true) {
        const std::size_t comma = sentence.find(',', start);
        if (comma == std::string_view::npos) {
            fields.push_back(sentence.substr(start));
            break;
        }
        fields.push_back(sentence.substr(start, comma - start));
        start = comma + 1;
    }
    return fields;
}

/**
 * @brief Convert a (D)DDMM.MMMM magnitude plus hemisphere letter to signed degrees.
 */
std::optional<double> parse_sentence_coordinate(std::string_view magnitude,
                                                std::string_view hemisphere,
                                                char positive_hemisphere,
                                                char negative_hemisphere) {
    if (magnitude.empty() || hemisphere.size() != 1) {
        return std::nullopt;
    }
    const char hemisphere_letter = hemisphere.front();
    if (hemisphere_letter != positive_hemisphere && hemisphere_letter != negative_hemisphere) {
        return std::nullopt;
    }

    const std::size_t dot_index = magnitude.find('.');
    if (dot_index == std::string_view::npos || dot_index <= k_minute_integer_digits) {
        return std::nullopt;
    }
    const std::size_t degree_digits = dot_index - k_minute_integer_digits;
    const std::optional<double> degrees = parse_number(magnitude.substr(0, degree_digits));
    const std::optional<double> minutes = parse_number(magnitude.substr(degree_digits));
    if (!degrees.has_value() || !minutes.has_value()) {
        return std::nullopt;
    }

    const double value = *degrees + *minutes / k_minutes_per_degree;
    return hemisphere_letter == negative_hemisphere ? -value : value;
}

const nlohmann::json* resolve_container(const nlohmann::json& document, const ContainerRule& rule) {
    const nlohmann::json* node = &document;
    for (const std::string_view segment : rule.path) {
        if (segment.empty()) {
            continue;
        }
        const auto iterator_child = node->find(std::string{segment});
        if (iterator_child == node->end() || !iterator_child->is_object()) {
            return nullptr;
        }
        node = &*iterator_child;
    }
    return node->is_object() ? node : nullptr;
}

std::optional<double> numeric_value(const nlohmann::json& value) {
    if (value.is_number()) {
        const double number = value.get<double>();
        return std::isfinite(number) ? std::optional<double>{number} : std::nullopt;
    }
    if (value.is_string()) {
        return parse_number(trim(value.get_ref<const std::string&>()));
    }
    return std::nullopt;
}

template <std::size_t N>
std::optional<double> first_alias(const nlohmann::json& container, const std::array<std::string_view, N>& aliases) {
    for (const std::string_view alias : aliases) {
        const auto iterator_value = container.find(std::string{alias});
        if (iterator_value == container.end()) {
            continue;
        }
        if (const std::optional<double> value = numeric_value(*iterator_value); value.has_value()) {
            return value;
        }
    }
    return std::nullopt;
}

}  // namespace

std::optional<PositionFix> PositionMessageParser::parse(std::string_view raw_payload) {
    const std::string_view trimmed = trim(raw_payload);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    if (trimmed.front() == '$') {
        if (std::optional<PositionFix> fix = parse_sentence(trimmed); fix.has_value()) {
            return fix;
        }
    }

    const nlohmann::json document = nlohmann::json::parse(trimmed.begin(), trimmed.end(), nullptr, false);
    if (document.is_discarded()) {
        return std::nullopt;
    }
    return parse_document(document);
}

std::optional<PositionFix> PositionMessageParser::parse_document(const nlohmann::json& document) {
    if (document.is_string()) {
        return parse_sentence(document.get_ref<const std::string&>());
    }
    if (document.is_object()) {
        return parse_structured(document);
    }
    return std::nullopt;
}

std::optional<PositionFix> PositionMessageParser::parse_sentence(std::string_view sentence) {
    const std::string_view trimmed = trim(sentence);
    if (trimmed.empty() || trimmed.front() != '$') {
        return std::nullopt;
    }
    if (trimmed.substr(0, k_talker_window).find("GGA") == std::string_view::npos) {
        return std::nullopt;
    }

    const std::vector<std::string_view> fields = split_fields(trimmed);
    if (fields.size() < k_min_sentence_fields) {
        return std::nullopt;
    }

    const std::optional<double> latitude = parse_sentence_coordinate(
        fields[k_latitude_field], fields[k_latitude_hemisphere_field], 'N', 'S'
    );
    const std::optional<double> longitude = parse_sentence_coordinate(
        fields[k_longitude_field], fields[k_longitude_hemisphere_field], 'E', 'W'
    );
    if (!latitude.has_value() || !longitude.has_value()) {
        return std::nullopt;
    }

    PositionFix fix{};
    fix.latitude_deg = *latitude;
    fix.longitude_deg = *longitude;
    fix.elevation_m = parse_number(fields[k_altitude_field]).value_or(0.0);
    fix.received_at = WallClock::now();
    fix.source = FixSource::Sentence;
    return fix;
}

std::optional<PositionFix> PositionMessageParser::parse_structured(const nlohmann::json& document) {
    if (!document.is_object()) {
        return std::nullopt;
    }

    for (const ContainerRule& rule : k_container_rules) {
        const nlohmann::json* container = resolve_container(document, rule);
        if (container == nullptr) {
            continue;
        }
        const std::optional<double> latitude = first_alias(*container, k_latitude_aliases);
        const std::optional<double> longitude = first_alias(*container, k_longitude_aliases);
        if (!latitude.has_value() || !longitude.has_value()) {
            continue;
        }

        PositionFix fix{};
        fix.latitude_deg = *latitude;
        fix.longitude_deg = *longitude;
        fix.elevation_m = first_alias(*container, k_elevation_aliases);
        fix.received_at = WallClock::now();
        fix.source = FixSource::Structured;
        return fix;
    }
    return std::nullopt;
}

}  // namespace drill_link

// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of environment-driven settings that feed
// the bridge. Numeric values that cannot be parsed, or are not positive, fall
// back to their defaults with a warning. The loader never reads from disk;
// callers populate the process environment ahead of time (systemd unit,
// container env, or a shell-sourced `.env`).

#include "drill_link/configuration.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string_view>

#include "drill_link/logging.hpp"
#include "drill_link/nearest_hole_matcher.hpp"

namespace drill_link {

namespace {
constexpr std::string_view k_default_log_directory{"logs"};
constexpr std::string_view k_default_log_level{"info"};
constexpr std::string_view k_default_mqtt_host{"localhost"};
constexpr int k_default_mqtt_port{1883};
constexpr int k_default_keepalive_s{60};
constexpr std::string_view k_default_client_id{"drill_link"};
constexpr std::string_view k_default_topic{"device/+/upload"};
constexpr double k_default_api_timeout_s{10.0};
constexpr double k_default_cache_ttl_s{300.0};
constexpr double k_default_flush_interval_s{2.0};
constexpr int k_default_queue_capacity{1000};

std::optional<std::string> read_string(const char* name) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return std::nullopt;
    }
    return std::string{raw_value};
}

std::string read_string(const char* name, std::string_view fallback) {
    return read_string(name).value_or(std::string{fallback});
}

double read_positive_double(const char* name, double fallback) {
    const std::optional<std::string> raw_value = read_string(name);
    if (!raw_value.has_value()) {
        return fallback;
    }
    try {
        const double parsed_value = std::stod(*raw_value);
        if (parsed_value <= 0.0) {
            get_logger()->warn("{} must be positive; using fallback {}", name, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse {} as a number; using fallback {}", name, fallback);
        return fallback;
    }
}

int read_positive_int(const char* name, int fallback) {
    const std::optional<std::string> raw_value = read_string(name);
    if (!raw_value.has_value()) {
        return fallback;
    }
    try {
        const int parsed_value = std::stoi(*raw_value);
        if (parsed_value <= 0) {
            get_logger()->warn("{} must be positive; using fallback {}", name, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse {} as an integer; using fallback {}", name, fallback);
        return fallback;
    }
}

bool read_flag(const char* name) {
    const std::optional<std::string> raw_value = read_string(name);
    if (!raw_value.has_value()) {
        return false;
    }
    return *raw_value == "1" || *raw_value == "true" || *raw_value == "TRUE" || *raw_value == "yes";
}

}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log_directory = read_string("DRILL_LINK_LOG_DIR", k_default_log_directory);

    auto logger = initialize_logger(config.log_directory);
    logger->info("Loading configuration from environment");

    config.log_level = read_string("DRILL_LINK_LOG_LEVEL", k_default_log_level);

    config.mqtt.host = read_string("DRILL_LINK_MQTT_HOST", k_default_mqtt_host);
    config.mqtt.port = read_positive_int("DRILL_LINK_MQTT_PORT", k_default_mqtt_port);
    config.mqtt.client_id = read_string("DRILL_LINK_MQTT_CLIENT_ID", k_default_client_id);
    config.mqtt.username = read_string("DRILL_LINK_MQTT_USERNAME");
    config.mqtt.password = read_string("DRILL_LINK_MQTT_PASSWORD");
    config.mqtt.tls_enabled = read_flag("DRILL_LINK_MQTT_TLS");
    config.mqtt.ca_certs = read_string("DRILL_LINK_MQTT_CA_CERTS");
    config.mqtt.keepalive_s = read_positive_int("DRILL_LINK_MQTT_KEEPALIVE_S", k_default_keepalive_s);

    if (std::optional<std::string> base_url = read_string("DRILL_LINK_API_BASE_URL"); base_url.has_value()) {
        HttpApiSettings api_settings{};
        api_settings.base_url = std::move(*base_url);
        api_settings.timeout = Duration{read_positive_double("DRILL_LINK_API_TIMEOUT_S", k_default_api_timeout_s)};
        config.api = std::move(api_settings);
    }
    config.project_id = read_string("DRILL_LINK_PROJECT_ID", "");
    config.hole_id = read_string("DRILL_LINK_HOLE_ID", "");

    config.correlation.topic = read_string("DRILL_LINK_MQTT_TOPIC", k_default_topic);
    config.correlation.max_distance_m = read_positive_double(
        "DRILL_LINK_MAX_DISTANCE_M", NearestHoleMatcher::k_default_max_distance_m
    );
    config.correlation.cache_ttl = Duration{read_positive_double("DRILL_LINK_CACHE_TTL_S", k_default_cache_ttl_s)};

    config.queue.flush_interval = Duration{read_positive_double("DRILL_LINK_FLUSH_INTERVAL_S", k_default_flush_interval_s)};
    config.queue.capacity = static_cast<std::size_t>(read_positive_int("DRILL_LINK_QUEUE_CAPACITY", k_default_queue_capacity));

    logger->info("Configuration loaded: broker={}:{} topic={} api={} project={} gate_m={} ttl_s={}",
                 config.mqtt.host,
                 config.mqtt.port,
                 config.correlation.topic,
                 config.api.has_value() ? config.api->base_url : std::string{"<none>"},
                 config.project_id.empty() ? std::string{"<none>"} : config.project_id,
                 config.correlation.max_distance_m,
                 config.correlation.cache_ttl.count());
    return config;
}

}  // namespace drill_link

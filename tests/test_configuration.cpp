#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <catch2/catch.hpp>
#include <spdlog/sinks/ringbuffer_sink.h>

#include "drill_link/configuration.hpp"
#include "drill_link/logging.hpp"

using namespace drill_link;

namespace {
constexpr const char* k_managed_variables[] = {
    "DRILL_LINK_LOG_DIR",       "DRILL_LINK_LOG_LEVEL",        "DRILL_LINK_MQTT_HOST",
    "DRILL_LINK_MQTT_PORT",     "DRILL_LINK_MQTT_CLIENT_ID",   "DRILL_LINK_MQTT_USERNAME",
    "DRILL_LINK_MQTT_PASSWORD", "DRILL_LINK_MQTT_TLS",         "DRILL_LINK_MQTT_CA_CERTS",
    "DRILL_LINK_MQTT_KEEPALIVE_S", "DRILL_LINK_MQTT_TOPIC",    "DRILL_LINK_API_BASE_URL",
    "DRILL_LINK_API_TIMEOUT_S", "DRILL_LINK_PROJECT_ID",       "DRILL_LINK_HOLE_ID",
    "DRILL_LINK_MAX_DISTANCE_M", "DRILL_LINK_CACHE_TTL_S",     "DRILL_LINK_FLUSH_INTERVAL_S",
    "DRILL_LINK_QUEUE_CAPACITY",
};

/** @brief Clears every loader variable on entry and exit. */
struct ScopedEnvironment final {
    ScopedEnvironment() {
        clear();
        const auto log_dir = std::filesystem::temp_directory_path() / "drill_link_tests_logs";
        ::setenv("DRILL_LINK_LOG_DIR", log_dir.c_str(), 1);
    }
    ~ScopedEnvironment() {
        clear();
    }

    static void clear() {
        for (const char* name : k_managed_variables) {
            ::unsetenv(name);
        }
    }
};
}  // namespace

TEST_CASE("ConfigurationLoader applies defaults") {
    const ScopedEnvironment environment{};
    const Configuration config = ConfigurationLoader::load();

    REQUIRE(config.log_level == "info");
    REQUIRE(config.mqtt.host == "localhost");
    REQUIRE(config.mqtt.port == 1883);
    REQUIRE(config.mqtt.keepalive_s == 60);
    REQUIRE_FALSE(config.mqtt.tls_enabled);
    REQUIRE_FALSE(config.mqtt.username.has_value());
    REQUIRE_FALSE(config.api.has_value());
    REQUIRE(config.project_id.empty());
    REQUIRE(config.hole_id.empty());
    REQUIRE(config.correlation.topic == "device/+/upload");
    REQUIRE(config.correlation.max_distance_m == Approx(10.0));
    REQUIRE(config.correlation.cache_ttl.count() == Approx(300.0));
    REQUIRE(config.queue.flush_interval.count() == Approx(2.0));
    REQUIRE(config.queue.capacity == 1000);
}

TEST_CASE("ConfigurationLoader reads overrides from the environment") {
    const ScopedEnvironment environment{};
    ::setenv("DRILL_LINK_MQTT_HOST", "broker.example.net", 1);
    ::setenv("DRILL_LINK_MQTT_PORT", "8883", 1);
    ::setenv("DRILL_LINK_MQTT_TLS", "true", 1);
    ::setenv("DRILL_LINK_MQTT_USERNAME", "rig", 1);
    ::setenv("DRILL_LINK_API_BASE_URL", "https://drill.example.net/api", 1);
    ::setenv("DRILL_LINK_API_TIMEOUT_S", "4.5", 1);
    ::setenv("DRILL_LINK_PROJECT_ID", "P1", 1);
    ::setenv("DRILL_LINK_HOLE_ID", "HK_01", 1);
    ::setenv("DRILL_LINK_MAX_DISTANCE_M", "25", 1);
    ::setenv("DRILL_LINK_QUEUE_CAPACITY", "50", 1);

    const Configuration config = ConfigurationLoader::load();

    REQUIRE(config.mqtt.host == "broker.example.net");
    REQUIRE(config.mqtt.port == 8883);
    REQUIRE(config.mqtt.tls_enabled);
    REQUIRE(config.mqtt.username == std::optional<std::string>{"rig"});
    REQUIRE(config.api.has_value());
    REQUIRE(config.api->base_url == "https://drill.example.net/api");
    REQUIRE(config.api->timeout.count() == Approx(4.5));
    REQUIRE(config.project_id == "P1");
    REQUIRE(config.hole_id == "HK_01");
    REQUIRE(config.correlation.max_distance_m == Approx(25.0));
    REQUIRE(config.queue.capacity == 50);
}

TEST_CASE("ConfigurationLoader falls back on invalid numbers") {
    const ScopedEnvironment environment{};
    ::setenv("DRILL_LINK_MQTT_PORT", "not-a-port", 1);
    ::setenv("DRILL_LINK_MAX_DISTANCE_M", "-3", 1);
    ::setenv("DRILL_LINK_CACHE_TTL_S", "soon", 1);
    ::setenv("DRILL_LINK_QUEUE_CAPACITY", "0", 1);

    const Configuration config = ConfigurationLoader::load();

    REQUIRE(config.mqtt.port == 1883);
    REQUIRE(config.correlation.max_distance_m == Approx(10.0));
    REQUIRE(config.correlation.cache_ttl.count() == Approx(300.0));
    REQUIRE(config.queue.capacity == 1000);
}

TEST_CASE("ConfigurationLoader warns when an integer is not positive") {
    const ScopedEnvironment environment{};
    ::setenv("DRILL_LINK_QUEUE_CAPACITY", "-5", 1);
    ::setenv("DRILL_LINK_MQTT_KEEPALIVE_S", "0", 1);

    // Loading first makes sure the shared logger exists before a sink is attached.
    (void)ConfigurationLoader::load();
    auto logger = get_logger();
    auto captured = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(64);
    logger->sinks().push_back(captured);
    const auto previous_level = logger->level();
    logger->set_level(spdlog::level::warn);

    const Configuration config = ConfigurationLoader::load();

    logger->set_level(previous_level);
    logger->sinks().pop_back();

    REQUIRE(config.queue.capacity == 1000);
    REQUIRE(config.mqtt.keepalive_s == 60);

    const std::vector<std::string> messages = captured->last_formatted();
    const auto mentions = [&messages](const std::string& name) {
        return std::any_of(messages.begin(), messages.end(), [&name](const std::string& message) {
            return message.find(name + " must be positive") != std::string::npos;
        });
    };
    REQUIRE(mentions("DRILL_LINK_QUEUE_CAPACITY"));
    REQUIRE(mentions("DRILL_LINK_MQTT_KEEPALIVE_S"));
}

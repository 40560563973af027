// === Configuration ===========================================================
//
// Exposes the strongly-typed configuration consumed by the bridge: broker
// connection, remote API, hole matching, and telemetry queue settings.
// `ConfigurationLoader` translates environment variables into these
// structures so downstream modules never touch `std::getenv` directly.

#pragma once

#include <optional>
#include <string>

#include "drill_link/http_drilling_api.hpp"
#include "drill_link/mosquitto_transport.hpp"
#include "drill_link/position_correlation_service.hpp"
#include "drill_link/telemetry_coalescing_queue.hpp"

namespace drill_link {

/**
 * @brief Immutable bundle of runtime knobs for the bridge.
 *
 * Every field is populated by ConfigurationLoader. An absent `api` means the
 * bridge only monitors positions; an absent `hole_id` disables the
 * coalescing delivery path.
 */
struct Configuration final {
    std::string log_directory{};                /**< Destination directory for structured logs. */
    std::string log_level{"info"};              /**< spdlog level name. */
    MqttSettings mqtt{};                        /**< Broker connection. */
    std::optional<HttpApiSettings> api{};       /**< Remote hole service, when configured. */
    std::string project_id{};                   /**< Project the holes belong to. */
    std::string hole_id{};                      /**< Fixed target for the coalescing queue. */
    CorrelationSettings correlation{};          /**< Subscription and matching knobs. */
    QueueSettings queue{};                      /**< Coalescing queue knobs. */
};

/**
 * @brief Utility responsible for hydrating Configuration from environment
 *        variables.
 */
class ConfigurationLoader final {
  public:
    /** @brief Read the environment; initializes the shared logger as a side effect. */
    static Configuration load();
};

}  // namespace drill_link

#include <array>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>

#include <poll.h>
#include <unistd.h>

#include "drill_link/configuration.hpp"
#include "drill_link/http_drilling_api.hpp"
#include "drill_link/logging.hpp"
#include "drill_link/mosquitto_transport.hpp"
#include "drill_link/position_correlation_service.hpp"
#include "drill_link/telemetry_coalescing_queue.hpp"
#include "drill_link/version.hpp"

namespace {
std::atomic<bool> should_terminate{false};

void handle_signal(int) {
    should_terminate.store(true);
}

constexpr int k_stdin_poll_timeout_ms{500};

/**
 * @brief Feed "<velocity_mps> <depth_m>" lines from stdin into both delivery paths.
 *
 * Polls stdin so the thread notices termination without waiting for input.
 * End of input also requests termination.
 */
void pump_sensor_samples(drill_link::PositionCorrelationService& correlation_service,
                         drill_link::TelemetryCoalescingQueue* telemetry_queue) {
    auto logger = drill_link::get_logger();
    std::string pending_text;
    std::array<char, 4096> read_buffer{};

    while (!should_terminate.load()) {
        pollfd stdin_poll{STDIN_FILENO, POLLIN, 0};
        const int ready = ::poll(&stdin_poll, 1, k_stdin_poll_timeout_ms);
        if (ready <= 0) {
            continue;
        }
        const ssize_t bytes_read = ::read(STDIN_FILENO, read_buffer.data(), read_buffer.size());
        if (bytes_read <= 0) {
            logger->info("Sensor input closed");
            should_terminate.store(true);
            break;
        }
        pending_text.append(read_buffer.data(), static_cast<std::size_t>(bytes_read));

        std::size_t newline = pending_text.find('\n');
        while (newline != std::string::npos) {
            const std::string line = pending_text.substr(0, newline);
            pending_text.erase(0, newline + 1);
            newline = pending_text.find('\n');

            std::istringstream line_stream{line};
            double velocity_mps{};
            double depth_m{};
            if (!(line_stream >> velocity_mps >> depth_m)) {
                logger->warn("Ignoring malformed sensor line: {}", line);
                continue;
            }
            correlation_service.set_drilling_data(velocity_mps, depth_m);
            if (telemetry_queue != nullptr) {
                telemetry_queue->add(velocity_mps, depth_m);
            }
        }
    }
}
}  // namespace

int main() {
    using namespace drill_link;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        Configuration configuration = ConfigurationLoader::load();
        set_log_level(configuration.log_level);
        auto logger = get_logger();
        logger->info("drill_link bridge {} starting", k_version);

        std::shared_ptr<DrillingApi> api;
        if (configuration.api.has_value()) {
            api = std::make_shared<HttpDrillingApi>(*configuration.api);
            if (!api->test_connection()) {
                logger->warn("Remote hole service did not answer; continuing, requests will be retried");
            }
        }

        std::optional<DrillingLink> link;
        if (api != nullptr && !configuration.project_id.empty()) {
            link = DrillingLink{api, configuration.project_id};
        }

        MosquittoTransport transport{configuration.mqtt};
        PositionCorrelationService correlation_service{transport, configuration.correlation, link};
        if (!correlation_service.start()) {
            logger->critical("Unable to start position correlation");
            return EXIT_FAILURE;
        }

        std::unique_ptr<TelemetryCoalescingQueue> telemetry_queue;
        if (api != nullptr && !configuration.project_id.empty() && !configuration.hole_id.empty()) {
            TelemetryTarget target{};
            target.project_id = configuration.project_id;
            target.hole_id = configuration.hole_id;
            telemetry_queue = std::make_unique<TelemetryCoalescingQueue>(api, target, configuration.queue);
            if (const std::optional<Hole> hole = api->get_hole(configuration.project_id, configuration.hole_id);
                hole.has_value()) {
                logger->info("Telemetry queue delivering to hole {} ({})", hole->external_id, hole->name);
            }
            telemetry_queue->start();
        }

        std::thread sensor_thread{pump_sensor_samples, std::ref(correlation_service), telemetry_queue.get()};

        while (!should_terminate.load()) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        sensor_thread.join();
        if (telemetry_queue != nullptr) {
            telemetry_queue->stop();
        }
        correlation_service.stop();
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

// === Mosquitto Transport =====================================================
//
// libmosquitto implementation of `MessageTransport`. The library's threaded
// network loop (`mosquitto_loop_start`) invokes the registered listener, so
// listeners run on that thread and must return promptly. The loop reconnects
// on its own; subscriptions are replayed on every successful connect.

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "drill_link/logging.hpp"
#include "drill_link/message_transport.hpp"

struct mosquitto;
struct mosquitto_message;

namespace drill_link {

/** @brief Broker connection parameters. */
struct MqttSettings final {
    std::string host{"localhost"};
    int port{1883};
    std::string client_id{"drill_link"};
    std::optional<std::string> username{};
    std::optional<std::string> password{};
    bool tls_enabled{false};
    std::optional<std::string> ca_certs{};  /**< CA bundle path; system defaults when unset. */
    int keepalive_s{60};
};

class MosquittoTransport final : public MessageTransport {
  public:
    explicit MosquittoTransport(MqttSettings settings);
    ~MosquittoTransport() override;

    MosquittoTransport(const MosquittoTransport&) = delete;
    MosquittoTransport& operator=(const MosquittoTransport&) = delete;

    [[nodiscard]] const MqttSettings& settings() const noexcept;

    void set_listener(MessageListener* listener) override;
    [[nodiscard]] bool connect() override;
    [[nodiscard]] bool subscribe(const std::string& topic_filter, int qos) override;
    void disconnect() override;

  private:
    static void handle_connect(mosquitto* client, void* user_data, int result_code);
    static void handle_disconnect(mosquitto* client, void* user_data, int result_code);
    static void handle_message(mosquitto* client, void* user_data, const mosquitto_message* message);

    MqttSettings settings_;
    mosquitto* client_{nullptr};
    std::atomic<MessageListener*> listener_{nullptr};
    std::mutex subscriptions_mutex_;
    std::vector<std::pair<std::string, int>> list_subscriptions_;  /**< Replayed after every (re)connect. */
    bool loop_started_{false};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace drill_link

#include "drill_link/mosquitto_transport.hpp"

#include <mutex>
#include <stdexcept>

#include <mosquitto.h>

namespace drill_link {

namespace {

std::once_flag library_once_flag;

/**
 * @brief mosquitto_lib_init() is process-wide; cleanup is left to process exit.
 */
void ensure_library_initialized() {
    std::call_once(library_once_flag, []() { mosquitto_lib_init(); });
}

}  // namespace

MosquittoTransport::MosquittoTransport(MqttSettings settings)
    : settings_(std::move(settings)),
      logger_(get_logger()) {
    if (settings_.host.empty()) {
        throw std::invalid_argument("MosquittoTransport requires a broker host");
    }
    if (settings_.port <= 0 || settings_.port > 65535) {
        throw std::invalid_argument("MosquittoTransport port out of range");
    }

    ensure_library_initialized();
    client_ = mosquitto_new(settings_.client_id.empty() ? nullptr : settings_.client_id.c_str(), true, this);
    if (client_ == nullptr) {
        throw std::runtime_error("mosquitto_new failed");
    }
    mosquitto_connect_callback_set(client_, &MosquittoTransport::handle_connect);
    mosquitto_disconnect_callback_set(client_, &MosquittoTransport::handle_disconnect);
    mosquitto_message_callback_set(client_, &MosquittoTransport::handle_message);

    if (settings_.username.has_value()) {
        const char* password = settings_.password.has_value() ? settings_.password->c_str() : nullptr;
        const int rc = mosquitto_username_pw_set(client_, settings_.username->c_str(), password);
        if (rc != MOSQ_ERR_SUCCESS) {
            logger_->warn("MQTT credentials rejected: {}", mosquitto_strerror(rc));
        }
    }
    if (settings_.tls_enabled) {
        const char* ca_file = settings_.ca_certs.has_value() ? settings_.ca_certs->c_str() : nullptr;
        const char* ca_path = ca_file == nullptr ? "/etc/ssl/certs" : nullptr;
        const int rc = mosquitto_tls_set(client_, ca_file, ca_path, nullptr, nullptr, nullptr);
        if (rc != MOSQ_ERR_SUCCESS) {
            logger_->error("MQTT TLS configuration failed: {}", mosquitto_strerror(rc));
        }
    }
}

MosquittoTransport::~MosquittoTransport() {
    disconnect();
    if (client_ != nullptr) {
        mosquitto_destroy(client_);
        client_ = nullptr;
    }
}

const MqttSettings& MosquittoTransport::settings() const noexcept {
    return settings_;
}

void MosquittoTransport::set_listener(MessageListener* listener) {
    listener_.store(listener);
}

bool MosquittoTransport::connect() {
    logger_->info("Connecting to MQTT broker {}:{}", settings_.host, settings_.port);
    const int rc = mosquitto_connect(client_, settings_.host.c_str(), settings_.port, settings_.keepalive_s);
    if (rc != MOSQ_ERR_SUCCESS) {
        logger_->error("MQTT connect to {}:{} failed: {}", settings_.host, settings_.port, mosquitto_strerror(rc));
        return false;
    }
    const int loop_rc = mosquitto_loop_start(client_);
    if (loop_rc != MOSQ_ERR_SUCCESS) {
        logger_->error("MQTT network loop failed to start: {}", mosquitto_strerror(loop_rc));
        mosquitto_disconnect(client_);
        return false;
    }
    loop_started_ = true;
    return true;
}

bool MosquittoTransport::subscribe(const std::string& topic_filter, int qos) {
    const int rc = mosquitto_subscribe(client_, nullptr, topic_filter.c_str(), qos);
    if (rc != MOSQ_ERR_SUCCESS) {
        logger_->error("MQTT subscribe to {} failed: {}", topic_filter, mosquitto_strerror(rc));
        return false;
    }
    {
        std::scoped_lock lock(subscriptions_mutex_);
        list_subscriptions_.emplace_back(topic_filter, qos);
    }
    logger_->info("Subscribed to MQTT topic {}", topic_filter);
    return true;
}

void MosquittoTransport::disconnect() {
    if (!loop_started_) {
        return;
    }
    logger_->info("Disconnecting from MQTT broker {}:{}", settings_.host, settings_.port);
    mosquitto_disconnect(client_);
    mosquitto_loop_stop(client_, false);
    loop_started_ = false;
    std::scoped_lock lock(subscriptions_mutex_);
    list_subscriptions_.clear();
}

void MosquittoTransport::handle_connect(mosquitto* client, void* user_data, int result_code) {
    auto* self = static_cast<MosquittoTransport*>(user_data);
    if (result_code != 0) {
        self->logger_->error("MQTT broker refused connection: {}", mosquitto_connack_string(result_code));
        return;
    }
    self->logger_->info("Connected to MQTT broker {}:{}", self->settings_.host, self->settings_.port);

    std::scoped_lock lock(self->subscriptions_mutex_);
    for (const auto& [topic_filter, qos] : self->list_subscriptions_) {
        const int rc = mosquitto_subscribe(client, nullptr, topic_filter.c_str(), qos);
        if (rc != MOSQ_ERR_SUCCESS) {
            self->logger_->warn("MQTT resubscribe to {} failed: {}", topic_filter, mosquitto_strerror(rc));
        }
    }
}

void MosquittoTransport::handle_disconnect(mosquitto*, void* user_data, int result_code) {
    auto* self = static_cast<MosquittoTransport*>(user_data);
    if (result_code == 0) {
        self->logger_->info("MQTT connection closed");
    } else {
        self->logger_->warn("MQTT connection lost (rc={}); library will reconnect", result_code);
    }
}

void MosquittoTransport::handle_message(mosquitto*, void* user_data, const mosquitto_message* message) {
    auto* self = static_cast<MosquittoTransport*>(user_data);
    MessageListener* listener = self->listener_.load();
    if (listener == nullptr || message == nullptr || message->topic == nullptr) {
        return;
    }
    try {
        const std::string payload = message->payloadlen > 0
            ? std::string(static_cast<const char*>(message->payload), static_cast<std::size_t>(message->payloadlen))
            : std::string{};
        listener->on_message(message->topic, payload);
    } catch (const std::exception& exc) {
        self->logger_->error("MQTT message handler raised on {}: {}", message->topic, exc.what());
    }
}

}  // namespace drill_link

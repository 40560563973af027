// === Message Transport =======================================================
//
// Publish/subscribe seam used by the correlation service. A transport delivers
// inbound messages to one registered `MessageListener` from its own network
// thread, one message at a time in arrival order.

#pragma once

#include <string>

namespace drill_link {

/** @brief Receiver of inbound transport messages. Must not throw. */
class MessageListener {
  public:
    virtual ~MessageListener() = default;

    virtual void on_message(const std::string& topic, const std::string& payload) = 0;
};

/** @brief Minimal subscribe-only broker connection. */
class MessageTransport {
  public:
    virtual ~MessageTransport() = default;

    /** @brief Register the receiver for inbound messages; nullptr unregisters. */
    virtual void set_listener(MessageListener* listener) = 0;
    /** @brief Open the broker connection and start the network thread. */
    [[nodiscard]] virtual bool connect() = 0;
    /** @brief Subscribe to a topic filter (supports '+' and '#'). */
    [[nodiscard]] virtual bool subscribe(const std::string& topic_filter, int qos) = 0;
    /** @brief Stop the network thread and close the connection. */
    virtual void disconnect() = 0;
};

}  // namespace drill_link

// include/mqtt2db/subscriber.hpp
#pragma once

#include "config.hpp"
#include "error.hpp"
#include "log.hpp"
#include "mapping.hpp"
#include "mqtt_handle.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <MQTTAsync.h>

namespace mqtt2db {

/**
 * @brief Callback function type for receiving inbound MQTT messages.
 *
 * Invoked on the Paho client thread, one message at a time.
 */
using MessageCallback = std::function<void(const InboundMessage&)>;

/**
 * @brief MQTT subscriber that feeds inbound publishes to a message callback.
 *
 * @par Thread Safety
 * connect(), subscribe() and disconnect() serialize on an internal mutex. Paho callbacks
 * run on the client thread without holding it.
 *
 * @par Example Usage
 * @code
 * mqtt2db::Subscriber::Config config{
 *   .broker_url = "tcp://localhost:1883",
 *   .client_id = "mqtt2db",
 *   .message_callback = [](const mqtt2db::InboundMessage& msg) { ... },
 * };
 * mqtt2db::Subscriber subscriber(std::move(config));
 * if (subscriber.connect()) {
 *   std::vector<std::string> topics{"sensors/+/temp"};
 *   (void)subscriber.subscribe(topics);
 * }
 * @endcode
 */
class Subscriber {
public:
  /**
   * @brief TLS/SSL configuration options for secure MQTT connections.
   */
  struct TlsOptions {
    std::string trust_store;             ///< Path to CA certificate file (PEM format)
    std::string key_store;               ///< Path to client certificate file (optional)
    std::string private_key;             ///< Path to client private key file (optional)
    bool enable_server_cert_auth = true; ///< Verify server certificate (default: true)
  };

  /**
   * @brief Configuration parameters for the subscriber.
   */
  struct Config {
    std::string broker_url;       ///< e.g. "tcp://localhost:1883" or "ssl://localhost:8883"
    std::string client_id;        ///< Unique MQTT client identifier
    int qos = 1;                  ///< Subscription QoS (default: 1, at least once)
    bool clean_session = true;    ///< MQTT clean session flag
    int keep_alive_interval = 60; ///< Keep-alive interval in seconds
    std::chrono::seconds connect_timeout{10}; ///< How long connect() waits
    bool automatic_reconnect = true;          ///< Reconnect and resubscribe after loss
    std::optional<TlsOptions> tls{};          ///< Required if broker_url uses ssl://
    std::optional<std::string> username{};    ///< MQTT username (optional)
    std::optional<std::string> password{};    ///< MQTT password (optional)
    MessageCallback message_callback{};       ///< Receives every inbound publish
    LogCallback log_callback{};               ///< Optional callback for log messages
  };

  /**
   * @brief Builds a subscriber configuration from the daemon's MQTT settings.
   *
   * Uses ssl:// when a CA file is configured and tcp:// otherwise.
   */
  [[nodiscard]] static Config make_config(const MqttConfig& mqtt);

  explicit Subscriber(Config config);
  ~Subscriber();

  Subscriber(const Subscriber&) = delete;
  Subscriber& operator=(const Subscriber&) = delete;
  Subscriber(Subscriber&&) = delete;
  Subscriber& operator=(Subscriber&&) = delete;

  /**
   * @brief Sets the message callback.
   *
   * @note Must be called before connect().
   */
  void set_message_callback(MessageCallback callback);

  /**
   * @brief Sets the log callback. Can be called at any time.
   */
  void set_log_callback(LogCallback callback);

  /**
   * @brief Connects to the broker and waits up to Config::connect_timeout.
   *
   * @return void on success, ConnectionFailed on failure or timeout
   */
  [[nodiscard]] Result<void> connect();

  /**
   * @brief Gracefully disconnects from the broker.
   *
   * @return void on success, ConnectionFailed when not connected
   */
  [[nodiscard]] Result<void> disconnect();

  /**
   * @brief Subscribes to every topic filter at the configured QoS and waits for the
   * broker's acknowledgement.
   *
   * @return void on success, SubscribeFailed on failure or timeout
   */
  [[nodiscard]] Result<void> subscribe(std::span<const std::string> topics);

  [[nodiscard]] bool is_connected() const;

  void log(LogLevel level, std::string_view message) const noexcept;

private:
  Config config_;
  MQTTAsyncHandle client_;
  std::atomic<bool> is_connected_{false};
  std::atomic<bool> reconnecting_{false}; // Set on connection loss, cleared on reconnect

  std::vector<std::string> topics_; // Resubscribed after an automatic reconnect
  std::mutex topics_mutex_;

  // Must outlive the asynchronous connect
  MQTTAsync_SSLOptions ssl_opts_{};

  mutable std::mutex mutex_;

  static int on_message_arrived(void* context, char* topicName, int topicLen,
                                MQTTAsync_message* message);

  static void on_connection_lost(void* context, char* cause);

  static void on_reconnected(void* context, char* cause);
};

} // namespace mqtt2db

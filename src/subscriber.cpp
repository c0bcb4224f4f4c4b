// src/subscriber.cpp
#include "mqtt2db/subscriber.hpp"

#include <cstring>
#include <future>
#include <stdexcept>
#include <utility>
#include <vector>

#include <MQTTAsync.h>

namespace mqtt2db {

namespace {
constexpr int DISCONNECT_TIMEOUT_MS = 11000;
constexpr int SUBSCRIBE_TIMEOUT_MS = 5000;

void on_connect_success(void* context, MQTTAsync_successData* response) {
  (void)response;
  auto* promise = static_cast<std::promise<void>*>(context);
  promise->set_value();
}

void on_connect_failure(void* context, MQTTAsync_failureData* response) {
  auto* promise = static_cast<std::promise<void>*>(context);
  std::string error;
  if (response) {
    error = stdx::format("Connection failed: code={}, message={}", response->code,
                         response->message ? response->message : "none");
  } else {
    error = "Connection failed: no response data";
  }
  promise->set_exception(std::make_exception_ptr(std::runtime_error(error)));
}

void on_disconnect_success(void* context, MQTTAsync_successData* response) {
  (void)response;
  auto* promise = static_cast<std::promise<void>*>(context);
  promise->set_value();
}

void on_disconnect_failure(void* context, MQTTAsync_failureData* response) {
  auto* promise = static_cast<std::promise<void>*>(context);
  auto error = stdx::format("Disconnect failed: code={}", response ? response->code : -1);
  promise->set_exception(std::make_exception_ptr(std::runtime_error(error)));
}

void on_subscribe_success(void* context, MQTTAsync_successData* response) {
  (void)response;
  auto* promise = static_cast<std::promise<void>*>(context);
  promise->set_value();
}

void on_subscribe_failure(void* context, MQTTAsync_failureData* response) {
  auto* promise = static_cast<std::promise<void>*>(context);
  auto error = stdx::format("Subscribe failed: code={}", response ? response->code : -1);
  promise->set_exception(std::make_exception_ptr(std::runtime_error(error)));
}

std::vector<char*> topic_filters(const std::vector<std::string>& topics) {
  std::vector<char*> filters;
  filters.reserve(topics.size());
  for (const auto& topic : topics) {
    filters.push_back(const_cast<char*>(topic.c_str()));
  }
  return filters;
}

} // namespace

MQTTAsyncHandle::~MQTTAsyncHandle() noexcept {
  reset();
}

void MQTTAsyncHandle::reset() noexcept {
  if (client_) {
    MQTTAsync_destroy(&client_);
    client_ = nullptr;
  }
}

Subscriber::Config Subscriber::make_config(const MqttConfig& mqtt) {
  Config config{
      .broker_url = stdx::format("{}://{}:{}", mqtt.ca_file ? "ssl" : "tcp", mqtt.host,
                                 mqtt.port),
      .client_id = mqtt.client_id,
  };

  if (mqtt.keep_alive) {
    config.keep_alive_interval = static_cast<int>(mqtt.keep_alive->count());
  }
  if (mqtt.connect_timeout) {
    config.connect_timeout = *mqtt.connect_timeout;
  }

  if (mqtt.ca_file) {
    TlsOptions tls{.trust_store = *mqtt.ca_file};
    if (mqtt.auth) {
      if (const auto* cert = std::get_if<CertificateAuth>(&*mqtt.auth)) {
        tls.key_store = cert->cert_file;
        tls.private_key = cert->private_key_file;
      }
    }
    config.tls = std::move(tls);
  }

  if (mqtt.auth) {
    if (const auto* user = std::get_if<UserPassAuth>(&*mqtt.auth)) {
      config.username = user->username;
      config.password = user->password;
    }
  }

  return config;
}

Subscriber::Subscriber(Config config) : config_(std::move(config)) {
}

Subscriber::~Subscriber() {
  if (client_ && is_connected_) {
    (void)disconnect();
  } else if (client_) {
    MQTTAsync_setCallbacks(client_.get(), nullptr, nullptr, nullptr, nullptr);
  }
}

void Subscriber::set_message_callback(MessageCallback callback) {
  std::scoped_lock lock(mutex_);
  config_.message_callback = std::move(callback);
}

void Subscriber::set_log_callback(LogCallback callback) {
  std::scoped_lock lock(mutex_);
  config_.log_callback = std::move(callback);
}

bool Subscriber::is_connected() const {
  return is_connected_;
}

Result<void> Subscriber::connect() {
  std::scoped_lock lock(mutex_);

  MQTTAsync raw_client = nullptr;
  int rc = MQTTAsync_create(&raw_client, config_.broker_url.c_str(), config_.client_id.c_str(),
                            MQTTCLIENT_PERSISTENCE_NONE, nullptr);
  if (rc != MQTTASYNC_SUCCESS) {
    return make_error(ErrorCode::ConnectionFailed,
                      stdx::format("Failed to create client: {}", rc));
  }
  client_ = MQTTAsyncHandle(raw_client);

  rc = MQTTAsync_setCallbacks(client_.get(), this, on_connection_lost, on_message_arrived,
                              nullptr);
  if (rc != MQTTASYNC_SUCCESS) {
    return make_error(ErrorCode::ConnectionFailed,
                      stdx::format("Failed to set callbacks: {}", rc));
  }

  rc = MQTTAsync_setConnected(client_.get(), this, on_reconnected);
  if (rc != MQTTASYNC_SUCCESS) {
    return make_error(ErrorCode::ConnectionFailed,
                      stdx::format("Failed to set connected callback: {}", rc));
  }

  MQTTAsync_connectOptions conn_opts = MQTTAsync_connectOptions_initializer;
  conn_opts.keepAliveInterval = config_.keep_alive_interval;
  conn_opts.cleansession = config_.clean_session;
  conn_opts.connectTimeout = static_cast<int>(config_.connect_timeout.count());
  conn_opts.automaticReconnect = config_.automatic_reconnect ? 1 : 0;

  if (config_.username.has_value()) {
    conn_opts.username = config_.username.value().c_str();
  }
  if (config_.password.has_value()) {
    conn_opts.password = config_.password.value().c_str();
  }

  ssl_opts_ = MQTTAsync_SSLOptions_initializer;
  if (config_.tls.has_value()) {
    const auto& tls = config_.tls.value();
    ssl_opts_.trustStore = tls.trust_store.c_str();
    ssl_opts_.keyStore = tls.key_store.empty() ? nullptr : tls.key_store.c_str();
    ssl_opts_.privateKey = tls.private_key.empty() ? nullptr : tls.private_key.c_str();
    ssl_opts_.enableServerCertAuth = tls.enable_server_cert_auth;
    conn_opts.ssl = &ssl_opts_;
  }

  std::promise<void> connect_promise;
  auto connect_future = connect_promise.get_future();

  conn_opts.context = &connect_promise;
  conn_opts.onSuccess = on_connect_success;
  conn_opts.onFailure = on_connect_failure;

  rc = MQTTAsync_connect(client_.get(), &conn_opts);
  if (rc != MQTTASYNC_SUCCESS) {
    MQTTAsync_setCallbacks(client_.get(), nullptr, nullptr, nullptr, nullptr);
    return make_error(ErrorCode::ConnectionFailed, stdx::format("Failed to connect: {}", rc));
  }

  auto status = connect_future.wait_for(config_.connect_timeout);
  if (status == std::future_status::timeout) {
    MQTTAsync_setCallbacks(client_.get(), nullptr, nullptr, nullptr, nullptr);
    MQTTAsync_disconnectOptions disc_opts = MQTTAsync_disconnectOptions_initializer;
    disc_opts.timeout = 1000;
    MQTTAsync_disconnect(client_.get(), &disc_opts);
    return make_error(ErrorCode::ConnectionFailed, "Connection timeout");
  }

  try {
    connect_future.get();
  } catch (const std::exception& e) {
    MQTTAsync_setCallbacks(client_.get(), nullptr, nullptr, nullptr, nullptr);
    return make_error(ErrorCode::ConnectionFailed, e.what());
  }

  is_connected_ = true;
  return {};
}

Result<void> Subscriber::disconnect() {
  std::scoped_lock lock(mutex_);

  if (!client_) {
    return make_error(ErrorCode::ConnectionFailed, "Not connected");
  }

  std::promise<void> disconnect_promise;
  auto disconnect_future = disconnect_promise.get_future();

  MQTTAsync_disconnectOptions opts = MQTTAsync_disconnectOptions_initializer;
  opts.timeout = DISCONNECT_TIMEOUT_MS;
  opts.context = &disconnect_promise;
  opts.onSuccess = on_disconnect_success;
  opts.onFailure = on_disconnect_failure;

  int rc = MQTTAsync_disconnect(client_.get(), &opts);
  if (rc != MQTTASYNC_SUCCESS) {
    return make_error(ErrorCode::ConnectionFailed,
                      stdx::format("Failed to disconnect: {}", rc));
  }

  auto status = disconnect_future.wait_for(std::chrono::milliseconds(DISCONNECT_TIMEOUT_MS));
  is_connected_ = false;
  if (status == std::future_status::timeout) {
    log(LogLevel::WARN, "Disconnect timed out");
    return {};
  }

  try {
    disconnect_future.get();
  } catch (const std::exception& e) {
    log(LogLevel::WARN, e.what());
  }
  return {};
}

Result<void> Subscriber::subscribe(std::span<const std::string> topics) {
  std::scoped_lock lock(mutex_);

  if (!client_ || !is_connected_) {
    return make_error(ErrorCode::SubscribeFailed, "Not connected");
  }
  if (topics.empty()) {
    return {};
  }

  std::vector<std::string> owned(topics.begin(), topics.end());
  for (const auto& topic : owned) {
    log(LogLevel::INFO, stdx::format("Subscribing to topic '{}'", topic));
  }
  auto filters = topic_filters(owned);
  std::vector<int> qos(filters.size(), config_.qos);

  std::promise<void> subscribe_promise;
  auto subscribe_future = subscribe_promise.get_future();

  MQTTAsync_responseOptions sub_opts = MQTTAsync_responseOptions_initializer;
  sub_opts.context = &subscribe_promise;
  sub_opts.onSuccess = on_subscribe_success;
  sub_opts.onFailure = on_subscribe_failure;

  int rc = MQTTAsync_subscribeMany(client_.get(), static_cast<int>(filters.size()),
                                   filters.data(), qos.data(), &sub_opts);
  if (rc != MQTTASYNC_SUCCESS) {
    return make_error(ErrorCode::SubscribeFailed, stdx::format("Failed to subscribe: {}", rc));
  }

  auto status = subscribe_future.wait_for(std::chrono::milliseconds(SUBSCRIBE_TIMEOUT_MS));
  if (status == std::future_status::timeout) {
    return make_error(ErrorCode::SubscribeFailed, "Subscription timeout");
  }

  try {
    subscribe_future.get();
  } catch (const std::exception& e) {
    return make_error(ErrorCode::SubscribeFailed, e.what());
  }

  std::scoped_lock topics_lock(topics_mutex_);
  topics_ = std::move(owned);
  return {};
}

void Subscriber::log(LogLevel level, std::string_view message) const noexcept {
  if (config_.log_callback) {
    config_.log_callback(level, message);
  }
}

int Subscriber::on_message_arrived(void* context, char* topicName, int topicLen,
                                   MQTTAsync_message* message) {
  auto* subscriber = static_cast<Subscriber*>(context);

  if (!subscriber || !topicName || !message) {
    if (message) {
      MQTTAsync_freeMessage(&message);
      MQTTAsync_free(topicName);
    }
    return 1;
  }

  InboundMessage inbound;
  inbound.topic = std::string(topicName, topicLen > 0 ? static_cast<size_t>(topicLen)
                                                       : std::strlen(topicName));
  const auto* bytes = static_cast<const uint8_t*>(message->payload);
  inbound.payload.assign(bytes, bytes + message->payloadlen);

  MQTTAsync_freeMessage(&message);
  MQTTAsync_free(topicName);

  subscriber->log(LogLevel::DEBUG,
                  stdx::format("Got publish on '{}' ({} bytes)", inbound.topic,
                               inbound.payload.size()));

  if (subscriber->config_.message_callback) {
    try {
      subscriber->config_.message_callback(inbound);
    } catch (const std::exception& e) {
      subscriber->log(LogLevel::ERROR,
                      stdx::format("Message callback failed for '{}': {}", inbound.topic,
                                   e.what()));
    }
  }

  return 1;
}

void Subscriber::on_reconnected(void* context, char* cause) {
  (void)cause;
  auto* subscriber = static_cast<Subscriber*>(context);
  // Also invoked for the initial connect, which connect() and subscribe() handle
  if (!subscriber || !subscriber->reconnecting_.exchange(false)) {
    return;
  }

  subscriber->is_connected_ = true;
  subscriber->log(LogLevel::INFO, "Reconnected to broker");

  std::vector<std::string> topics;
  {
    std::scoped_lock lock(subscriber->topics_mutex_);
    topics = subscriber->topics_;
  }
  if (topics.empty()) {
    return;
  }

  // Runs on the Paho thread, so the subscription is not awaited here
  auto filters = topic_filters(topics);
  std::vector<int> qos(filters.size(), subscriber->config_.qos);
  MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
  opts.context = subscriber;
  opts.onFailure = [](void* ctx, MQTTAsync_failureData* response) {
    static_cast<Subscriber*>(ctx)->log(
        LogLevel::ERROR,
        stdx::format("Resubscribe failed: code={}", response ? response->code : -1));
  };

  int rc = MQTTAsync_subscribeMany(subscriber->client_.get(), static_cast<int>(filters.size()),
                                   filters.data(), qos.data(), &opts);
  if (rc != MQTTASYNC_SUCCESS) {
    subscriber->log(LogLevel::ERROR, stdx::format("Failed to resubscribe: {}", rc));
  }
}

void Subscriber::on_connection_lost(void* context, char* cause) {
  auto* subscriber = static_cast<Subscriber*>(context);
  if (!subscriber) {
    return;
  }

  subscriber->is_connected_ = false;
  subscriber->reconnecting_ = subscriber->config_.automatic_reconnect;

  if (cause) {
    subscriber->log(LogLevel::WARN, stdx::format("Connection lost: {}", cause));
  } else {
    subscriber->log(LogLevel::WARN, "Connection lost");
  }
}

} // namespace mqtt2db

// src/main.cpp
// mqtt2db daemon: subscribes to the configured MQTT topics and writes every mapped
// message to the configured InfluxDB databases.

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <curl/curl.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <mqtt2db/bridge.hpp>
#include <mqtt2db/config.hpp>
#include <mqtt2db/influxdb_writer.hpp>
#include <mqtt2db/mapping.hpp>
#include <mqtt2db/subscriber.hpp>

namespace {

std::atomic<bool> running{true};

void signal_handler(int) {
  running = false;
}

std::optional<spdlog::level::level_enum> parse_level(std::string_view name) {
  if (name == "off")
    return spdlog::level::off;
  if (name == "error")
    return spdlog::level::err;
  if (name == "warn")
    return spdlog::level::warn;
  if (name == "info")
    return spdlog::level::info;
  if (name == "debug")
    return spdlog::level::debug;
  if (name == "trace")
    return spdlog::level::trace;
  return std::nullopt;
}

mqtt2db::LogCallback make_log_callback(std::shared_ptr<spdlog::logger> logger) {
  return [logger = std::move(logger)](mqtt2db::LogLevel level, std::string_view message) {
    switch (level) {
    case mqtt2db::LogLevel::DEBUG:
      logger->debug(message);
      break;
    case mqtt2db::LogLevel::INFO:
      logger->info(message);
      break;
    case mqtt2db::LogLevel::WARN:
      logger->warn(message);
      break;
    case mqtt2db::LogLevel::ERROR:
      logger->error(message);
      break;
    }
  };
}

// Curl's global state lives for the whole run.
struct CurlGlobal {
  CURLcode rc;
  CurlGlobal() : rc(curl_global_init(CURL_GLOBAL_ALL)) {}
  ~CurlGlobal() {
    if (rc == CURLE_OK) {
      curl_global_cleanup();
    }
  }
  CurlGlobal(const CurlGlobal&) = delete;
  CurlGlobal& operator=(const CurlGlobal&) = delete;
};

} // namespace

int main(int argc, char* argv[]) {
  auto logger = spdlog::stdout_color_mt("mqtt2db");

  if (argc != 2) {
    logger->error("Usage: {} <config.yaml>", argv[0]);
    return 1;
  }

  auto config = mqtt2db::load_config(argv[1]);
  if (!config) {
    logger->error("Failed to load '{}': {}", argv[1], mqtt2db::to_string(config.error()));
    return 1;
  }

  auto level = parse_level(config->log_level).value_or(spdlog::level::info);
  if (const char* env = std::getenv("MQTT2DB_LOG")) {
    if (auto env_level = parse_level(env)) {
      level = *env_level;
    } else {
      logger->warn("Ignoring invalid MQTT2DB_LOG value '{}'", env);
    }
  }
  logger->set_level(level);
  auto log_callback = make_log_callback(logger);

  auto table = mqtt2db::RuleTable::compile(config->mappings);
  if (!table) {
    logger->error("Invalid mapping: {}", mqtt2db::to_string(table.error()));
    return 1;
  }
  logger->info("Compiled {} mapping rule(s)", table->size());
  auto topics = table->topics();

  CurlGlobal curl_global;
  if (curl_global.rc != CURLE_OK) {
    logger->error("curl_global_init failed: {}", curl_easy_strerror(curl_global.rc));
    return 1;
  }

  mqtt2db::Bridge bridge(std::move(*table), log_callback);

  std::vector<std::unique_ptr<mqtt2db::InfluxDbWriter>> writers;
  for (const auto& database : config->databases) {
    auto& writer =
        writers.emplace_back(std::make_unique<mqtt2db::InfluxDbWriter>(database, log_callback));
    logger->info("Writing to database '{}' at {}", database.db_name, writer->write_url());
    bridge.add_destination(database.db_name,
                           [w = writer.get()](const mqtt2db::DataPoint& point) {
                             return w->write(point);
                           });
  }

  auto subscriber_config = mqtt2db::Subscriber::make_config(config->mqtt);
  subscriber_config.message_callback = [&bridge](const mqtt2db::InboundMessage& message) {
    bridge.handle(message);
  };
  subscriber_config.log_callback = log_callback;

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  mqtt2db::Subscriber subscriber(std::move(subscriber_config));

  logger->info("Connecting to {}:{}", config->mqtt.host, config->mqtt.port);
  auto result = subscriber.connect();
  if (!result) {
    logger->error("Connect failed: {}", mqtt2db::to_string(result.error()));
    return 1;
  }

  result = subscriber.subscribe(topics);
  if (!result) {
    logger->error("Subscribe failed: {}", mqtt2db::to_string(result.error()));
    (void)subscriber.disconnect();
    return 1;
  }

  while (running) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  logger->info("Shutting down");
  result = subscriber.disconnect();
  if (!result) {
    logger->warn("Disconnect failed: {}", mqtt2db::to_string(result.error()));
  }

  auto stats = bridge.stats();
  logger->info("Received {} message(s): {} mapped, {} dropped, {} failed write(s)",
               stats.received, stats.dispatched, stats.dropped, stats.write_failures);
  return 0;
}

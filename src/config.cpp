// src/config.cpp
#include "mqtt2db/config.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

namespace mqtt2db {

namespace {

constexpr std::array<std::string_view, 6> LOG_LEVELS = {"off",  "error", "warn",
                                                       "info", "debug", "trace"};

// Thrown by the helpers below; never escapes parse_config()
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

YAML::Node require(const YAML::Node& node, const char* key, std::string_view context) {
  auto child = node[key];
  if (!child || child.IsNull()) {
    throw ConfigError(stdx::format("{}: missing required key '{}'", context, key));
  }
  return child;
}

template <typename T>
T required(const YAML::Node& node, const char* key, std::string_view context) {
  auto child = require(node, key, context);
  try {
    return child.as<T>();
  } catch (const YAML::Exception&) {
    throw ConfigError(stdx::format("{}: key '{}' has an invalid value", context, key));
  }
}

template <typename T>
std::optional<T> optional_value(const YAML::Node& node, const char* key,
                                std::string_view context) {
  auto child = node[key];
  if (!child || child.IsNull()) {
    return std::nullopt;
  }
  try {
    return child.as<T>();
  } catch (const YAML::Exception&) {
    throw ConfigError(stdx::format("{}: key '{}' has an invalid value", context, key));
  }
}

ValueType required_value_type(const YAML::Node& node, const char* key,
                              std::string_view context) {
  auto name = required<std::string>(node, key, context);
  auto type = parse_value_type(name);
  if (!type) {
    throw ConfigError(stdx::format("{}: unknown value type '{}'", context, name));
  }
  return *type;
}

std::optional<std::chrono::seconds> optional_seconds(const YAML::Node& node, const char* key,
                                                     std::string_view context) {
  auto secs = optional_value<int64_t>(node, key, context);
  if (!secs) {
    return std::nullopt;
  }
  if (*secs < 0) {
    throw ConfigError(stdx::format("{}: '{}' must not be negative", context, key));
  }
  return std::chrono::seconds(*secs);
}

MqttConfig parse_mqtt(const YAML::Node& node) {
  constexpr std::string_view ctx = "mqtt";
  MqttConfig mqtt{.host = required<std::string>(node, "host", ctx),
                  .port = optional_value<uint16_t>(node, "port", ctx).value_or(1883),
                  .client_id = required<std::string>(node, "clientId", ctx)};

  if (const auto auth = node["auth"]; auth && !auth.IsNull()) {
    if (auth["username"]) {
      mqtt.auth = UserPassAuth{.username = required<std::string>(auth, "username", "mqtt.auth"),
                               .password = required<std::string>(auth, "password", "mqtt.auth")};
    } else if (auth["certFile"]) {
      mqtt.auth = CertificateAuth{
          .cert_file = required<std::string>(auth, "certFile", "mqtt.auth"),
          .private_key_file = required<std::string>(auth, "privateKeyFile", "mqtt.auth")};
    } else {
      throw ConfigError(
          "mqtt.auth: expected either username/password or certFile/privateKeyFile");
    }
  }

  mqtt.ca_file = optional_value<std::string>(node, "caFile", ctx);
  if (mqtt.auth && std::holds_alternative<CertificateAuth>(*mqtt.auth) && !mqtt.ca_file) {
    throw ConfigError("mqtt: certificate authentication requires 'caFile'");
  }

  mqtt.connect_timeout = optional_seconds(node, "connectTimeout", ctx);
  mqtt.keep_alive = optional_seconds(node, "keepAlive", ctx);
  if (mqtt.keep_alive && mqtt.keep_alive->count() > std::numeric_limits<uint16_t>::max()) {
    throw ConfigError("mqtt: keep alive time must be between 0 and 65535");
  }
  return mqtt;
}

InfluxDbConfig parse_database(const YAML::Node& node, std::size_t index) {
  auto ctx = stdx::format("databases[{}]", index);
  auto type = required<std::string>(node, "type", ctx);
  if (type != "influxdb") {
    throw ConfigError(stdx::format("{}: unknown database type '{}'", ctx, type));
  }

  InfluxDbConfig db{.url = required<std::string>(node, "url", ctx),
                    .auth = std::nullopt,
                    .db_name = required<std::string>(node, "dbName", ctx),
                    .measurement = required<std::string>(node, "measurement", ctx)};
  if (const auto auth = node["auth"]; auth && !auth.IsNull()) {
    auto auth_ctx = ctx + ".auth";
    db.auth = UserAuth{.username = required<std::string>(auth, "username", auth_ctx),
                       .password = required<std::string>(auth, "password", auth_ctx)};
  }
  return db;
}

MappingConfig parse_mapping(const YAML::Node& node, std::size_t index) {
  auto ctx = stdx::format("mappings[{}]", index);

  MappingConfig mapping{.topic = required<std::string>(node, "topic", ctx),
                        .payload = std::nullopt,
                        .field_name = required<std::string>(node, "fieldName", ctx),
                        .value_type = required_value_type(node, "valueType", ctx),
                        .tags = {}};

  if (const auto payload = node["payload"]; payload && !payload.IsNull()) {
    auto payload_ctx = ctx + ".payload";
    auto type = required<std::string>(payload, "type", payload_ctx);
    if (type != "json") {
      throw ConfigError(stdx::format("{}: unknown payload type '{}'", payload_ctx, type));
    }
    mapping.payload = PayloadConfig{
        .value_field_path = required<std::string>(payload, "valueFieldPath", payload_ctx),
        .timestamp_field_path =
            optional_value<std::string>(payload, "timestampFieldPath", payload_ctx)};
  }

  if (const auto tags = node["tags"]; tags && !tags.IsNull()) {
    if (!tags.IsMap()) {
      throw ConfigError(stdx::format("{}: 'tags' must be a map", ctx));
    }
    for (const auto& entry : tags) {
      auto name = entry.first.as<std::string>();
      auto tag_ctx = stdx::format("{}.tags.{}", ctx, name);
      mapping.tags.push_back(TagConfig{.name = name,
                                       .type = required_value_type(entry.second, "type", tag_ctx),
                                       .value = required<std::string>(entry.second, "value",
                                                                      tag_ctx)});
    }
  }

  return mapping;
}

Config parse_root(const YAML::Node& root) {
  if (!root.IsMap()) {
    throw ConfigError("configuration root must be a map");
  }

  Config config;
  if (auto level = optional_value<std::string>(root, "logLevel", "config")) {
    if (std::find(LOG_LEVELS.begin(), LOG_LEVELS.end(), *level) == LOG_LEVELS.end()) {
      throw ConfigError(stdx::format("config: unknown logLevel '{}'", *level));
    }
    config.log_level = *level;
  }

  config.mqtt = parse_mqtt(require(root, "mqtt", "config"));

  const auto databases = require(root, "databases", "config");
  if (!databases.IsSequence()) {
    throw ConfigError("config: 'databases' must be a list");
  }
  for (std::size_t i = 0; i < databases.size(); ++i) {
    config.databases.push_back(parse_database(databases[i], i));
  }

  const auto mappings = require(root, "mappings", "config");
  if (!mappings.IsSequence()) {
    throw ConfigError("config: 'mappings' must be a list");
  }
  for (std::size_t i = 0; i < mappings.size(); ++i) {
    config.mappings.push_back(parse_mapping(mappings[i], i));
  }

  return config;
}

} // namespace

Result<Config> parse_config(std::string_view yaml) {
  try {
    return parse_root(YAML::Load(std::string(yaml)));
  } catch (const ConfigError& e) {
    return make_error(ErrorCode::InvalidConfig, e.what());
  } catch (const YAML::Exception& e) {
    return make_error(ErrorCode::InvalidConfig, stdx::format("Invalid YAML: {}", e.what()));
  }
}

Result<Config> load_config(const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    return make_error(ErrorCode::InvalidConfig, stdx::format("Unable to open {}", path));
  }
  std::stringstream contents;
  contents << file.rdbuf();
  return parse_config(contents.str());
}

} // namespace mqtt2db

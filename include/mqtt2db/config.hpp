// include/mqtt2db/config.hpp
#pragma once

#include "error.hpp"
#include "mapping.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mqtt2db {

/**
 * @brief MQTT username/password authentication.
 */
struct UserPassAuth {
  std::string username;
  std::string password;
};

/**
 * @brief MQTT client certificate authentication (requires ca_file / TLS).
 */
struct CertificateAuth {
  std::string cert_file;        ///< Client certificate (PEM)
  std::string private_key_file; ///< Client private key (PEM)
};

using MqttAuth = std::variant<UserPassAuth, CertificateAuth>;

/**
 * @brief Broker connection settings.
 */
struct MqttConfig {
  std::string host;
  uint16_t port{1883};
  std::string client_id;
  std::optional<MqttAuth> auth{};
  std::optional<std::string> ca_file{};                  ///< Enables TLS when set
  std::optional<std::chrono::seconds> connect_timeout{}; ///< Paho default when unset
  std::optional<std::chrono::seconds> keep_alive{};      ///< 0..65535 seconds
};

/**
 * @brief HTTP basic authentication for a database.
 */
struct UserAuth {
  std::string username;
  std::string password;
};

/**
 * @brief One InfluxDB (1.x write API) destination.
 */
struct InfluxDbConfig {
  std::string url;                ///< e.g. "http://localhost:8086"
  std::optional<UserAuth> auth{};
  std::string db_name;
  std::string measurement;
};

/**
 * @brief The complete daemon configuration.
 *
 * @par YAML Layout
 * @code
 * logLevel: info
 * mqtt: {host: localhost, port: 1883, clientId: mqtt2db}
 * databases:
 *   - {type: influxdb, url: "http://localhost:8086", dbName: home, measurement: mqtt}
 * mappings:
 *   - topic: sensors/+/temp
 *     fieldName: temp_$1
 *     valueType: float
 *     tags:
 *       room: {type: text, value: $1}
 * @endcode
 */
struct Config {
  std::string log_level{"info"}; ///< off, error, warn, info, debug or trace
  MqttConfig mqtt;
  std::vector<InfluxDbConfig> databases;
  std::vector<MappingConfig> mappings;
};

/**
 * @brief Parses a YAML configuration document.
 *
 * @return Parsed configuration, or InvalidConfig naming the offending key
 *
 * @note Only the document structure is validated here; topic patterns, templates and
 *       paths are validated by RuleTable::compile().
 */
[[nodiscard]] Result<Config> parse_config(std::string_view yaml);

/**
 * @brief Reads and parses a YAML configuration file.
 */
[[nodiscard]] Result<Config> load_config(const std::string& path);

} // namespace mqtt2db

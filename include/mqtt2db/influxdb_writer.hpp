// include/mqtt2db/influxdb_writer.hpp
#pragma once

#include "config.hpp"
#include "error.hpp"
#include "log.hpp"
#include "mapping.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <curl/curl.h>

namespace mqtt2db {

/**
 * @brief Writes data points to one InfluxDB database over the 1.x HTTP write API.
 *
 * Each point is sent as a single line protocol record to
 * `<url>/write?db=<dbName>&precision=ms`, with HTTP basic authentication when
 * configured. The curl handle is reused across writes.
 *
 * @par Thread Safety
 * write() may be called from any thread; writes are serialized internally.
 *
 * @note curl_global_init() must have been called before constructing a writer.
 */
class InfluxDbWriter {
public:
  /// Request timeout applied to every write.
  static constexpr long REQUEST_TIMEOUT_SECONDS = 10;

  explicit InfluxDbWriter(InfluxDbConfig config, LogCallback log_callback = {});

  InfluxDbWriter(const InfluxDbWriter&) = delete;
  InfluxDbWriter& operator=(const InfluxDbWriter&) = delete;
  InfluxDbWriter(InfluxDbWriter&&) = delete;
  InfluxDbWriter& operator=(InfluxDbWriter&&) = delete;

  /**
   * @brief Writes one data point.
   *
   * @return void on a 2xx response, WriteFailed on transport errors or any other status
   */
  [[nodiscard]] Result<void> write(const DataPoint& point);

  /// The endpoint points are posted to, with the database name URL-escaped.
  [[nodiscard]] const std::string& write_url() const noexcept { return write_url_; }

  [[nodiscard]] const InfluxDbConfig& config() const noexcept { return config_; }

private:
  struct CurlDeleter {
    void operator()(CURL* handle) const noexcept { curl_easy_cleanup(handle); }
  };

  InfluxDbConfig config_;
  LogCallback log_callback_;
  std::unique_ptr<CURL, CurlDeleter> curl_;
  std::string write_url_;
  std::mutex mutex_;

  void log(LogLevel level, std::string_view message) const noexcept;
};

} // namespace mqtt2db

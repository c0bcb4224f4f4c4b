// src/influxdb_writer.cpp
#include "mqtt2db/influxdb_writer.hpp"
#include "mqtt2db/line_protocol.hpp"

#include <utility>

namespace mqtt2db {

namespace {

size_t append_response(char* data, size_t size, size_t nmemb, void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  body->append(data, size * nmemb);
  return size * nmemb;
}

std::string trim_trailing_slashes(std::string_view url) {
  while (!url.empty() && url.back() == '/') {
    url.remove_suffix(1);
  }
  return std::string(url);
}

std::string url_escape(CURL* handle, const std::string& text) {
  std::string escaped;
  if (char* raw = curl_easy_escape(handle, text.c_str(), static_cast<int>(text.size()))) {
    escaped = raw;
    curl_free(raw);
  }
  return escaped;
}

} // namespace

InfluxDbWriter::InfluxDbWriter(InfluxDbConfig config, LogCallback log_callback)
    : config_(std::move(config)), log_callback_(std::move(log_callback)),
      curl_(curl_easy_init()) {
  write_url_ = stdx::format("{}/write?db={}&precision=ms", trim_trailing_slashes(config_.url),
                            curl_ ? url_escape(curl_.get(), config_.db_name) : config_.db_name);
}

void InfluxDbWriter::log(LogLevel level, std::string_view message) const noexcept {
  if (log_callback_) {
    log_callback_(level, message);
  }
}

Result<void> InfluxDbWriter::write(const DataPoint& point) {
  std::scoped_lock lock(mutex_);

  if (!curl_) {
    return make_error(ErrorCode::WriteFailed, "Failed to create curl handle");
  }

  auto line = to_line_protocol(config_.measurement, point);
  if (!line) {
    return make_error(ErrorCode::WriteFailed,
                      stdx::format("Failed to write to '{}': {}", config_.db_name,
                                   line.error().message));
  }
  const std::string& body = *line;
  std::string response;
  CURL* handle = curl_.get();

  curl_easy_reset(handle);
  curl_easy_setopt(handle, CURLOPT_URL, write_url_.c_str());
  curl_easy_setopt(handle, CURLOPT_POST, 1L);
  curl_easy_setopt(handle, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, append_response);
  curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(handle, CURLOPT_TIMEOUT, REQUEST_TIMEOUT_SECONDS);
  curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);

  if (config_.auth) {
    curl_easy_setopt(handle, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
    curl_easy_setopt(handle, CURLOPT_USERNAME, config_.auth->username.c_str());
    curl_easy_setopt(handle, CURLOPT_PASSWORD, config_.auth->password.c_str());
  }

  struct curl_slist* headers = curl_slist_append(nullptr, "Content-Type: text/plain");
  curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers);

  CURLcode rc = curl_easy_perform(handle);
  long status = 0;
  curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
  curl_slist_free_all(headers);

  if (rc != CURLE_OK) {
    return make_error(ErrorCode::WriteFailed,
                      stdx::format("POST {} failed: {}", write_url_, curl_easy_strerror(rc)));
  }
  if (status < 200 || status >= 300) {
    return make_error(ErrorCode::WriteFailed,
                      stdx::format("POST {} returned HTTP {}: {}", write_url_, status, response));
  }

  log(LogLevel::DEBUG, stdx::format("Wrote to '{}': {}", config_.db_name, body));
  return {};
}

} // namespace mqtt2db

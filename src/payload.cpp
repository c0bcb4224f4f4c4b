// src/payload.cpp
#include "mqtt2db/payload.hpp"

#include <memory>
#include <string>

#include <json/reader.h>
#include <simdjson.h>

namespace mqtt2db {

Result<std::string_view> payload_as_text(std::span<const uint8_t> payload) {
  auto text = std::string_view(reinterpret_cast<const char*>(payload.data()), payload.size());
  if (!simdjson::validate_utf8(text.data(), text.size())) {
    return make_error(ErrorCode::InvalidPayloadEncoding,
                      "Invalid payload value: invalid utf-8 sequence");
  }
  return text;
}

Result<Json::Value> parse_document(std::string_view text) {
  Json::CharReaderBuilder builder;
  Json::CharReaderBuilder::strictMode(&builder.settings_);
  builder["strictRoot"] = false;
  // Last duplicate key wins
  builder["rejectDupKeys"] = false;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

  Json::Value root;
  std::string errors;
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
    return make_error(ErrorCode::MalformedPayload,
                      stdx::format("Failed to parse payload as JSON: {}", errors));
  }
  return root;
}

Result<std::reference_wrapper<const Json::Value>>
extract_value(const Json::Value& document, const JsonPath& value_path) {
  auto node = value_path.find_first(document);
  if (!node) {
    return make_error(ErrorCode::ValueNotFound,
                      stdx::format("Couldn't find value at '{}' in payload", value_path.str()));
  }
  return *node;
}

Result<uint64_t> extract_timestamp(const Json::Value& document, const JsonPath& timestamp_path) {
  auto found = timestamp_path.find_first(document);
  if (!found) {
    return make_error(ErrorCode::TimestampNotFound,
                      stdx::format("Couldn't find timestamp at '{}' in payload",
                                   timestamp_path.str()));
  }

  const Json::Value& node = *found;
  bool integral = node.type() == Json::intValue || node.type() == Json::uintValue;
  if (!integral || !node.isUInt64()) {
    return make_error(ErrorCode::TimestampNotNumeric,
                      stdx::format("Value at '{}' cannot be converted to a timestamp",
                                   timestamp_path.str()));
  }
  return static_cast<uint64_t>(node.asUInt64());
}

} // namespace mqtt2db

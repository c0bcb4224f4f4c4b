// src/line_protocol.cpp
#include "mqtt2db/line_protocol.hpp"

#include <cmath>
#include <variant>

namespace mqtt2db {

namespace {

std::string escape_chars(std::string_view text, std::string_view special) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    if (special.find(c) != std::string_view::npos) {
      out += '\\';
    }
    out += c;
  }
  return out;
}

std::string quote_string_field(std::string_view text) {
  std::string out;
  out.reserve(text.size() + 2);
  out += '"';
  for (char c : text) {
    if (c == '"' || c == '\\') {
      out += '\\';
    }
    out += c;
  }
  out += '"';
  return out;
}

struct FieldValueFormatter {
  std::string operator()(bool value) const { return value ? "true" : "false"; }
  std::string operator()(double value) const { return stdx::format("{}", value); }
  std::string operator()(int64_t value) const { return stdx::format("{}i", value); }
  std::string operator()(uint64_t value) const { return stdx::format("{}u", value); }
  std::string operator()(const std::string& value) const { return quote_string_field(value); }
};

} // namespace

std::string escape_measurement(std::string_view name) {
  return escape_chars(name, ", ");
}

std::string escape_key(std::string_view key) {
  return escape_chars(key, ",= ");
}

Result<std::string> to_line_protocol(std::string_view measurement, const DataPoint& point) {
  if (const auto* number = std::get_if<double>(&point.value); number && !std::isfinite(*number)) {
    return make_error(ErrorCode::InvalidNumber,
                      stdx::format("Field '{}' has non-finite value {}, which line protocol "
                                   "cannot represent",
                                   point.field_name, *number));
  }

  std::string line = escape_measurement(measurement);

  for (const auto& [key, value] : point.tags) {
    auto text = to_string(value);
    if (key.empty() || text.empty()) {
      continue;
    }
    line += ',';
    line += escape_key(key);
    line += '=';
    line += escape_key(text);
  }

  line += ' ';
  line += escape_key(point.field_name);
  line += '=';
  line += std::visit(FieldValueFormatter{}, point.value);
  line += ' ';
  line += stdx::format("{}", point.timestamp_ms);
  return line;
}

} // namespace mqtt2db

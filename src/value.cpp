// src/value.cpp
#include "mqtt2db/value.hpp"

#include <charconv>
#include <system_error>
#include <type_traits>
#include <utility>

#include <json/value.h>

namespace mqtt2db {

namespace {

template <typename T>
std::optional<T> parse_number(std::string_view text) {
  if (text.starts_with('+')) {
    text.remove_prefix(1);
    if (text.starts_with('-')) {
      return std::nullopt;
    }
  }
  if (text.empty()) {
    return std::nullopt;
  }
  T value{};
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::string_view describe(const Json::Value& node) {
  switch (node.type()) {
  case Json::nullValue:
    return "null";
  case Json::intValue:
  case Json::uintValue:
    return "integer";
  case Json::realValue:
    return "real";
  case Json::stringValue:
    return "string";
  case Json::booleanValue:
    return "boolean";
  case Json::arrayValue:
    return "array";
  case Json::objectValue:
    return "object";
  }
  return "unknown";
}

bool is_integral(const Json::Value& node) {
  return node.type() == Json::intValue || node.type() == Json::uintValue;
}

// Each source provides one conversion per declared type; coerce_with() holds the
// single declared-type switch both sources share.

struct TextSource {
  std::string_view text;

  Result<TypedValue> to_boolean() const {
    if (text == "true") {
      return TypedValue{true};
    }
    if (text == "false") {
      return TypedValue{false};
    }
    return make_error(ErrorCode::InvalidBoolean,
                      stdx::format("Value '{}' is not a valid boolean", text));
  }

  template <typename T>
  Result<TypedValue> to_number(ValueType type) const {
    auto value = parse_number<T>(text);
    if (!value) {
      return make_error(ErrorCode::InvalidNumber,
                        stdx::format("Value '{}' is not a valid {}", text, to_string(type)));
    }
    return TypedValue{*value};
  }

  Result<TypedValue> to_text() const { return TypedValue{std::string(text)}; }
};

struct NodeSource {
  const Json::Value& node;

  Result<TypedValue> to_boolean() const {
    if (!node.isBool()) {
      return make_error(ErrorCode::InvalidBoolean,
                        stdx::format("Need type boolean but got {}", describe(node)));
    }
    return TypedValue{node.asBool()};
  }

  template <typename T>
  Result<TypedValue> to_number(ValueType type) const {
    if constexpr (std::is_same_v<T, double>) {
      if (node.type() == Json::realValue || is_integral(node)) {
        return TypedValue{node.asDouble()};
      }
    } else if constexpr (std::is_same_v<T, int64_t>) {
      if (is_integral(node) && node.isInt64()) {
        return TypedValue{static_cast<int64_t>(node.asInt64())};
      }
    } else {
      if (is_integral(node) && node.isUInt64()) {
        return TypedValue{static_cast<uint64_t>(node.asUInt64())};
      }
    }
    return make_error(ErrorCode::InvalidNumber,
                      stdx::format("Cannot be expressed as {}: got {}", to_string(type),
                                   describe(node)));
  }

  Result<TypedValue> to_text() const {
    switch (node.type()) {
    case Json::stringValue:
      return TypedValue{node.asString()};
    case Json::booleanValue:
      return TypedValue{std::string(node.asBool() ? "true" : "false")};
    case Json::intValue:
      return TypedValue{std::to_string(node.asInt64())};
    case Json::uintValue:
      return TypedValue{std::to_string(node.asUInt64())};
    case Json::realValue: {
      // Whole reals keep a ".0" so they read back as floats
      auto text = stdx::format("{}", node.asDouble());
      if (text.find_first_of(".eni") == std::string::npos) {
        text += ".0";
      }
      return TypedValue{std::move(text)};
    }
    default:
      return make_error(ErrorCode::UnsupportedTextSource,
                        stdx::format("Need type text but got {}", describe(node)));
    }
  }
};

template <typename Source>
Result<TypedValue> coerce_with(const Source& source, ValueType type) {
  switch (type) {
  case ValueType::Boolean:
    return source.to_boolean();
  case ValueType::Float:
    return source.template to_number<double>(type);
  case ValueType::SignedInteger:
    return source.template to_number<int64_t>(type);
  case ValueType::UnsignedInteger:
    return source.template to_number<uint64_t>(type);
  case ValueType::Text:
    return source.to_text();
  }
  stdx::unreachable();
}

} // namespace

std::string_view to_string(ValueType type) noexcept {
  switch (type) {
  case ValueType::Boolean:
    return "boolean";
  case ValueType::Float:
    return "float";
  case ValueType::SignedInteger:
    return "signed integer";
  case ValueType::UnsignedInteger:
    return "unsigned integer";
  case ValueType::Text:
    return "text";
  }
  stdx::unreachable();
}

std::optional<ValueType> parse_value_type(std::string_view name) noexcept {
  if (name == "boolean")
    return ValueType::Boolean;
  if (name == "float")
    return ValueType::Float;
  if (name == "signed-integer")
    return ValueType::SignedInteger;
  if (name == "unsigned-integer")
    return ValueType::UnsignedInteger;
  if (name == "text")
    return ValueType::Text;
  return std::nullopt;
}

ValueType type_of(const TypedValue& value) noexcept {
  return static_cast<ValueType>(value.index());
}

std::string to_string(const TypedValue& value) {
  return std::visit(
      [](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
          return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
          return v;
        } else {
          return stdx::format("{}", v);
        }
      },
      value);
}

Result<TypedValue> coerce(std::string_view text, ValueType type) {
  return coerce_with(TextSource{text}, type);
}

Result<TypedValue> coerce(const Json::Value& node, ValueType type) {
  return coerce_with(NodeSource{node}, type);
}

} // namespace mqtt2db

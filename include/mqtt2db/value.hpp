// include/mqtt2db/value.hpp
#pragma once

#include "error.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <json/forwards.h>

namespace mqtt2db {

/**
 * @brief Declared scalar type of a rule's field value or fixed tag value.
 */
enum class ValueType {
  Boolean,         ///< "boolean"
  Float,           ///< "float" (64-bit IEEE 754)
  SignedInteger,   ///< "signed-integer" (int64_t)
  UnsignedInteger, ///< "unsigned-integer" (uint64_t)
  Text             ///< "text"
};

/**
 * @brief A strongly typed scalar value produced by coercion.
 *
 * Alternatives map one-to-one onto ValueType in declaration order.
 */
using TypedValue = std::variant<bool, double, int64_t, uint64_t, std::string>;

/**
 * @brief Human-readable name of a value type (e.g. "signed integer").
 */
[[nodiscard]] std::string_view to_string(ValueType type) noexcept;

/**
 * @brief Parses the configuration spelling of a value type (e.g. "unsigned-integer").
 *
 * @return The value type, or std::nullopt for an unknown spelling
 */
[[nodiscard]] std::optional<ValueType> parse_value_type(std::string_view name) noexcept;

/**
 * @brief Returns the ValueType corresponding to the active alternative.
 */
[[nodiscard]] ValueType type_of(const TypedValue& value) noexcept;

/**
 * @brief Renders a typed value as plain text ("true", "21.5", "-3", "kitchen").
 */
[[nodiscard]] std::string to_string(const TypedValue& value);

/**
 * @brief Coerces raw text into the declared type.
 *
 * - Boolean accepts exactly "true" or "false" (case-sensitive), else InvalidBoolean.
 * - Numeric types require the whole string to parse for the target width, else
 *   InvalidNumber. A single leading '+' is accepted.
 * - Text always succeeds.
 */
[[nodiscard]] Result<TypedValue> coerce(std::string_view text, ValueType type);

// Exact-match overloads so string arguments never compete with Json::Value's converting
// constructors.
[[nodiscard]] inline Result<TypedValue> coerce(const char* text, ValueType type) {
  return coerce(std::string_view(text), type);
}
[[nodiscard]] inline Result<TypedValue> coerce(const std::string& text, ValueType type) {
  return coerce(std::string_view(text), type);
}

/**
 * @brief Coerces a JSON node into the declared type.
 *
 * - Boolean requires a JSON boolean, else InvalidBoolean.
 * - Float accepts any JSON number.
 * - SignedInteger / UnsignedInteger require an integral JSON number representable in the
 *   target type (e.g. -1 is not an unsigned integer), else InvalidNumber.
 * - Text stringifies strings, booleans and numbers; arrays, objects and null are
 *   UnsupportedTextSource.
 */
[[nodiscard]] Result<TypedValue> coerce(const Json::Value& node, ValueType type);

} // namespace mqtt2db

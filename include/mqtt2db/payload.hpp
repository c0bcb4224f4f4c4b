// include/mqtt2db/payload.hpp
#pragma once

#include "error.hpp"
#include "json_path.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string_view>
#include <variant>

#include <json/value.h>

namespace mqtt2db {

/**
 * @brief The payload is a single UTF-8 text value fed directly to coercion.
 */
struct RawPayload {};

/**
 * @brief The payload is a JSON document; the value (and optionally the timestamp) are
 * located with path expressions.
 */
struct JsonPayload {
  JsonPath value_path;
  std::optional<JsonPath> timestamp_path{};
};

/// How a rule interprets inbound payload bytes.
using PayloadSpec = std::variant<RawPayload, JsonPayload>;

/**
 * @brief Validates that payload bytes are UTF-8 and views them as text.
 *
 * @return Text view over the payload, or InvalidPayloadEncoding
 */
[[nodiscard]] Result<std::string_view> payload_as_text(std::span<const uint8_t> payload);

/**
 * @brief Parses a JSON document (any JSON value is accepted at the root).
 *
 * @return Parsed document, or MalformedPayload with the parser's message
 */
[[nodiscard]] Result<Json::Value> parse_document(std::string_view text);

/**
 * @brief Locates the value node for a JSON payload rule.
 *
 * @return First matching node, or ValueNotFound
 */
[[nodiscard]] Result<std::reference_wrapper<const Json::Value>>
extract_value(const Json::Value& document, const JsonPath& value_path);

/**
 * @brief Locates and converts the timestamp node for a JSON payload rule.
 *
 * @return Timestamp in milliseconds since epoch, TimestampNotFound when the path matches
 *         nothing, or TimestampNotNumeric when the node is not a non-negative integer
 */
[[nodiscard]] Result<uint64_t> extract_timestamp(const Json::Value& document,
                                                 const JsonPath& timestamp_path);

} // namespace mqtt2db

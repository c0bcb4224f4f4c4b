// include/mqtt2db/error.hpp
#pragma once

#include "detail/compat.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace mqtt2db {

/**
 * @brief Failure kinds reported by the mapping engine and its collaborators.
 *
 * Configuration errors are detected while compiling rules and are fatal to startup.
 * Per-message errors only drop the offending message. Transport errors come from the
 * MQTT and database collaborators.
 */
enum class ErrorCode {
  // Configuration
  InvalidPatternLevel,    ///< Topic level mixes '+' or '#' with other characters
  MisplacedMultiWildcard, ///< '#' appears before the last topic level
  InvalidReferenceIndex,  ///< Template reference "$0"
  ReferenceOutOfRange,    ///< Template references more captures than the topic provides
  InvalidPathExpression,  ///< JSON path expression does not parse
  InvalidTagValue,        ///< Fixed tag value does not coerce to its declared type
  InvalidConfig,          ///< Missing key, bad enum value or YAML syntax error

  // Per-message
  UnmatchedTopic,         ///< No rule matches the inbound topic
  InvalidPayloadEncoding, ///< Payload bytes are not valid UTF-8
  MalformedPayload,       ///< Payload is not a valid JSON document
  ValueNotFound,          ///< Value path matched no node
  TimestampNotFound,      ///< Timestamp path matched no node
  TimestampNotNumeric,    ///< Timestamp node is not a non-negative integer
  InvalidBoolean,         ///< Value is not a boolean
  InvalidNumber,          ///< Value does not convert to the declared numeric type
  UnsupportedTextSource,  ///< JSON node kind cannot be stringified
  UnresolvedReference,    ///< Template references a capture that does not exist

  // Transport
  ConnectionFailed, ///< MQTT connect/disconnect failure
  SubscribeFailed,  ///< MQTT subscribe failure
  WriteFailed       ///< Database write failure
};

/**
 * @brief Error value carried in the unexpected branch of every fallible operation.
 */
struct Error {
  ErrorCode code;
  std::string message;
};

/**
 * @brief Returns a stable name for an error code (e.g. "ValueNotFound").
 */
[[nodiscard]] std::string_view to_string(ErrorCode code) noexcept;

/**
 * @brief Formats an error as "<code>: <message>".
 */
[[nodiscard]] std::string to_string(const Error& error);

/**
 * @brief Shorthand for building the unexpected branch of a result.
 */
[[nodiscard]] inline stdx::unexpected<Error> make_error(ErrorCode code, std::string message) {
  return stdx::unexpected(Error{.code = code, .message = std::move(message)});
}

/// Result type used throughout the project.
template <typename T>
using Result = stdx::expected<T, Error>;

} // namespace mqtt2db

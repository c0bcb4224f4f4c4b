// src/error.cpp
#include "mqtt2db/error.hpp"

namespace mqtt2db {

std::string_view to_string(ErrorCode code) noexcept {
  switch (code) {
  case ErrorCode::InvalidPatternLevel:
    return "InvalidPatternLevel";
  case ErrorCode::MisplacedMultiWildcard:
    return "MisplacedMultiWildcard";
  case ErrorCode::InvalidReferenceIndex:
    return "InvalidReferenceIndex";
  case ErrorCode::ReferenceOutOfRange:
    return "ReferenceOutOfRange";
  case ErrorCode::InvalidPathExpression:
    return "InvalidPathExpression";
  case ErrorCode::InvalidTagValue:
    return "InvalidTagValue";
  case ErrorCode::InvalidConfig:
    return "InvalidConfig";
  case ErrorCode::UnmatchedTopic:
    return "UnmatchedTopic";
  case ErrorCode::InvalidPayloadEncoding:
    return "InvalidPayloadEncoding";
  case ErrorCode::MalformedPayload:
    return "MalformedPayload";
  case ErrorCode::ValueNotFound:
    return "ValueNotFound";
  case ErrorCode::TimestampNotFound:
    return "TimestampNotFound";
  case ErrorCode::TimestampNotNumeric:
    return "TimestampNotNumeric";
  case ErrorCode::InvalidBoolean:
    return "InvalidBoolean";
  case ErrorCode::InvalidNumber:
    return "InvalidNumber";
  case ErrorCode::UnsupportedTextSource:
    return "UnsupportedTextSource";
  case ErrorCode::UnresolvedReference:
    return "UnresolvedReference";
  case ErrorCode::ConnectionFailed:
    return "ConnectionFailed";
  case ErrorCode::SubscribeFailed:
    return "SubscribeFailed";
  case ErrorCode::WriteFailed:
    return "WriteFailed";
  }
  stdx::unreachable();
}

std::string to_string(const Error& error) {
  return stdx::format("{}: {}", to_string(error.code), error.message);
}

} // namespace mqtt2db

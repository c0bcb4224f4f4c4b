// src/mapping.cpp
#include "mqtt2db/mapping.hpp"

#include <chrono>

namespace mqtt2db {

namespace {

Result<NameTemplate> compile_bounded_template(std::string_view raw, std::size_t max_captures,
                                              std::string_view topic, std::string_view what) {
  auto compiled = NameTemplate::compile(raw);
  if (!compiled) {
    return stdx::unexpected(compiled.error());
  }
  if (compiled->max_reference() > max_captures) {
    return make_error(ErrorCode::ReferenceOutOfRange,
                      stdx::format("Topic '{}' has {} '{}' which references ${} but the "
                                   "topic only has {} '+' wildcard(s)",
                                   topic, what, raw, compiled->max_reference(), max_captures));
  }
  return compiled;
}

Result<TagValue> compile_tag_value(const TagConfig& tag, std::size_t max_captures,
                                   std::string_view topic) {
  if (tag.type != ValueType::Text) {
    auto literal = coerce(tag.value, tag.type);
    if (!literal) {
      return make_error(ErrorCode::InvalidTagValue,
                        stdx::format("Tag '{}' on topic '{}': {}", tag.name, topic,
                                     literal.error().message));
    }
    return TagValue{std::in_place_index<0>, std::move(*literal)};
  }

  auto name = compile_bounded_template(tag.value, max_captures, topic,
                                       stdx::format("tag '{}'", tag.name));
  if (!name) {
    return stdx::unexpected(name.error());
  }
  if (!name->has_references()) {
    // Only literal parts; fold into fixed text (escapes already resolved)
    std::string text;
    for (const auto& part : name->parts()) {
      text += part.literal;
    }
    return TagValue{std::in_place_index<0>, TypedValue{std::move(text)}};
  }
  return TagValue{std::in_place_index<1>, std::move(*name)};
}

Result<PayloadSpec> compile_payload(const std::optional<PayloadConfig>& config) {
  if (!config) {
    return PayloadSpec{RawPayload{}};
  }

  auto value_path = JsonPath::compile(config->value_field_path);
  if (!value_path) {
    return make_error(ErrorCode::InvalidPathExpression,
                      stdx::format("Value field path: {}", value_path.error().message));
  }

  std::optional<JsonPath> timestamp_path;
  if (config->timestamp_field_path) {
    auto compiled = JsonPath::compile(*config->timestamp_field_path);
    if (!compiled) {
      return make_error(ErrorCode::InvalidPathExpression,
                        stdx::format("Timestamp field path: {}", compiled.error().message));
    }
    timestamp_path = std::move(*compiled);
  }

  return PayloadSpec{JsonPayload{.value_path = std::move(*value_path),
                                 .timestamp_path = std::move(timestamp_path)}};
}

struct Extracted {
  TypedValue value;
  std::optional<uint64_t> timestamp_ms;
};

// Failures carry the stage they happened in; the caller fills in topic and rule.
using StageResult = stdx::expected<Extracted, std::pair<DispatchStage, Error>>;

StageResult extract(const Rule& rule, std::span<const uint8_t> payload) {
  auto fail = [](DispatchStage stage, Error error) {
    return stdx::unexpected(std::make_pair(stage, std::move(error)));
  };

  auto text = payload_as_text(payload);
  if (!text) {
    return fail(DispatchStage::Payload, text.error());
  }

  if (std::holds_alternative<RawPayload>(rule.payload)) {
    auto value = coerce(*text, rule.value_type);
    if (!value) {
      return fail(DispatchStage::Value, value.error());
    }
    return Extracted{.value = std::move(*value), .timestamp_ms = std::nullopt};
  }

  const auto& json = std::get<JsonPayload>(rule.payload);
  auto document = parse_document(*text);
  if (!document) {
    return fail(DispatchStage::Payload, document.error());
  }

  auto node = extract_value(*document, json.value_path);
  if (!node) {
    return fail(DispatchStage::Value, node.error());
  }
  auto value = coerce(node->get(), rule.value_type);
  if (!value) {
    return fail(DispatchStage::Value, value.error());
  }

  std::optional<uint64_t> timestamp_ms;
  if (json.timestamp_path) {
    auto ts = extract_timestamp(*document, *json.timestamp_path);
    if (!ts) {
      return fail(DispatchStage::Timestamp, ts.error());
    }
    timestamp_ms = *ts;
  }

  return Extracted{.value = std::move(*value), .timestamp_ms = timestamp_ms};
}

} // namespace

Result<Rule> Rule::compile(const MappingConfig& config) {
  auto topic = TopicPattern::compile(config.topic);
  if (!topic) {
    return stdx::unexpected(topic.error());
  }
  auto max_captures = topic->single_wildcard_count();

  auto field_name =
      compile_bounded_template(config.field_name, max_captures, config.topic, "field name");
  if (!field_name) {
    return stdx::unexpected(field_name.error());
  }

  auto payload = compile_payload(config.payload);
  if (!payload) {
    return stdx::unexpected(payload.error());
  }

  std::vector<Tag> tags;
  tags.reserve(config.tags.size());
  for (const auto& tag : config.tags) {
    auto value = compile_tag_value(tag, max_captures, config.topic);
    if (!value) {
      return stdx::unexpected(value.error());
    }
    tags.push_back(Tag{.name = tag.name, .value = std::move(*value)});
  }

  return Rule{.topic = std::move(*topic),
              .payload = std::move(*payload),
              .field_name = std::move(*field_name),
              .value_type = config.value_type,
              .tags = std::move(tags)};
}

std::string_view to_string(DispatchStage stage) noexcept {
  switch (stage) {
  case DispatchStage::Match:
    return "match";
  case DispatchStage::FieldName:
    return "field-name";
  case DispatchStage::Payload:
    return "payload";
  case DispatchStage::Value:
    return "value";
  case DispatchStage::Timestamp:
    return "timestamp";
  case DispatchStage::Tags:
    return "tags";
  }
  stdx::unreachable();
}

std::string to_string(const DispatchError& error) {
  if (!error.rule_index) {
    return stdx::format("Topic '{}' dropped at {}: {}", error.topic, to_string(error.stage),
                        to_string(error.error));
  }
  return stdx::format("Topic '{}' (mapping #{}) dropped at {}: {}", error.topic,
                      *error.rule_index, to_string(error.stage), to_string(error.error));
}

uint64_t current_time_ms() {
  auto now = std::chrono::system_clock::now();
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count());
}

Result<RuleTable> RuleTable::compile(std::span<const MappingConfig> mappings) {
  std::vector<std::shared_ptr<const Rule>> rules;
  rules.reserve(mappings.size());

  for (std::size_t i = 0; i < mappings.size(); ++i) {
    auto rule = Rule::compile(mappings[i]);
    if (!rule) {
      return make_error(rule.error().code,
                        stdx::format("Mapping #{} (topic '{}'): {}", i, mappings[i].topic,
                                     rule.error().message));
    }
    rules.push_back(std::make_shared<const Rule>(std::move(*rule)));
  }

  return RuleTable(std::move(rules));
}

std::optional<std::size_t> RuleTable::find_rule(std::string_view topic) const {
  for (std::size_t i = 0; i < rules_.size(); ++i) {
    if (rules_[i]->topic.matches(topic)) {
      return i;
    }
  }
  return std::nullopt;
}

stdx::expected<DataPoint, DispatchError>
RuleTable::dispatch(std::string_view topic, std::span<const uint8_t> payload,
                    uint64_t received_at_ms) const {
  auto index = find_rule(topic);
  if (!index) {
    return stdx::unexpected(DispatchError{
        .topic = std::string(topic),
        .rule_index = std::nullopt,
        .stage = DispatchStage::Match,
        .error = Error{.code = ErrorCode::UnmatchedTopic,
                       .message = stdx::format("Topic {} not found in mappings", topic)}});
  }

  const Rule& rule = *rules_[*index];
  auto fail = [&](DispatchStage stage, Error error) {
    return stdx::unexpected(DispatchError{.topic = std::string(topic),
                                          .rule_index = index,
                                          .stage = stage,
                                          .error = std::move(error)});
  };

  // find_rule() matched, so captures() always yields a value here
  auto captures = rule.topic.captures(topic).value_or(std::vector<std::string>{});

  auto field_name = rule.field_name.render(captures);
  if (!field_name) {
    return fail(DispatchStage::FieldName, field_name.error());
  }

  auto extracted = extract(rule, payload);
  if (!extracted) {
    return fail(extracted.error().first, std::move(extracted.error().second));
  }

  std::vector<std::pair<std::string, TypedValue>> tags;
  tags.reserve(rule.tags.size());
  for (const auto& tag : rule.tags) {
    if (const auto* fixed = std::get_if<TypedValue>(&tag.value)) {
      tags.emplace_back(tag.name, *fixed);
      continue;
    }
    auto rendered = std::get<NameTemplate>(tag.value).render(captures);
    if (!rendered) {
      return fail(DispatchStage::Tags, rendered.error());
    }
    tags.emplace_back(tag.name, TypedValue{std::move(*rendered)});
  }

  return DataPoint{.timestamp_ms = extracted->timestamp_ms.value_or(received_at_ms),
                   .field_name = std::move(*field_name),
                   .value = std::move(extracted->value),
                   .tags = std::move(tags)};
}

stdx::expected<DataPoint, DispatchError>
RuleTable::dispatch(std::string_view topic, std::span<const uint8_t> payload) const {
  return dispatch(topic, payload, current_time_ms());
}

std::vector<std::string> RuleTable::topics() const {
  std::vector<std::string> result;
  result.reserve(rules_.size());
  for (const auto& rule : rules_) {
    result.push_back(rule->topic.str());
  }
  return result;
}

} // namespace mqtt2db

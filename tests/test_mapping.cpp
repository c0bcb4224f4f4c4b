// tests/test_mapping.cpp
#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <mqtt2db/mapping.hpp>

using mqtt2db::DataPoint;
using mqtt2db::DispatchStage;
using mqtt2db::ErrorCode;
using mqtt2db::MappingConfig;
using mqtt2db::PayloadConfig;
using mqtt2db::RuleTable;
using mqtt2db::TagConfig;
using mqtt2db::TypedValue;
using mqtt2db::ValueType;

namespace {

constexpr uint64_t RECEIVED_AT = 1700000000123;

std::vector<uint8_t> bytes(std::string_view text) {
  return {text.begin(), text.end()};
}

MappingConfig raw_mapping(std::string topic, std::string field_name, ValueType type,
                          std::vector<TagConfig> tags = {}) {
  return MappingConfig{.topic = std::move(topic),
                       .payload = std::nullopt,
                       .field_name = std::move(field_name),
                       .value_type = type,
                       .tags = std::move(tags)};
}

MappingConfig json_mapping(std::string topic, std::string field_name, ValueType type,
                           std::string value_path,
                           std::optional<std::string> timestamp_path = std::nullopt) {
  return MappingConfig{
      .topic = std::move(topic),
      .payload = PayloadConfig{.value_field_path = std::move(value_path),
                               .timestamp_field_path = std::move(timestamp_path)},
      .field_name = std::move(field_name),
      .value_type = type,
      .tags = {}};
}

RuleTable compile(const std::vector<MappingConfig>& mappings) {
  auto table = RuleTable::compile(mappings);
  assert(table.has_value());
  return std::move(*table);
}

} // namespace

void test_raw_payload_dispatch() {
  auto table = compile({raw_mapping("sensors/+/temp", "temp_$1", ValueType::Float)});

  auto point = table.dispatch("sensors/kitchen/temp", bytes("21.5"), RECEIVED_AT);
  assert(point.has_value());

  DataPoint expected{.timestamp_ms = RECEIVED_AT,
                     .field_name = "temp_kitchen",
                     .value = TypedValue{21.5},
                     .tags = {}};
  assert(*point == expected);
  std::cout << "[OK] Raw payload maps to a data point\n";
}

void test_unmatched_topic_is_not_fatal() {
  auto table = compile({raw_mapping("sensors/+/temp", "temp_$1", ValueType::Float)});

  auto dropped = table.dispatch("weather/outside", bytes("12"), RECEIVED_AT);
  assert(!dropped.has_value());
  assert(dropped.error().stage == DispatchStage::Match);
  assert(dropped.error().error.code == ErrorCode::UnmatchedTopic);
  assert(!dropped.error().rule_index.has_value());
  assert(dropped.error().topic == "weather/outside");

  auto next = table.dispatch("sensors/hall/temp", bytes("18"), RECEIVED_AT);
  assert(next.has_value());
  assert(next->field_name == "temp_hall");
  std::cout << "[OK] Unmatched topic is dropped and later messages still map\n";
}

void test_first_match_wins() {
  auto table = compile({raw_mapping("sensors/kitchen/temp", "kitchen", ValueType::Float),
                        raw_mapping("sensors/+/temp", "any_$1", ValueType::Float),
                        raw_mapping("sensors/#", "fallback", ValueType::Text)});

  assert(table.find_rule("sensors/kitchen/temp") == 0);
  assert(table.find_rule("sensors/hall/temp") == 1);
  assert(table.find_rule("sensors/hall/humidity") == 2);
  assert(!table.find_rule("other").has_value());

  auto point = table.dispatch("sensors/hall/humidity", bytes("high"), RECEIVED_AT);
  assert(point.has_value());
  assert(point->field_name == "fallback");
  assert(point->value == TypedValue{std::string("high")});

  assert((table.topics() ==
          std::vector<std::string>{"sensors/kitchen/temp", "sensors/+/temp", "sensors/#"}));
  std::cout << "[OK] First matching rule wins\n";
}

void test_tags() {
  auto table = compile({raw_mapping(
      "home/+/+/state", "$2", ValueType::Boolean,
      {TagConfig{.name = "room", .type = ValueType::Text, .value = "$1"},
       TagConfig{.name = "label", .type = ValueType::Text, .value = "$1-$2"},
       TagConfig{.name = "source", .type = ValueType::Text, .value = "mqtt"},
       TagConfig{.name = "floor", .type = ValueType::SignedInteger, .value = "-1"},
       TagConfig{.name = "escaped", .type = ValueType::Text, .value = "\\$1"}})});

  auto point = table.dispatch("home/garage/door/state", bytes("true"), RECEIVED_AT);
  assert(point.has_value());
  assert(point->field_name == "door");
  assert(point->value == TypedValue{true});

  std::vector<std::pair<std::string, TypedValue>> expected{
      {"room", TypedValue{std::string("garage")}},
      {"label", TypedValue{std::string("garage-door")}},
      {"source", TypedValue{std::string("mqtt")}},
      {"floor", TypedValue{int64_t{-1}}},
      {"escaped", TypedValue{std::string("$1")}}};
  assert(point->tags == expected);

  const auto& rule = table.rule(0);
  assert(std::holds_alternative<TypedValue>(rule->tags[2].value));
  assert(std::holds_alternative<mqtt2db::NameTemplate>(rule->tags[0].value));
  std::cout << "[OK] Fixed and templated tags render in order\n";
}

void test_value_coercion_failure() {
  auto table = compile({raw_mapping("switches/+", "switch_$1", ValueType::Boolean)});

  auto point = table.dispatch("switches/hall", bytes("on"), RECEIVED_AT);
  assert(!point.has_value());
  assert(point.error().stage == DispatchStage::Value);
  assert(point.error().error.code == ErrorCode::InvalidBoolean);
  assert(point.error().rule_index == 0);
  std::cout << "[OK] Coercion failure drops the message\n";
}

void test_invalid_utf8_payload() {
  auto table = compile({raw_mapping("notes", "note", ValueType::Text)});

  std::vector<uint8_t> payload{'a', 0xFF};
  auto point = table.dispatch("notes", payload, RECEIVED_AT);
  assert(!point.has_value());
  assert(point.error().stage == DispatchStage::Payload);
  assert(point.error().error.code == ErrorCode::InvalidPayloadEncoding);
  std::cout << "[OK] Invalid UTF-8 payload drops the message\n";
}

void test_json_payload() {
  auto table = compile({json_mapping("meters/+/reading", "energy_$1", ValueType::UnsignedInteger,
                                     "$.reading.value", "$.ts")});

  auto point = table.dispatch("meters/plant/reading",
                              bytes(R"({"reading": {"value": 1234}, "ts": 1650000000000})"),
                              RECEIVED_AT);
  assert(point.has_value());
  assert(point->field_name == "energy_plant");
  assert(point->value == TypedValue{uint64_t{1234}});
  assert(point->timestamp_ms == 1650000000000ULL);
  std::cout << "[OK] JSON payload with timestamp\n";
}

void test_json_without_timestamp_path_uses_receive_time() {
  auto table = compile({json_mapping("weather", "temp", ValueType::Float, "$.temp")});

  auto point = table.dispatch("weather", bytes(R"({"temp": -3.5, "ts": 5})"), RECEIVED_AT);
  assert(point.has_value());
  assert(point->timestamp_ms == RECEIVED_AT);
  assert(point->value == TypedValue{-3.5});
  std::cout << "[OK] JSON payload without timestamp path uses receive time\n";
}

void test_missing_timestamp_fails_message() {
  auto table = compile({json_mapping("weather", "temp", ValueType::Float, "$.temp", "$.ts")});

  auto point = table.dispatch("weather", bytes(R"({"temp": 12})"), RECEIVED_AT);
  assert(!point.has_value());
  assert(point.error().stage == DispatchStage::Timestamp);
  assert(point.error().error.code == ErrorCode::TimestampNotFound);

  auto not_numeric = table.dispatch("weather", bytes(R"({"temp": 12, "ts": "now"})"),
                                    RECEIVED_AT);
  assert(!not_numeric.has_value());
  assert(not_numeric.error().stage == DispatchStage::Timestamp);
  assert(not_numeric.error().error.code == ErrorCode::TimestampNotNumeric);
  std::cout << "[OK] Configured timestamp path that matches nothing fails the message\n";
}

void test_json_failures() {
  auto table = compile({json_mapping("weather", "temp", ValueType::Float, "$.temp")});

  auto malformed = table.dispatch("weather", bytes("{temp: 1"), RECEIVED_AT);
  assert(!malformed.has_value());
  assert(malformed.error().stage == DispatchStage::Payload);
  assert(malformed.error().error.code == ErrorCode::MalformedPayload);

  auto missing = table.dispatch("weather", bytes(R"({"humidity": 40})"), RECEIVED_AT);
  assert(!missing.has_value());
  assert(missing.error().stage == DispatchStage::Value);
  assert(missing.error().error.code == ErrorCode::ValueNotFound);

  auto wrong_type = table.dispatch("weather", bytes(R"({"temp": "warm"})"), RECEIVED_AT);
  assert(!wrong_type.has_value());
  assert(wrong_type.error().stage == DispatchStage::Value);
  assert(wrong_type.error().error.code == ErrorCode::InvalidNumber);
  std::cout << "[OK] JSON failures drop the message at the right stage\n";
}

void test_compile_errors() {
  auto bad_pattern = RuleTable::compile(
      std::vector<MappingConfig>{raw_mapping("ok/topic", "f", ValueType::Float),
                                 raw_mapping("foo/#/bar", "f", ValueType::Float)});
  assert(!bad_pattern.has_value());
  assert(bad_pattern.error().code == ErrorCode::MisplacedMultiWildcard);
  assert(bad_pattern.error().message.find("Mapping #1") != std::string::npos);

  auto out_of_range = RuleTable::compile(
      std::vector<MappingConfig>{raw_mapping("sensors/+/temp", "temp_$2", ValueType::Float)});
  assert(!out_of_range.has_value());
  assert(out_of_range.error().code == ErrorCode::ReferenceOutOfRange);

  auto tag_out_of_range = RuleTable::compile(std::vector<MappingConfig>{
      raw_mapping("sensors/+/temp", "temp", ValueType::Float,
                  {TagConfig{.name = "room", .type = ValueType::Text, .value = "$1$2"}})});
  assert(!tag_out_of_range.has_value());
  assert(tag_out_of_range.error().code == ErrorCode::ReferenceOutOfRange);

  auto multi_has_no_captures = RuleTable::compile(
      std::vector<MappingConfig>{raw_mapping("sensors/#", "temp_$1", ValueType::Float)});
  assert(!multi_has_no_captures.has_value());
  assert(multi_has_no_captures.error().code == ErrorCode::ReferenceOutOfRange);

  auto zero = RuleTable::compile(
      std::vector<MappingConfig>{raw_mapping("sensors/+", "temp_$0", ValueType::Float)});
  assert(!zero.has_value());
  assert(zero.error().code == ErrorCode::InvalidReferenceIndex);

  auto bad_path = RuleTable::compile(
      std::vector<MappingConfig>{json_mapping("weather", "temp", ValueType::Float, "temp")});
  assert(!bad_path.has_value());
  assert(bad_path.error().code == ErrorCode::InvalidPathExpression);

  auto bad_ts_path = RuleTable::compile(std::vector<MappingConfig>{
      json_mapping("weather", "temp", ValueType::Float, "$.temp", "$.[")});
  assert(!bad_ts_path.has_value());
  assert(bad_ts_path.error().code == ErrorCode::InvalidPathExpression);

  auto bad_tag = RuleTable::compile(std::vector<MappingConfig>{
      raw_mapping("weather", "temp", ValueType::Float,
                  {TagConfig{.name = "floor", .type = ValueType::UnsignedInteger,
                             .value = "-1"}})});
  assert(!bad_tag.has_value());
  assert(bad_tag.error().code == ErrorCode::InvalidTagValue);
  std::cout << "[OK] Configuration errors are reported at compile time\n";
}

void test_dispatch_error_text() {
  auto table = compile({raw_mapping("switches/+", "switch_$1", ValueType::Boolean)});

  auto point = table.dispatch("switches/hall", bytes("maybe"), RECEIVED_AT);
  assert(!point.has_value());
  auto text = mqtt2db::to_string(point.error());
  assert(text.find("switches/hall") != std::string::npos);
  assert(text.find("#0") != std::string::npos);
  assert(text.find("value") != std::string::npos);

  auto unmatched = table.dispatch("nowhere", bytes("1"), RECEIVED_AT);
  assert(!unmatched.has_value());
  assert(mqtt2db::to_string(unmatched.error()).find("match") != std::string::npos);
  std::cout << "[OK] Dispatch errors name topic, rule and stage\n";
}

void test_concurrent_dispatch() {
  auto table = compile({raw_mapping("sensors/+/temp", "temp_$1", ValueType::Float)});

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&table, t]() {
      auto room = "room" + std::to_string(t);
      auto topic = "sensors/" + room + "/temp";
      for (int i = 0; i < 500; ++i) {
        auto point = table.dispatch(topic, bytes(std::to_string(i)), RECEIVED_AT);
        assert(point.has_value());
        assert(point->field_name == "temp_" + room);
        assert(point->value == TypedValue{static_cast<double>(i)});
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  std::cout << "[OK] Concurrent dispatch shares the rule table\n";
}

void test_shared_rules() {
  auto table = compile({raw_mapping("a/+", "$1", ValueType::Text)});

  std::shared_ptr<const mqtt2db::Rule> rule = table.rule(0);
  RuleTable copy({rule});
  assert(copy.size() == 1);
  assert(copy.rule(0).get() == table.rule(0).get());

  auto point = copy.dispatch("a/b", bytes("x"), RECEIVED_AT);
  assert(point.has_value());
  assert(point->field_name == "b");
  std::cout << "[OK] Compiled rules are shared read-only\n";
}

int main() {
  test_raw_payload_dispatch();
  test_unmatched_topic_is_not_fatal();
  test_first_match_wins();
  test_tags();
  test_value_coercion_failure();
  test_invalid_utf8_payload();
  test_json_payload();
  test_json_without_timestamp_path_uses_receive_time();
  test_missing_timestamp_fails_message();
  test_json_failures();
  test_compile_errors();
  test_dispatch_error_text();
  test_concurrent_dispatch();
  test_shared_rules();

  std::cout << "\nAll tests passed!\n";
  return 0;
}

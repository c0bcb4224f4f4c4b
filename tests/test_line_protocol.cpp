// tests/test_line_protocol.cpp
#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>
#include <string>

#include <mqtt2db/line_protocol.hpp>

using mqtt2db::DataPoint;
using mqtt2db::TypedValue;

namespace {

DataPoint point(TypedValue value) {
  return DataPoint{.timestamp_ms = 1700000000000,
                   .field_name = "value",
                   .value = std::move(value),
                   .tags = {}};
}

} // namespace

void test_field_values() {
  assert(*mqtt2db::to_line_protocol("m", point(TypedValue{true})) ==
         "m value=true 1700000000000");
  assert(*mqtt2db::to_line_protocol("m", point(TypedValue{21.5})) ==
         "m value=21.5 1700000000000");
  assert(*mqtt2db::to_line_protocol("m", point(TypedValue{int64_t{-3}})) ==
         "m value=-3i 1700000000000");
  assert(*mqtt2db::to_line_protocol("m", point(TypedValue{std::numeric_limits<uint64_t>::max()})) ==
         "m value=18446744073709551615u 1700000000000");
  assert(*mqtt2db::to_line_protocol("m", point(TypedValue{std::string("on")})) ==
         "m value=\"on\" 1700000000000");
  std::cout << "[OK] Field values carry their line protocol type\n";
}

void test_string_field_escaping() {
  auto line = mqtt2db::to_line_protocol("m", point(TypedValue{std::string("say \"hi\" \\o/")}));
  assert(line.has_value());
  assert(*line == "m value=\"say \\\"hi\\\" \\\\o/\" 1700000000000");
  std::cout << "[OK] String fields escape quotes and backslashes\n";
}

void test_tags_and_key_escaping() {
  DataPoint data{.timestamp_ms = 42,
                 .field_name = "temp kitchen",
                 .value = TypedValue{1.0},
                 .tags = {{"room", TypedValue{std::string("living room")}},
                          {"id=x", TypedValue{int64_t{7}}},
                          {"a,b", TypedValue{std::string("c,d")}},
                          {"empty", TypedValue{std::string()}},
                          {"flag", TypedValue{false}}}};

  auto line = mqtt2db::to_line_protocol("my measurement,1", data);
  assert(line.has_value());
  assert(*line == "my\\ measurement\\,1,room=living\\ room,id\\=x=7,a\\,b=c\\,d,flag=false "
                 "temp\\ kitchen=1 42");
  std::cout << "[OK] Tags render in order with escaping, empty tags are skipped\n";
}

void test_non_finite_float_rejected() {
  for (double value : {std::numeric_limits<double>::quiet_NaN(),
                       std::numeric_limits<double>::infinity(),
                       -std::numeric_limits<double>::infinity()}) {
    auto line = mqtt2db::to_line_protocol("m", point(TypedValue{value}));
    assert(!line.has_value());
    assert(line.error().code == mqtt2db::ErrorCode::InvalidNumber);
  }

  // Text "nan" coerces to a Float, but never reaches the wire
  auto nan = mqtt2db::coerce("nan", mqtt2db::ValueType::Float);
  assert(nan.has_value());
  auto line = mqtt2db::to_line_protocol("m", point(*nan));
  assert(!line.has_value());
  std::cout << "[OK] NaN and infinite floats are rejected\n";
}

void test_escape_helpers() {
  assert(mqtt2db::escape_measurement("a b,c=d") == "a\\ b\\,c=d");
  assert(mqtt2db::escape_key("a b,c=d") == "a\\ b\\,c\\=d");
  assert(mqtt2db::escape_key("plain") == "plain");
  std::cout << "[OK] Escape helpers\n";
}

int main() {
  test_field_values();
  test_string_field_escaping();
  test_tags_and_key_escaping();
  test_non_finite_float_rejected();
  test_escape_helpers();

  std::cout << "\nAll tests passed!\n";
  return 0;
}

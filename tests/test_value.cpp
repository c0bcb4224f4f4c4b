// tests/test_value.cpp
#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>
#include <string>

#include <json/value.h>

#include <mqtt2db/value.hpp>

using mqtt2db::coerce;
using mqtt2db::ErrorCode;
using mqtt2db::TypedValue;
using mqtt2db::ValueType;

void test_text_boolean() {
  auto yes = coerce("true", ValueType::Boolean);
  assert(yes.has_value());
  assert(*yes == TypedValue{true});

  auto no = coerce("false", ValueType::Boolean);
  assert(no.has_value());
  assert(*no == TypedValue{false});

  for (const char* bad : {"yes", "True", "FALSE", "1", "", " true"}) {
    auto result = coerce(bad, ValueType::Boolean);
    assert(!result.has_value());
    assert(result.error().code == ErrorCode::InvalidBoolean);
  }
  std::cout << "[OK] Text boolean accepts exactly true/false\n";
}

void test_text_float() {
  auto pi = coerce("3.14", ValueType::Float);
  assert(pi.has_value());
  assert(*pi == TypedValue{3.14});

  auto negative = coerce("-2.5e3", ValueType::Float);
  assert(negative.has_value());
  assert(*negative == TypedValue{-2500.0});

  auto integral = coerce("21", ValueType::Float);
  assert(integral.has_value());
  assert(*integral == TypedValue{21.0});

  for (const char* bad : {"abc", "1.5x", "", "1,5", " 1.5", "+-2.5"}) {
    auto result = coerce(bad, ValueType::Float);
    assert(!result.has_value());
    assert(result.error().code == ErrorCode::InvalidNumber);
  }
  std::cout << "[OK] Text float parsing\n";
}

void test_text_signed_integer() {
  auto value = coerce("-42", ValueType::SignedInteger);
  assert(value.has_value());
  assert(*value == TypedValue{int64_t{-42}});

  auto plus = coerce("+7", ValueType::SignedInteger);
  assert(plus.has_value());
  assert(*plus == TypedValue{int64_t{7}});

  auto min = coerce("-9223372036854775808", ValueType::SignedInteger);
  assert(min.has_value());
  assert(*min == TypedValue{std::numeric_limits<int64_t>::min()});

  for (const char* bad : {"9223372036854775808", "1.0", "12a", "", "+", "+-1"}) {
    auto result = coerce(bad, ValueType::SignedInteger);
    assert(!result.has_value());
    assert(result.error().code == ErrorCode::InvalidNumber);
  }
  std::cout << "[OK] Text signed integer parsing\n";
}

void test_text_unsigned_integer() {
  auto value = coerce("18446744073709551615", ValueType::UnsignedInteger);
  assert(value.has_value());
  assert(*value == TypedValue{std::numeric_limits<uint64_t>::max()});

  auto negative = coerce("-1", ValueType::UnsignedInteger);
  assert(!negative.has_value());
  assert(negative.error().code == ErrorCode::InvalidNumber);

  auto overflow = coerce("18446744073709551616", ValueType::UnsignedInteger);
  assert(!overflow.has_value());
  assert(overflow.error().code == ErrorCode::InvalidNumber);
  std::cout << "[OK] Text unsigned integer parsing\n";
}

void test_text_identity() {
  auto value = coerce("  anything goes ", ValueType::Text);
  assert(value.has_value());
  assert(*value == TypedValue{std::string("  anything goes ")});

  auto empty = coerce("", ValueType::Text);
  assert(empty.has_value());
  assert(*empty == TypedValue{std::string()});
  std::cout << "[OK] Text coercion is identity\n";
}

void test_node_boolean() {
  auto value = coerce(Json::Value(true), ValueType::Boolean);
  assert(value.has_value());
  assert(*value == TypedValue{true});

  auto from_string = coerce(Json::Value("true"), ValueType::Boolean);
  assert(!from_string.has_value());
  assert(from_string.error().code == ErrorCode::InvalidBoolean);

  auto from_number = coerce(Json::Value(1), ValueType::Boolean);
  assert(!from_number.has_value());
  assert(from_number.error().code == ErrorCode::InvalidBoolean);
  std::cout << "[OK] Node boolean requires a JSON boolean\n";
}

void test_node_numbers() {
  auto real = coerce(Json::Value(21.5), ValueType::Float);
  assert(real.has_value());
  assert(*real == TypedValue{21.5});

  auto int_as_float = coerce(Json::Value(3), ValueType::Float);
  assert(int_as_float.has_value());
  assert(*int_as_float == TypedValue{3.0});

  auto signed_value = coerce(Json::Value(Json::Int64{-1}), ValueType::SignedInteger);
  assert(signed_value.has_value());
  assert(*signed_value == TypedValue{int64_t{-1}});

  auto negative_unsigned = coerce(Json::Value(Json::Int64{-1}), ValueType::UnsignedInteger);
  assert(!negative_unsigned.has_value());
  assert(negative_unsigned.error().code == ErrorCode::InvalidNumber);

  auto big = coerce(Json::Value(Json::UInt64{18446744073709551615ULL}),
                    ValueType::UnsignedInteger);
  assert(big.has_value());
  assert(*big == TypedValue{std::numeric_limits<uint64_t>::max()});

  auto big_signed = coerce(Json::Value(Json::UInt64{18446744073709551615ULL}),
                           ValueType::SignedInteger);
  assert(!big_signed.has_value());
  assert(big_signed.error().code == ErrorCode::InvalidNumber);

  auto fractional = coerce(Json::Value(1.5), ValueType::SignedInteger);
  assert(!fractional.has_value());
  assert(fractional.error().code == ErrorCode::InvalidNumber);

  auto numeric_string = coerce(Json::Value("12"), ValueType::UnsignedInteger);
  assert(!numeric_string.has_value());
  assert(numeric_string.error().code == ErrorCode::InvalidNumber);
  std::cout << "[OK] Node numbers must convert without loss\n";
}

void test_node_text() {
  auto str = coerce(Json::Value("kitchen"), ValueType::Text);
  assert(str.has_value());
  assert(*str == TypedValue{std::string("kitchen")});

  auto boolean = coerce(Json::Value(false), ValueType::Text);
  assert(boolean.has_value());
  assert(*boolean == TypedValue{std::string("false")});

  auto integer = coerce(Json::Value(Json::Int64{-12}), ValueType::Text);
  assert(integer.has_value());
  assert(*integer == TypedValue{std::string("-12")});

  auto real = coerce(Json::Value(2.5), ValueType::Text);
  assert(real.has_value());
  assert(*real == TypedValue{std::string("2.5")});

  auto whole = coerce(Json::Value(1.0), ValueType::Text);
  assert(whole.has_value());
  assert(*whole == TypedValue{std::string("1.0")});

  for (auto kind : {Json::nullValue, Json::arrayValue, Json::objectValue}) {
    auto result = coerce(Json::Value(kind), ValueType::Text);
    assert(!result.has_value());
    assert(result.error().code == ErrorCode::UnsupportedTextSource);
  }
  std::cout << "[OK] Node text stringifies scalars only\n";
}

void test_value_type_names() {
  assert(mqtt2db::parse_value_type("boolean") == ValueType::Boolean);
  assert(mqtt2db::parse_value_type("float") == ValueType::Float);
  assert(mqtt2db::parse_value_type("signed-integer") == ValueType::SignedInteger);
  assert(mqtt2db::parse_value_type("unsigned-integer") == ValueType::UnsignedInteger);
  assert(mqtt2db::parse_value_type("text") == ValueType::Text);
  assert(!mqtt2db::parse_value_type("string").has_value());

  assert(mqtt2db::to_string(ValueType::SignedInteger) == "signed integer");
  assert(mqtt2db::type_of(TypedValue{uint64_t{1}}) == ValueType::UnsignedInteger);
  assert(mqtt2db::type_of(TypedValue{std::string("x")}) == ValueType::Text);
  std::cout << "[OK] Value type names\n";
}

void test_typed_value_to_string() {
  assert(mqtt2db::to_string(TypedValue{true}) == "true");
  assert(mqtt2db::to_string(TypedValue{21.5}) == "21.5");
  assert(mqtt2db::to_string(TypedValue{int64_t{-3}}) == "-3");
  assert(mqtt2db::to_string(TypedValue{uint64_t{7}}) == "7");
  assert(mqtt2db::to_string(TypedValue{std::string("kitchen")}) == "kitchen");
  std::cout << "[OK] Typed values render as plain text\n";
}

void test_coercion_is_stable() {
  for (int i = 0; i < 3; ++i) {
    auto value = coerce("3.14", ValueType::Float);
    assert(value.has_value());
    assert(*value == TypedValue{3.14});
  }
  std::cout << "[OK] Coercion has no hidden state\n";
}

int main() {
  test_text_boolean();
  test_text_float();
  test_text_signed_integer();
  test_text_unsigned_integer();
  test_text_identity();
  test_node_boolean();
  test_node_numbers();
  test_node_text();
  test_value_type_names();
  test_typed_value_to_string();
  test_coercion_is_stable();

  std::cout << "\nAll tests passed!\n";
  return 0;
}

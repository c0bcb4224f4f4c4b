// examples/dispatch_example.cpp
// Maps a handful of sample messages offline and prints the resulting line protocol.
// No broker or database is needed.

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include <mqtt2db/line_protocol.hpp>
#include <mqtt2db/mapping.hpp>

namespace {

std::vector<uint8_t> bytes(std::string_view text) {
  return {text.begin(), text.end()};
}

} // namespace

int main() {
  std::vector<mqtt2db::MappingConfig> mappings{
      {.topic = "sensors/+/temp",
       .payload = std::nullopt,
       .field_name = "temp_$1",
       .value_type = mqtt2db::ValueType::Float,
       .tags = {{.name = "room", .type = mqtt2db::ValueType::Text, .value = "$1"}}},
      {.topic = "meters/+/+/reading",
       .payload = mqtt2db::PayloadConfig{.value_field_path = "$.reading.value",
                                         .timestamp_field_path = "$.ts"},
       .field_name = "$2",
       .value_type = mqtt2db::ValueType::UnsignedInteger,
       .tags = {{.name = "site", .type = mqtt2db::ValueType::Text, .value = "$1"},
                {.name = "phase", .type = mqtt2db::ValueType::SignedInteger, .value = "3"}}},
      {.topic = "switches/#",
       .payload = std::nullopt,
       .field_name = "switch",
       .value_type = mqtt2db::ValueType::Boolean,
       .tags = {}},
  };

  auto table = mqtt2db::RuleTable::compile(mappings);
  if (!table) {
    std::cerr << "Failed to compile mappings: " << mqtt2db::to_string(table.error()) << "\n";
    return 1;
  }

  struct Sample {
    std::string topic;
    std::string payload;
  };
  std::vector<Sample> samples{
      {"sensors/kitchen/temp", "21.5"},
      {"meters/plant-a/energy/reading", R"({"reading": {"value": 1234}, "ts": 1700000000000})"},
      {"switches/hall/main", "true"},
      {"switches/hall/main", "on"},
      {"weather/outside", "12"},
  };

  constexpr uint64_t received_at_ms = 1700000000500;
  for (const auto& sample : samples) {
    auto payload = bytes(sample.payload);
    auto point = table->dispatch(sample.topic, payload, received_at_ms);
    if (!point) {
      std::cout << "DROP  " << mqtt2db::to_string(point.error()) << "\n";
      continue;
    }
    auto line = mqtt2db::to_line_protocol("mqtt", *point);
    if (!line) {
      std::cout << "DROP  " << line.error().message << "\n";
      continue;
    }
    std::cout << "WRITE " << *line << "\n";
  }

  return 0;
}

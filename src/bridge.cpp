// src/bridge.cpp
#include "mqtt2db/bridge.hpp"

#include <utility>

namespace mqtt2db {

Bridge::Bridge(RuleTable table, LogCallback log_callback)
    : table_(std::move(table)), log_callback_(std::move(log_callback)) {}

void Bridge::log(LogLevel level, std::string_view message) const noexcept {
  if (log_callback_) {
    log_callback_(level, message);
  }
}

void Bridge::add_destination(std::string name, WriteFunction write) {
  destinations_.push_back(Destination{.name = std::move(name), .write = std::move(write)});
}

bool Bridge::handle(const InboundMessage& message) {
  return handle(message, current_time_ms());
}

bool Bridge::handle(const InboundMessage& message, uint64_t received_at_ms) {
  ++received_;

  auto point = table_.dispatch(message.topic, message.payload, received_at_ms);
  if (!point) {
    ++dropped_;
    log(LogLevel::WARN, to_string(point.error()));
    return false;
  }
  ++dispatched_;

  for (const auto& destination : destinations_) {
    auto result = destination.write(*point);
    if (!result) {
      ++write_failures_;
      log(LogLevel::ERROR, stdx::format("Write of '{}' from '{}' to '{}' failed: {}",
                                        point->field_name, message.topic, destination.name,
                                        to_string(result.error())));
      continue;
    }
    log(LogLevel::DEBUG, stdx::format("Wrote '{}' from '{}' to '{}'", point->field_name,
                                      message.topic, destination.name));
  }
  return true;
}

Bridge::Stats Bridge::stats() const noexcept {
  return Stats{.received = received_.load(),
               .dispatched = dispatched_.load(),
               .dropped = dropped_.load(),
               .write_failures = write_failures_.load()};
}

} // namespace mqtt2db

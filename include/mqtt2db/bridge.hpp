// include/mqtt2db/bridge.hpp
#pragma once

#include "error.hpp"
#include "log.hpp"
#include "mapping.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace mqtt2db {

/// Delivers one data point to a destination.
using WriteFunction = std::function<Result<void>(const DataPoint&)>;

/**
 * @brief Connects inbound MQTT messages to the configured destinations.
 *
 * Every message goes through RuleTable::dispatch(). The resulting data point is handed
 * to each destination in turn; a failing destination is logged and the others still
 * receive the point. Dropped messages are logged at WARN and never interrupt processing.
 *
 * @par Thread Safety
 * Destinations must be added before handle() is first called. handle() itself may be
 * called concurrently; the counters are atomic.
 *
 * @par Example Usage
 * @code
 * mqtt2db::Bridge bridge(std::move(*table), log_callback);
 * bridge.add_destination("home", [&writer](const mqtt2db::DataPoint& point) {
 *   return writer.write(point);
 * });
 * subscriber_config.message_callback = [&bridge](const mqtt2db::InboundMessage& msg) {
 *   bridge.handle(msg);
 * };
 * @endcode
 */
class Bridge {
public:
  /**
   * @brief Message counters since construction.
   */
  struct Stats {
    uint64_t received;       ///< Messages passed to handle()
    uint64_t dispatched;     ///< Messages that produced a data point
    uint64_t dropped;        ///< Messages rejected by the rule table
    uint64_t write_failures; ///< Individual destination writes that failed
  };

  explicit Bridge(RuleTable table, LogCallback log_callback = {});

  Bridge(const Bridge&) = delete;
  Bridge& operator=(const Bridge&) = delete;

  /**
   * @brief Adds a destination. Points are delivered in the order destinations were added.
   */
  void add_destination(std::string name, WriteFunction write);

  /**
   * @brief Maps one message and delivers the result to every destination.
   *
   * @param received_at_ms Timestamp used when the matching rule extracts none
   *
   * @return true if the message produced a data point
   */
  bool handle(const InboundMessage& message, uint64_t received_at_ms);

  /**
   * @brief Maps one message received now.
   */
  bool handle(const InboundMessage& message);

  [[nodiscard]] const RuleTable& rules() const noexcept { return table_; }

  [[nodiscard]] Stats stats() const noexcept;

private:
  struct Destination {
    std::string name;
    WriteFunction write;
  };

  RuleTable table_;
  LogCallback log_callback_;
  std::vector<Destination> destinations_;

  std::atomic<uint64_t> received_{0};
  std::atomic<uint64_t> dispatched_{0};
  std::atomic<uint64_t> dropped_{0};
  std::atomic<uint64_t> write_failures_{0};

  void log(LogLevel level, std::string_view message) const noexcept;
};

} // namespace mqtt2db

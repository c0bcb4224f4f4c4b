// include/mqtt2db/mapping.hpp
#pragma once

#include "error.hpp"
#include "name_template.hpp"
#include "payload.hpp"
#include "topic_pattern.hpp"
#include "value.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace mqtt2db {

/**
 * @brief An inbound MQTT message as delivered by the subscriber.
 */
struct InboundMessage {
  std::string topic;
  std::vector<uint8_t> payload;
};

/**
 * @brief Configured value of one tag, before compilation.
 */
struct TagConfig {
  std::string name;  ///< Tag key
  ValueType type;    ///< Declared type of the value
  std::string value; ///< Literal value, or template when type is Text
};

/**
 * @brief JSON payload directives of a mapping, before compilation.
 */
struct PayloadConfig {
  std::string value_field_path;                    ///< e.g. "$.value"
  std::optional<std::string> timestamp_field_path; ///< e.g. "$.ts"
};

/**
 * @brief One configured topic-to-data-point mapping, before compilation.
 */
struct MappingConfig {
  std::string topic;                    ///< Topic pattern ('+' and '#' allowed)
  std::optional<PayloadConfig> payload; ///< Absent means the payload is raw text
  std::string field_name;               ///< Field name template
  ValueType value_type;                 ///< Declared type of the field value
  std::vector<TagConfig> tags;          ///< Tags in configuration order
};

/// A compiled tag value: a fixed typed literal, or a template rendered per message.
using TagValue = std::variant<TypedValue, NameTemplate>;

/**
 * @brief A compiled tag.
 */
struct Tag {
  std::string name;
  TagValue value;
};

/**
 * @brief A compiled, immutable mapping rule.
 *
 * Rules are compiled once at startup and shared read-only between dispatch calls.
 */
struct Rule {
  TopicPattern topic;
  PayloadSpec payload;
  NameTemplate field_name;
  ValueType value_type;
  std::vector<Tag> tags;

  /**
   * @brief Compiles and validates a mapping.
   *
   * Besides the topic, template and path compile errors, fails with ReferenceOutOfRange
   * when the field name or a templated tag references more captures than the topic has
   * '+' levels, and with InvalidTagValue when a fixed tag does not coerce to its type.
   */
  [[nodiscard]] static Result<Rule> compile(const MappingConfig& config);
};

/**
 * @brief The data point produced for one inbound message.
 */
struct DataPoint {
  uint64_t timestamp_ms;                                 ///< Milliseconds since epoch
  std::string field_name;                                ///< Rendered field name
  TypedValue value;                                      ///< Coerced field value
  std::vector<std::pair<std::string, TypedValue>> tags;  ///< Rendered tags, rule order

  [[nodiscard]] bool operator==(const DataPoint&) const = default;
};

/**
 * @brief Processing step at which a message was dropped.
 */
enum class DispatchStage {
  Match,     ///< No rule matched the topic
  FieldName, ///< Rendering the field name failed
  Payload,   ///< Payload decoding or JSON parsing failed
  Value,     ///< Value extraction or coercion failed
  Timestamp, ///< Timestamp extraction failed
  Tags       ///< Rendering a tag failed
};

/**
 * @brief Per-message failure description, suitable for logging.
 */
struct DispatchError {
  std::string topic;
  std::optional<std::size_t> rule_index; ///< Set once a rule has matched
  DispatchStage stage;
  Error error;
};

[[nodiscard]] std::string_view to_string(DispatchStage stage) noexcept;

/**
 * @brief Formats a dispatch error with topic, rule index and stage.
 */
[[nodiscard]] std::string to_string(const DispatchError& error);

/**
 * @brief Current wall-clock time in milliseconds since the Unix epoch.
 */
[[nodiscard]] uint64_t current_time_ms();

/**
 * @brief Ordered, immutable set of compiled rules with first-match dispatch.
 *
 * @par Thread Safety
 * A RuleTable is never mutated after construction. Any number of threads may call
 * find_rule() and dispatch() concurrently without synchronization.
 *
 * @par Example Usage
 * @code
 * std::vector<mqtt2db::MappingConfig> mappings{{.topic = "sensors/+/temp",
 *                                               .payload = std::nullopt,
 *                                               .field_name = "temp_$1",
 *                                               .value_type = mqtt2db::ValueType::Float,
 *                                               .tags = {}}};
 * auto table = mqtt2db::RuleTable::compile(mappings);
 * auto point = table->dispatch("sensors/kitchen/temp", payload_bytes);
 * @endcode
 */
class RuleTable {
public:
  RuleTable() = default;
  explicit RuleTable(std::vector<std::shared_ptr<const Rule>> rules)
      : rules_(std::move(rules)) {}

  /**
   * @brief Compiles every mapping, in order.
   *
   * @return The rule table, or the first configuration error. The error message names
   *         the offending mapping's position and topic.
   */
  [[nodiscard]] static Result<RuleTable> compile(std::span<const MappingConfig> mappings);

  /**
   * @brief Finds the first rule whose topic pattern matches.
   *
   * @return Index of the matching rule, or std::nullopt
   */
  [[nodiscard]] std::optional<std::size_t> find_rule(std::string_view topic) const;

  /**
   * @brief Maps one inbound message to a data point.
   *
   * @param topic Concrete topic the message was published on
   * @param payload Raw payload bytes
   * @param received_at_ms Timestamp used when the rule extracts none
   *
   * @return The data point, or a description of the step that failed
   */
  [[nodiscard]] stdx::expected<DataPoint, DispatchError>
  dispatch(std::string_view topic, std::span<const uint8_t> payload,
           uint64_t received_at_ms) const;

  /**
   * @brief Maps one inbound message, using the current time as fallback timestamp.
   */
  [[nodiscard]] stdx::expected<DataPoint, DispatchError>
  dispatch(std::string_view topic, std::span<const uint8_t> payload) const;

  [[nodiscard]] const std::shared_ptr<const Rule>& rule(std::size_t index) const {
    return rules_.at(index);
  }

  [[nodiscard]] std::size_t size() const noexcept { return rules_.size(); }

  [[nodiscard]] bool empty() const noexcept { return rules_.empty(); }

  /// Topic patterns of all rules, in rule order (the subscription list).
  [[nodiscard]] std::vector<std::string> topics() const;

private:
  std::vector<std::shared_ptr<const Rule>> rules_;
};

} // namespace mqtt2db

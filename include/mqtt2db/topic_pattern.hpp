// include/mqtt2db/topic_pattern.hpp
#pragma once

#include "error.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mqtt2db {

inline constexpr char TOPIC_SEPARATOR = '/';

/**
 * @brief Kinds of levels in a compiled MQTT topic pattern.
 */
enum class LevelKind {
  Literal,        ///< Matches exactly one topic level with identical text
  SingleWildcard, ///< '+': matches exactly one topic level, empty or not
  MultiWildcard   ///< '#': matches all remaining topic levels, including none
};

/**
 * @brief One level of a compiled topic pattern.
 */
struct TopicLevel {
  LevelKind kind;
  std::string literal; ///< Level text (only meaningful for LevelKind::Literal)

  [[nodiscard]] static TopicLevel make_literal(std::string text) {
    return TopicLevel{.kind = LevelKind::Literal, .literal = std::move(text)};
  }
  [[nodiscard]] static TopicLevel single_wildcard() {
    return TopicLevel{.kind = LevelKind::SingleWildcard, .literal = {}};
  }
  [[nodiscard]] static TopicLevel multi_wildcard() {
    return TopicLevel{.kind = LevelKind::MultiWildcard, .literal = {}};
  }

  [[nodiscard]] bool operator==(const TopicLevel&) const = default;
};

/**
 * @brief A compiled, immutable MQTT subscription pattern.
 *
 * Patterns are split on '/' with empty segments preserved, so "/foo/bar" has a leading
 * empty literal level and "foo/bar/" a trailing one. An empty level only matches an
 * empty topic level.
 *
 * @par Example
 * @code
 * auto pattern = mqtt2db::TopicPattern::compile("sensors/+/temp/#");
 * if (pattern) {
 *   auto caps = pattern->captures("sensors/kitchen/temp/raw"); // {"kitchen"}
 * }
 * @endcode
 */
class TopicPattern {
public:
  /**
   * @brief Compiles a topic pattern.
   *
   * @param pattern Slash-delimited pattern, optionally containing '+' and '#' levels
   *
   * @return Compiled pattern, or InvalidPatternLevel when a level mixes a wildcard with
   *         other characters, or MisplacedMultiWildcard when '#' is not the last level
   */
  [[nodiscard]] static Result<TopicPattern> compile(std::string_view pattern);

  /**
   * @brief Tests whether a concrete topic matches this pattern.
   */
  [[nodiscard]] bool matches(std::string_view topic) const;

  /**
   * @brief Extracts the topic levels consumed by '+' levels, in pattern order.
   *
   * @return Captured levels, or std::nullopt when the topic does not match
   *
   * @note '#' never produces a capture.
   */
  [[nodiscard]] std::optional<std::vector<std::string>> captures(std::string_view topic) const;

  [[nodiscard]] const std::vector<TopicLevel>& levels() const noexcept { return levels_; }

  /// Number of '+' levels, i.e. the number of captures a match produces.
  [[nodiscard]] std::size_t single_wildcard_count() const noexcept;

  /// The pattern text this was compiled from.
  [[nodiscard]] const std::string& str() const noexcept { return text_; }

private:
  TopicPattern(std::string text, std::vector<TopicLevel> levels)
      : text_(std::move(text)), levels_(std::move(levels)) {}

  bool match_levels(std::string_view topic, std::vector<std::string>* captures) const;

  std::string text_;
  std::vector<TopicLevel> levels_;
};

/**
 * @brief Splits a topic on '/', preserving empty levels ("" yields one empty level).
 */
[[nodiscard]] std::vector<std::string_view> split_topic(std::string_view topic);

} // namespace mqtt2db

// src/topic_pattern.cpp
#include "mqtt2db/topic_pattern.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace mqtt2db {

namespace {

Result<TopicLevel> parse_level(std::string_view level) {
  if (level == "+") {
    return TopicLevel::single_wildcard();
  }
  if (level == "#") {
    return TopicLevel::multi_wildcard();
  }
  if (level.find_first_of("+#") != std::string_view::npos) {
    return make_error(ErrorCode::InvalidPatternLevel,
                      stdx::format("Topic level '{}' cannot contain '+' or '#'", level));
  }
  return TopicLevel::make_literal(std::string(level));
}

} // namespace

std::vector<std::string_view> split_topic(std::string_view topic) {
  std::vector<std::string_view> levels;
  std::size_t start = 0;
  while (true) {
    auto pos = topic.find(TOPIC_SEPARATOR, start);
    if (pos == std::string_view::npos) {
      levels.push_back(topic.substr(start));
      break;
    }
    levels.push_back(topic.substr(start, pos - start));
    start = pos + 1;
  }
  return levels;
}

Result<TopicPattern> TopicPattern::compile(std::string_view pattern) {
  auto parts = split_topic(pattern);

  std::vector<TopicLevel> levels;
  levels.reserve(parts.size());
  for (auto part : parts) {
    auto level = parse_level(part);
    if (!level) {
      return stdx::unexpected(level.error());
    }
    levels.push_back(std::move(*level));
  }

  auto multi = std::find_if(levels.begin(), levels.end(), [](const TopicLevel& level) {
    return level.kind == LevelKind::MultiWildcard;
  });
  if (multi != levels.end() && std::next(multi) != levels.end()) {
    return make_error(ErrorCode::MisplacedMultiWildcard,
                      stdx::format("Topic '{}' has '#' wildcard before last topic level",
                                   pattern));
  }

  return TopicPattern(std::string(pattern), std::move(levels));
}

bool TopicPattern::match_levels(std::string_view topic,
                                std::vector<std::string>* captures) const {
  auto topic_levels = split_topic(topic);
  auto it = topic_levels.begin();

  for (const auto& expected : levels_) {
    switch (expected.kind) {
    case LevelKind::MultiWildcard:
      return true;
    case LevelKind::SingleWildcard:
      if (it == topic_levels.end()) {
        return false;
      }
      if (captures) {
        captures->emplace_back(*it);
      }
      ++it;
      break;
    case LevelKind::Literal:
      if (it == topic_levels.end() || *it != expected.literal) {
        return false;
      }
      ++it;
      break;
    }
  }

  // Only a match if every topic level was consumed
  return it == topic_levels.end();
}

bool TopicPattern::matches(std::string_view topic) const {
  return match_levels(topic, nullptr);
}

std::optional<std::vector<std::string>> TopicPattern::captures(std::string_view topic) const {
  std::vector<std::string> result;
  result.reserve(single_wildcard_count());
  if (!match_levels(topic, &result)) {
    return std::nullopt;
  }
  return result;
}

std::size_t TopicPattern::single_wildcard_count() const noexcept {
  return static_cast<std::size_t>(
      std::count_if(levels_.begin(), levels_.end(), [](const TopicLevel& level) {
        return level.kind == LevelKind::SingleWildcard;
      }));
}

} // namespace mqtt2db

// src/json_path.cpp
#include "mqtt2db/json_path.hpp"

#include <charconv>
#include <utility>

#include <json/value.h>

namespace mqtt2db {

namespace {

using Step = JsonPath::Step;

class PathParser {
public:
  explicit PathParser(std::string_view expression) : expr_(expression) {}

  Result<std::vector<Step>> parse() {
    if (expr_.empty() || expr_[0] != '$') {
      return fail("path must start with '$'");
    }
    pos_ = 1;

    std::vector<Step> steps;
    while (pos_ < expr_.size()) {
      Result<Step> step = [&]() -> Result<Step> {
        if (expr_.substr(pos_).starts_with("..")) {
          pos_ += 2;
          return parse_dotted(true);
        }
        if (expr_[pos_] == '.') {
          ++pos_;
          return parse_dotted(false);
        }
        if (expr_[pos_] == '[') {
          ++pos_;
          return parse_bracket();
        }
        return fail("expected '.' or '['");
      }();
      if (!step) {
        return stdx::unexpected(step.error());
      }
      steps.push_back(std::move(*step));
    }
    return steps;
  }

private:
  Result<Step> parse_dotted(bool recursive) {
    if (pos_ < expr_.size() && expr_[pos_] == '*') {
      ++pos_;
      return Step{.kind = recursive ? Step::Kind::RecursiveWildcard : Step::Kind::Wildcard,
                  .name = {},
                  .index = 0};
    }
    auto end = expr_.find_first_of(".[", pos_);
    if (end == std::string_view::npos) {
      end = expr_.size();
    }
    if (end == pos_) {
      return fail("expected member name");
    }
    std::string name(expr_.substr(pos_, end - pos_));
    pos_ = end;
    return Step{.kind = recursive ? Step::Kind::RecursiveChild : Step::Kind::Child,
                .name = std::move(name),
                .index = 0};
  }

  Result<Step> parse_bracket() {
    if (pos_ >= expr_.size()) {
      return fail("unterminated '['");
    }

    char c = expr_[pos_];
    Step step{.kind = Step::Kind::Wildcard, .name = {}, .index = 0};

    if (c == '*') {
      ++pos_;
    } else if (c == '\'' || c == '"') {
      ++pos_;
      std::string name;
      while (pos_ < expr_.size() && expr_[pos_] != c) {
        if (expr_[pos_] == '\\' && pos_ + 1 < expr_.size()) {
          ++pos_;
        }
        name.push_back(expr_[pos_++]);
      }
      if (pos_ >= expr_.size()) {
        return fail("unterminated quoted member name");
      }
      ++pos_;
      step.kind = Step::Kind::Child;
      step.name = std::move(name);
    } else if (c >= '0' && c <= '9') {
      auto begin = expr_.data() + pos_;
      auto [ptr, ec] = std::from_chars(begin, expr_.data() + expr_.size(), step.index);
      if (ec != std::errc{}) {
        return fail("array index out of range");
      }
      pos_ += static_cast<std::size_t>(ptr - begin);
      step.kind = Step::Kind::Index;
    } else {
      return fail("expected '*', index or quoted member name");
    }

    if (pos_ >= expr_.size() || expr_[pos_] != ']') {
      return fail("expected ']'");
    }
    ++pos_;
    return step;
  }

  stdx::unexpected<Error> fail(std::string_view what) const {
    return make_error(ErrorCode::InvalidPathExpression,
                      stdx::format("Path '{}' is invalid at offset {}: {}", expr_, pos_, what));
  }

  std::string_view expr_;
  std::size_t pos_{0};
};

const Json::Value* member(const Json::Value& node, const std::string& name) {
  if (!node.isObject()) {
    return nullptr;
  }
  return node.find(name.data(), name.data() + name.size());
}

} // namespace

Result<JsonPath> JsonPath::compile(std::string_view expression) {
  auto steps = PathParser(expression).parse();
  if (!steps) {
    return stdx::unexpected(steps.error());
  }
  return JsonPath(std::string(expression), std::move(*steps));
}

std::optional<std::reference_wrapper<const Json::Value>>
JsonPath::find_first(const Json::Value& document) const {
  if (const auto* found = find_from(document, 0)) {
    return std::cref(*found);
  }
  return std::nullopt;
}

const Json::Value* JsonPath::find_from(const Json::Value& node, std::size_t step) const {
  if (step == steps_.size()) {
    return &node;
  }

  const auto& current = steps_[step];
  switch (current.kind) {
  case Step::Kind::Child: {
    const auto* child = member(node, current.name);
    return child ? find_from(*child, step + 1) : nullptr;
  }

  case Step::Kind::Index: {
    if (!node.isArray() || current.index >= node.size()) {
      return nullptr;
    }
    return find_from(node[static_cast<Json::ArrayIndex>(current.index)], step + 1);
  }

  case Step::Kind::Wildcard: {
    if (!node.isArray() && !node.isObject()) {
      return nullptr;
    }
    for (const auto& child : node) {
      if (const auto* found = find_from(child, step + 1)) {
        return found;
      }
    }
    return nullptr;
  }

  case Step::Kind::RecursiveChild: {
    if (const auto* child = member(node, current.name)) {
      if (const auto* found = find_from(*child, step + 1)) {
        return found;
      }
    }
    if (!node.isArray() && !node.isObject()) {
      return nullptr;
    }
    for (const auto& child : node) {
      if (const auto* found = find_from(child, step)) {
        return found;
      }
    }
    return nullptr;
  }

  case Step::Kind::RecursiveWildcard: {
    if (!node.isArray() && !node.isObject()) {
      return nullptr;
    }
    for (const auto& child : node) {
      if (const auto* found = find_from(child, step + 1)) {
        return found;
      }
      if (const auto* found = find_from(child, step)) {
        return found;
      }
    }
    return nullptr;
  }
  }
  stdx::unreachable();
}

} // namespace mqtt2db

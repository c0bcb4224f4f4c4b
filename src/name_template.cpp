// src/name_template.cpp
#include "mqtt2db/name_template.hpp"

#include <algorithm>
#include <charconv>

namespace mqtt2db {

namespace {

constexpr bool is_digit(char c) noexcept {
  return c >= '0' && c <= '9';
}

} // namespace

Result<NameTemplate> NameTemplate::compile(std::string_view raw) {
  std::vector<TemplatePart> parts;
  std::string literal;
  std::size_t max_reference = 0;

  auto flush_literal = [&]() {
    if (!literal.empty()) {
      parts.push_back(TemplatePart::make_literal(std::move(literal)));
      literal.clear();
    }
  };

  std::size_t pos = 0;
  while (pos < raw.size()) {
    char c = raw[pos];

    if (c == '\\' && pos + 1 < raw.size() && raw[pos + 1] == '$') {
      literal.push_back('$');
      pos += 2;
      continue;
    }

    if (c == '$' && pos + 1 < raw.size() && is_digit(raw[pos + 1])) {
      auto digits_begin = pos + 1;
      auto digits_end = digits_begin;
      while (digits_end < raw.size() && is_digit(raw[digits_end])) {
        ++digits_end;
      }

      std::size_t index = 0;
      auto [ptr, ec] = std::from_chars(raw.data() + digits_begin, raw.data() + digits_end, index);
      if (ec != std::errc{} || index == 0) {
        return make_error(ErrorCode::InvalidReferenceIndex,
                          stdx::format("Invalid reference number {} for name '{}'",
                                       raw.substr(digits_begin, digits_end - digits_begin),
                                       raw));
      }

      flush_literal();
      parts.push_back(TemplatePart::make_reference(index));
      max_reference = std::max(max_reference, index);
      pos = digits_end;
      continue;
    }

    literal.push_back(c);
    ++pos;
  }
  flush_literal();

  return NameTemplate(std::string(raw), std::move(parts), max_reference);
}

Result<std::string> NameTemplate::render(std::span<const std::string> captures) const {
  std::string out;
  for (const auto& part : parts_) {
    switch (part.kind) {
    case TemplatePart::Kind::Literal:
      out.append(part.literal);
      break;
    case TemplatePart::Kind::Reference:
      if (part.index > captures.size()) {
        return make_error(ErrorCode::UnresolvedReference,
                          stdx::format("Can't find reference number {} to interpolate in '{}'",
                                       part.index, raw_));
      }
      out.append(captures[part.index - 1]);
      break;
    }
  }
  return out;
}

} // namespace mqtt2db

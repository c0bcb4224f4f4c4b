// include/mqtt2db/name_template.hpp
#pragma once

#include "error.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mqtt2db {

/**
 * @brief One piece of a compiled name template.
 */
struct TemplatePart {
  enum class Kind {
    Literal,  ///< Text copied verbatim
    Reference ///< 1-based index into the topic capture list
  };

  Kind kind;
  std::string literal;   ///< Only meaningful for Kind::Literal
  std::size_t index{0};  ///< Only meaningful for Kind::Reference

  [[nodiscard]] static TemplatePart make_literal(std::string text) {
    return TemplatePart{.kind = Kind::Literal, .literal = std::move(text), .index = 0};
  }
  [[nodiscard]] static TemplatePart make_reference(std::size_t index) {
    return TemplatePart{.kind = Kind::Reference, .literal = {}, .index = index};
  }

  [[nodiscard]] bool operator==(const TemplatePart&) const = default;
};

/**
 * @brief A compiled string template with positional references to topic captures.
 *
 * A reference is '$' followed by one or more decimal digits ("$1", "$23"). A backslash
 * immediately before '$' escapes it: "\$1" renders as the literal text "$1". Any other
 * backslash, and any '$' not followed by a digit, is literal text.
 *
 * @par Example
 * @code
 * auto name = mqtt2db::NameTemplate::compile("temp_$1");
 * std::vector<std::string> caps{"kitchen"};
 * auto rendered = name->render(caps); // "temp_kitchen"
 * @endcode
 */
class NameTemplate {
public:
  /**
   * @brief Compiles a template string.
   *
   * @return Compiled template, or InvalidReferenceIndex for "$0" or an index that does
   *         not fit in std::size_t
   */
  [[nodiscard]] static Result<NameTemplate> compile(std::string_view raw);

  /**
   * @brief Renders the template using the given capture list.
   *
   * @return Rendered string, or UnresolvedReference when a reference index exceeds
   *         captures.size(). No partial output is returned on failure.
   */
  [[nodiscard]] Result<std::string> render(std::span<const std::string> captures) const;

  [[nodiscard]] const std::vector<TemplatePart>& parts() const noexcept { return parts_; }

  /// Highest reference index used, 0 when the template has no references.
  [[nodiscard]] std::size_t max_reference() const noexcept { return max_reference_; }

  [[nodiscard]] bool has_references() const noexcept { return max_reference_ > 0; }

  /// The raw template text this was compiled from.
  [[nodiscard]] const std::string& str() const noexcept { return raw_; }

private:
  NameTemplate(std::string raw, std::vector<TemplatePart> parts, std::size_t max_reference)
      : raw_(std::move(raw)), parts_(std::move(parts)), max_reference_(max_reference) {}

  std::string raw_;
  std::vector<TemplatePart> parts_;
  std::size_t max_reference_{0};
};

} // namespace mqtt2db

// include/mqtt2db/json_path.hpp
#pragma once

#include "error.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <json/forwards.h>

namespace mqtt2db {

/**
 * @brief A compiled JSONPath selector that yields the first matching node.
 *
 * Supported syntax:
 * - `$`                      root node
 * - `.name`, `['name']`      object member
 * - `[N]`                    array element (non-negative index)
 * - `.*`, `[*]`              every child
 * - `..name`, `..*`          recursive descent
 *
 * Evaluation is depth-first pre-order. Arrays are visited in index order and objects
 * in the JSON library's member order.
 *
 * @par Example
 * @code
 * auto path = mqtt2db::JsonPath::compile("$.readings[0].value");
 * if (path) {
 *   auto node = path->find_first(document);
 * }
 * @endcode
 */
class JsonPath {
public:
  struct Step {
    enum class Kind {
      Child,            ///< `.name` / `['name']`
      Index,            ///< `[N]`
      Wildcard,         ///< `.*` / `[*]`
      RecursiveChild,   ///< `..name`
      RecursiveWildcard ///< `..*`
    };

    Kind kind;
    std::string name;      ///< Member name for Child / RecursiveChild
    std::size_t index{0};  ///< Element index for Index

    [[nodiscard]] bool operator==(const Step&) const = default;
  };

  /**
   * @brief Compiles a path expression.
   *
   * @return Compiled path, or InvalidPathExpression describing the offending position
   */
  [[nodiscard]] static Result<JsonPath> compile(std::string_view expression);

  /**
   * @brief Finds the first node matching this path in document order.
   *
   * @return Reference into the document, or std::nullopt if nothing matches
   */
  [[nodiscard]] std::optional<std::reference_wrapper<const Json::Value>>
  find_first(const Json::Value& document) const;

  [[nodiscard]] const std::vector<Step>& steps() const noexcept { return steps_; }

  [[nodiscard]] const std::string& str() const noexcept { return expression_; }

private:
  JsonPath(std::string expression, std::vector<Step> steps)
      : expression_(std::move(expression)), steps_(std::move(steps)) {}

  const Json::Value* find_from(const Json::Value& node, std::size_t step) const;

  std::string expression_;
  std::vector<Step> steps_;
};

} // namespace mqtt2db

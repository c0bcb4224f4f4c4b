#pragma once

// Compatibility layer for C++23 features
// Provides fallbacks for older compilers that lack full C++23 stdlib support

#include <version>

// std::expected compatibility
// Feature test macro from: https://en.cppreference.com/w/cpp/feature_test
#if __cpp_lib_expected >= 202202L
#  include <expected>
namespace mqtt2db::stdx {
using std::expected;
using std::unexpected;
} // namespace mqtt2db::stdx
#else
// Fallback to tl::expected for older standard libraries (e.g., GCC 12)
#  include <tl/expected.hpp>
namespace mqtt2db::stdx {
using tl::expected;
using tl::unexpected;
} // namespace mqtt2db::stdx
#endif

// std::format compatibility
// Use fmt library where std::format is unavailable or explicitly disabled
#if defined(MQTT2DB_USE_FMT) || !defined(__cpp_lib_format)
#  include <fmt/format.h>
namespace mqtt2db::stdx {
using fmt::format;
} // namespace mqtt2db::stdx
#else
#  include <format>
namespace mqtt2db::stdx {
using std::format;
} // namespace mqtt2db::stdx
#endif

// std::unreachable compatibility
#if __cpp_lib_unreachable >= 202202L
#  include <utility>
namespace mqtt2db::stdx {
using std::unreachable;
} // namespace mqtt2db::stdx
#else
namespace mqtt2db::stdx {
[[noreturn]] inline void unreachable() {
#  if defined(__GNUC__) || defined(__clang__)
  __builtin_unreachable();
#  elif defined(_MSC_VER)
  __assume(false);
#  endif
}
} // namespace mqtt2db::stdx
#endif

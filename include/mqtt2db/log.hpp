// include/mqtt2db/log.hpp
#pragma once

#include <functional>
#include <string_view>

namespace mqtt2db {

/**
 * @brief Log severity levels for library diagnostics.
 */
enum class LogLevel {
  DEBUG = 0, ///< Detailed debugging information
  INFO = 1,  ///< Informational messages
  WARN = 2,  ///< Warning messages (dropped messages, lost connections)
  ERROR = 3  ///< Error messages (serious problems)
};

/**
 * @brief Callback function type for receiving log messages from the library.
 *
 * Library components never write to stdout/stderr themselves. An empty callback
 * disables logging.
 */
using LogCallback = std::function<void(LogLevel, std::string_view)>;

} // namespace mqtt2db

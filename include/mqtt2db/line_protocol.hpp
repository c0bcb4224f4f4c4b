// include/mqtt2db/line_protocol.hpp
#pragma once

#include "mapping.hpp"

#include <string>
#include <string_view>

namespace mqtt2db {

/**
 * @brief Renders a data point as one line of InfluxDB line protocol.
 *
 * Layout is `measurement[,tag=value...] field=value timestamp`. The timestamp is in
 * milliseconds, so the write must use `precision=ms`.
 *
 * Values are rendered as:
 * - Boolean: `true` / `false`
 * - Float: shortest round-trip decimal
 * - Signed integer: digits with an `i` suffix
 * - Unsigned integer: digits with a `u` suffix
 * - Text: double-quoted, with `"` and `\` escaped
 *
 * A non-finite Float field (NaN or infinity) fails with InvalidNumber.
 *
 * Tags are rendered as text regardless of their type. Tags whose rendered value is empty
 * are omitted since line protocol cannot represent them.
 *
 * @par Example
 * @code
 * DataPoint point{.timestamp_ms = 1700000000000,
 *                 .field_name = "temp_kitchen",
 *                 .value = 21.5,
 *                 .tags = {{"room", std::string("kitchen")}}};
 * *to_line_protocol("mqtt", point);
 * // mqtt,room=kitchen temp_kitchen=21.5 1700000000000
 * @endcode
 */
[[nodiscard]] Result<std::string> to_line_protocol(std::string_view measurement,
                                                   const DataPoint& point);

/// Escapes commas and spaces (measurement names).
[[nodiscard]] std::string escape_measurement(std::string_view name);

/// Escapes commas, equals signs and spaces (tag keys, tag values, field keys).
[[nodiscard]] std::string escape_key(std::string_view key);

} // namespace mqtt2db

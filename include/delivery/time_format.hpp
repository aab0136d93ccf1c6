#pragma once

#include "core/types.hpp"

#include <string>

namespace flbkinesis {

/**
 * @brief strftime in UTC with sub-second extensions
 *
 * Besides the standard conversions, %L expands to milliseconds (3 digits)
 * and %f to microseconds (6 digits). "%%" stays a literal percent sign.
 */
[[nodiscard]] std::string format_time(Timestamp tp, const std::string& format);

} // namespace flbkinesis

#pragma once

#include "splitline/time_format.hpp"

#include <cstdint>
#include <string>

namespace splitline {

// Render |duration_ms| against a pattern.
//
// Supported tokens:
//   h            hours (0+)
//   m            minutes (0-59)
//   s            seconds (0-59), always shown
//   d, dd, ddd   fractional seconds, truncated rather than rounded.
//                Widths above 3 are padded with zeros.
//
// Anything else is a literal. Leading zero hours/minutes are dropped along
// with the literals that would follow them, so "h:m:s" renders 125340 ms as
// "2:05". The sign is not rendered.
std::string render_duration(int64_t duration_ms, const Pattern& pattern);

} // namespace splitline

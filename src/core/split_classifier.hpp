#pragma once

#include "splitline/split_class.hpp"

#include <cstdint>

namespace splitline {

// Classify one segment against its baselines.
//
// comparison_ms  this segment's duration in the comparison
// split_ms       this segment's duration in the current attempt, or how long
//                it has been running so far
// diff_ms        signed difference to the comparison (negative = ahead)
// gold_ms        best recorded duration for the segment, 0 when none exists
// running        the segment is still in progress; it can't be gold yet
//
// A gold_ms of 0 counts as "no best recorded" and makes any finished segment
// gold, including a genuine zero-length one.
SplitClass classify_split(int64_t comparison_ms,
                          int64_t split_ms,
                          int64_t diff_ms,
                          int64_t gold_ms,
                          bool running);

} // namespace splitline

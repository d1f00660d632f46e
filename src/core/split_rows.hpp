#pragma once

#include "splitline/split_class.hpp"
#include "splitline/timer_source.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace splitline {

class Config;

// Everything the splits list needs to draw one row
struct SplitRow {
    size_t index = 0;
    std::string name;
    std::string value;
    SplitClass split_class = SplitClass::None;
    bool is_current = false;  // Segment in progress
};

// Build the rows for every segment of the run, for the timer's current
// comparison and timing method
std::vector<SplitRow> compute_split_rows(const ITimerSource& timer, Config& config);

// Build a single row; the rest of the list is not needed
SplitRow compute_split_row(const ITimerSource& timer, Config& config, size_t index);

} // namespace splitline

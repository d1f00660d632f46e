#pragma once

#include "splitline/split_class.hpp"
#include "splitline/timer_source.hpp"

#include <string>

namespace splitline {

class Config;

// What the previous segment is measured against
enum class InfoBaseline {
    Comparison,   // Segment time in the current comparison
    BestSegment   // Gold
};

// One labelled value below the splits list
struct SegmentInfo {
    std::string label;
    std::string value;  // Empty when there is nothing to show
    SplitClass split_class = SplitClass::None;
};

// How the last finished segment went against a baseline
SegmentInfo compute_previous_segment_info(const ITimerSource& timer, Config& config, InfoBaseline baseline);

// Best and comparison times of the segment being run
struct CurrentSegmentInfo {
    std::string name;
    std::string best;
    std::string comparison;
};

CurrentSegmentInfo compute_current_segment_info(const ITimerSource& timer, Config& config);

} // namespace splitline

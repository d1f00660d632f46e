#pragma once

#include "splitline/time_format.hpp"
#include "splitline/timer_source.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace splitline {

class Config;

// Clock-face subtraction: never goes below zero
inline int64_t saturating_sub(int64_t lhs, int64_t rhs) {
    return lhs > rhs ? lhs - rhs : 0;
}

// render_duration() with a leading '-' for negative values
std::string format_signed_duration(int64_t duration_ms, const Pattern& pattern);

// "--" when there is no value
std::string format_optional_duration(std::optional<int64_t> duration_ms, const Pattern& pattern);

// "+1.50", "-0.25", "~0.00" for a difference against a baseline
std::string format_delta(int64_t diff_ms, FormatSpec& spec);

// Timing method used for display: game time if forced by config or used by the timer
TimingMethod display_timing_method(const ITimerSource& timer, const Config& config);

// Split-column time, using the split format
std::string format_split_time(const Time& time, const ITimerSource& timer, Config& config);

// Segment readouts, using the segment format
std::string format_segment_time(int64_t duration_ms, Config& config);
std::string format_segment_time(std::optional<int64_t> duration_ms, Config& config);

// Attempt duration in the given timing method; game time leaves out loading
// times. Can be negative.
int64_t current_timer_duration(const ITimerSource& timer, TimingMethod method);

// Main readout, using the timer format
std::string format_timer(const ITimerSource& timer, Config& config);

// Split "1:02.34" into {"1:02.", "34"} for a large/small display
std::pair<std::string, std::string> split_timer_readout(const std::string& text);

} // namespace splitline

#pragma once

#include "splitline/time_format.hpp"

#include <cstdint>
#include <optional>

namespace splitline {

// Magnitude of the duration a dynamic pattern is resolved for
enum class MagnitudeBucket {
    UnderMinute,
    UnderHour,
    HourPlus
};

// Fields that end up in a pattern
struct VisibleFields {
    bool hours = false;
    bool minutes = false;
    bool seconds = false;
    bool decimals = false;
};

MagnitudeBucket bucket_for(int64_t total_ms);

// Apply magnitude rules to the configured flags. Without a bucket the flags
// are returned unchanged.
VisibleFields resolve_visible_fields(const FormatSpec& spec, std::optional<MagnitudeBucket> bucket);

// Build a pattern without touching the cache
Pattern compute_pattern(const FormatSpec& spec, std::optional<int64_t> total_ms);

// Pattern for a readout. Static specs are computed once and memoized in the
// spec; dynamic specs are recomputed on every call. The caller must hold the
// spec exclusively for the duration of the call.
Pattern resolve_pattern(FormatSpec& spec, std::optional<int64_t> total_ms);

} // namespace splitline

#include "pattern_resolver.hpp"

namespace splitline {

namespace {

constexpr int64_t kMinuteMs = 60'000;
constexpr int64_t kHourMs = 3'600'000;

void push_separator(Pattern& pattern, char separator) {
    // Only separate from a field that is already there
    if (!pattern.empty()) {
        pattern.push_back(separator);
    }
}

void push_decimals(Pattern& pattern, uint8_t places) {
    pattern.push_back('.');
    pattern.append(places, 'd');
}

} // namespace

MagnitudeBucket bucket_for(int64_t total_ms) {
    // Negative values are bucketed by magnitude; INT64_MIN has no positive
    // counterpart but is far past an hour either way
    if (total_ms < 0 && total_ms > -kHourMs) {
        total_ms = -total_ms;
    } else if (total_ms < 0) {
        return MagnitudeBucket::HourPlus;
    }

    if (total_ms < kMinuteMs) {
        return MagnitudeBucket::UnderMinute;
    }
    if (total_ms < kHourMs) {
        return MagnitudeBucket::UnderHour;
    }
    return MagnitudeBucket::HourPlus;
}

VisibleFields resolve_visible_fields(const FormatSpec& spec, std::optional<MagnitudeBucket> bucket) {
    VisibleFields fields;
    fields.hours = spec.show_hours();
    fields.minutes = spec.show_minutes();
    fields.seconds = spec.show_seconds();
    fields.decimals = spec.show_decimals();

    if (!bucket) {
        return fields;
    }

    // Minutes and seconds together are precise enough without decimals
    const bool minutes_and_seconds = spec.show_minutes() && spec.show_seconds();

    switch (*bucket) {
        case MagnitudeBucket::UnderMinute:
            fields.hours = false;
            fields.minutes = false;
            break;
        case MagnitudeBucket::UnderHour:
            fields.hours = false;
            if (minutes_and_seconds) {
                fields.decimals = false;
            }
            break;
        case MagnitudeBucket::HourPlus:
            if (minutes_and_seconds) {
                fields.decimals = false;
            }
            break;
    }

    return fields;
}

Pattern compute_pattern(const FormatSpec& spec, std::optional<int64_t> total_ms) {
    std::optional<MagnitudeBucket> bucket;
    if (spec.is_dynamic() && total_ms) {
        bucket = bucket_for(*total_ms);
    }
    const VisibleFields fields = resolve_visible_fields(spec, bucket);

    Pattern pattern;
    if (fields.hours) {
        pattern.push_back('h');
    }
    if (fields.minutes) {
        push_separator(pattern, ':');
        pattern.push_back('m');
    }
    if (fields.seconds) {
        push_separator(pattern, ':');
        pattern.push_back('s');
    }
    if (fields.decimals && spec.decimal_places() > 0) {
        push_decimals(pattern, spec.decimal_places());
    }

    // A readout always shows at least seconds
    if (pattern.empty()) {
        pattern.push_back('s');
        if (spec.show_seconds() && spec.show_decimals() && spec.decimal_places() > 0) {
            push_decimals(pattern, spec.decimal_places());
        }
    }

    return pattern;
}

Pattern resolve_pattern(FormatSpec& spec, std::optional<int64_t> total_ms) {
    if (spec.is_dynamic()) {
        return compute_pattern(spec, total_ms);
    }

    if (!spec.m_cached_pattern) {
        spec.m_cached_pattern = compute_pattern(spec, total_ms);
    }
    return *spec.m_cached_pattern;
}

} // namespace splitline

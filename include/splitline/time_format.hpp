#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace splitline {

// Pattern mini-language: runs of h, m, s and d select fields, anything else
// is a literal. "h:m:s.dd" -> "1:04:05.99"
using Pattern = std::string;

// Rendered in place of a duration that does not exist yet
constexpr const char* kNoDurationText = "--";

constexpr uint8_t kMaxDecimalPlaces = 9;

// Display flags for one kind of readout (timer, split column, segment info).
// The pattern cache is only ever written by resolve_pattern().
class FormatSpec {
public:
    bool show_hours() const { return m_show_hours; }
    bool show_minutes() const { return m_show_minutes; }
    bool show_seconds() const { return m_show_seconds; }
    bool show_decimals() const { return m_show_decimals; }
    uint8_t decimal_places() const { return m_decimal_places; }
    bool is_dynamic() const { return m_dynamic; }

    // Setters drop the cached pattern so the next resolve sees the new flags
    void set_show_hours(bool show) { m_show_hours = show; invalidate(); }
    void set_show_minutes(bool show) { m_show_minutes = show; invalidate(); }
    void set_show_seconds(bool show) { m_show_seconds = show; invalidate(); }
    void set_show_decimals(bool show) { m_show_decimals = show; invalidate(); }
    void set_decimal_places(uint8_t places) {
        m_decimal_places = places > kMaxDecimalPlaces ? kMaxDecimalPlaces : places;
        invalidate();
    }
    void set_dynamic(bool dynamic) { m_dynamic = dynamic; invalidate(); }

    const std::optional<Pattern>& cached_pattern() const { return m_cached_pattern; }
    void invalidate() { m_cached_pattern.reset(); }

private:
    friend Pattern resolve_pattern(FormatSpec& spec, std::optional<int64_t> total_ms);

    // Default mirrors "h:m:s.dd"
    bool m_show_hours = true;
    bool m_show_minutes = true;
    bool m_show_seconds = true;
    bool m_show_decimals = true;
    uint8_t m_decimal_places = 2;
    bool m_dynamic = false;

    std::optional<Pattern> m_cached_pattern;
};

} // namespace splitline

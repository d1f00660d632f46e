#include "duration_formatter.hpp"

#include <cstdio>

namespace splitline {

namespace {

void append_number(std::string& out, uint64_t value, bool always_show) {
    // Nothing before a zero field: skip it so the output never starts with ':'
    if (value == 0 && out.empty() && !always_show) {
        return;
    }

    char buf[24];
    if (out.empty()) {
        std::snprintf(buf, sizeof(buf), "%llu", static_cast<unsigned long long>(value));
    } else {
        // Minutes after hours, seconds after minutes are always 2 digits
        std::snprintf(buf, sizeof(buf), "%02llu", static_cast<unsigned long long>(value));
    }
    out += buf;
}

void append_fraction(std::string& out, uint64_t millis, size_t width) {
    char base[8];
    std::snprintf(base, sizeof(base), "%03llu", static_cast<unsigned long long>(millis));

    if (width <= 3) {
        out.append(base, width);
    } else {
        out.append(base, 3);
        out.append(width - 3, '0');
    }
}

} // namespace

std::string render_duration(int64_t duration_ms, const Pattern& pattern) {
    // Unsigned magnitude so INT64_MIN does not overflow
    const uint64_t abs_ms = duration_ms < 0
        ? 0 - static_cast<uint64_t>(duration_ms)
        : static_cast<uint64_t>(duration_ms);

    const uint64_t hours = abs_ms / 3'600'000;
    const uint64_t minutes = (abs_ms / 60'000) % 60;
    const uint64_t seconds = (abs_ms / 1'000) % 60;
    const uint64_t millis = abs_ms % 1'000;

    std::string out;

    size_t pos = 0;
    while (pos < pattern.size()) {
        const char ch = pattern[pos];
        size_t count = 1;
        while (pos + count < pattern.size() && pattern[pos + count] == ch) {
            count++;
        }
        pos += count;

        switch (ch) {
            case 'h':
                append_number(out, hours, false);
                break;
            case 'm':
                append_number(out, minutes, false);
                break;
            case 's':
                append_number(out, seconds, true);
                break;
            case 'd':
                append_fraction(out, millis, count);
                break;
            default:
                // Literals need something in front of them
                if (!out.empty()) {
                    out.append(count, ch);
                }
                break;
        }
    }

    return out;
}

} // namespace splitline

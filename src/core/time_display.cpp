#include "time_display.hpp"
#include "config.hpp"
#include "duration_formatter.hpp"
#include "pattern_resolver.hpp"

namespace splitline {

std::string format_signed_duration(int64_t duration_ms, const Pattern& pattern) {
    std::string out = render_duration(duration_ms, pattern);
    if (duration_ms < 0) {
        return "-" + out;
    }
    return out;
}

std::string format_optional_duration(std::optional<int64_t> duration_ms, const Pattern& pattern) {
    if (!duration_ms) {
        return kNoDurationText;
    }
    return render_duration(*duration_ms, pattern);
}

std::string format_delta(int64_t diff_ms, FormatSpec& spec) {
    const char* sign = diff_ms > 0 ? "+" : (diff_ms < 0 ? "-" : "~");
    const Pattern pattern = resolve_pattern(spec, diff_ms);
    return sign + render_duration(diff_ms, pattern);
}

TimingMethod display_timing_method(const ITimerSource& timer, const Config& config) {
    if (config.is_game_time() || timer.current_timing_method() == TimingMethod::GameTime) {
        return TimingMethod::GameTime;
    }
    return TimingMethod::RealTime;
}

std::string format_split_time(const Time& time, const ITimerSource& timer, Config& config) {
    const std::optional<int64_t> value = time.get(display_timing_method(timer, config));
    const Pattern pattern = resolve_pattern(config.format.split, value);
    return format_optional_duration(value, pattern);
}

std::string format_segment_time(int64_t duration_ms, Config& config) {
    const Pattern pattern = resolve_pattern(config.format.segment, duration_ms);
    return render_duration(duration_ms, pattern);
}

std::string format_segment_time(std::optional<int64_t> duration_ms, Config& config) {
    if (!duration_ms) {
        return kNoDurationText;
    }
    return format_segment_time(*duration_ms, config);
}

int64_t current_timer_duration(const ITimerSource& timer, TimingMethod method) {
    int64_t duration = timer.current_attempt_duration_ms() + timer.run().offset_ms;
    duration -= timer.pause_time_ms();
    if (method == TimingMethod::GameTime) {
        duration -= timer.loading_times_ms();
    }
    return duration;
}

std::string format_timer(const ITimerSource& timer, Config& config) {
    const int64_t duration = current_timer_duration(timer, display_timing_method(timer, config));
    // Dynamic patterns are bucketed by magnitude, so negative values resolve
    // the same as their positive counterparts
    const Pattern pattern = resolve_pattern(config.format.timer, duration);
    return format_signed_duration(duration, pattern);
}

std::pair<std::string, std::string> split_timer_readout(const std::string& text) {
    const size_t dot = text.rfind('.');
    if (dot == std::string::npos) {
        return {text, std::string()};
    }
    return {text.substr(0, dot + 1), text.substr(dot + 1)};
}

} // namespace splitline

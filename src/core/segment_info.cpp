#include "segment_info.hpp"
#include "config.hpp"
#include "split_classifier.hpp"
#include "time_display.hpp"

#include <optional>

namespace splitline {

namespace {

const char* baseline_label(InfoBaseline baseline) {
    return baseline == InfoBaseline::BestSegment ? "Previous Segment (Best):" : "Previous Segment:";
}

int64_t cumulative_or_zero(const Segment& segment, const std::string& comparison, TimingMethod method) {
    return segment.comparison(comparison).get(method).value_or(0);
}

} // namespace

SegmentInfo compute_previous_segment_info(const ITimerSource& timer, Config& config, InfoBaseline baseline) {
    SegmentInfo info;
    info.label = baseline_label(baseline);

    const std::optional<size_t> current_index = timer.current_split_index();
    if (!current_index || *current_index == 0) {
        return info;
    }

    const auto& segments = timer.run().segments;
    const size_t index = *current_index - 1;
    if (index >= segments.size()) {
        return info;
    }

    const TimingMethod method = display_timing_method(timer, config);
    const std::string& comparison_name = timer.current_comparison();
    const Segment& segment = segments[index];

    const int64_t split_ms = segment.split_time.get(method).value_or(0);
    if (split_ms == 0) {
        return info;
    }

    int64_t previous_split_ms = 0;
    int64_t previous_comparison_ms = 0;
    if (index > 0) {
        previous_split_ms = segments[index - 1].split_time.get(method).value_or(0);
        previous_comparison_ms = cumulative_or_zero(segments[index - 1], comparison_name, method);
    }

    const int64_t gold_ms = segment.best_segment_time.get(method).value_or(0);

    int64_t baseline_ms = 0;
    if (baseline == InfoBaseline::Comparison) {
        const int64_t comparison_ms = cumulative_or_zero(segment, comparison_name, method);
        if (comparison_ms == 0) {
            return info;
        }
        baseline_ms = comparison_ms - previous_comparison_ms;
        if (baseline_ms < 0) {
            baseline_ms = -baseline_ms;
        }
    } else {
        if (gold_ms == 0) {
            return info;
        }
        baseline_ms = gold_ms;
    }

    const int64_t segment_ms = saturating_sub(split_ms, previous_split_ms);
    const int64_t diff_ms = segment_ms - baseline_ms;

    info.value = format_delta(diff_ms, config.format.segment);
    info.split_class = classify_split(baseline_ms, segment_ms, diff_ms, gold_ms, false);
    return info;
}

CurrentSegmentInfo compute_current_segment_info(const ITimerSource& timer, Config& config) {
    CurrentSegmentInfo info;

    const auto& segments = timer.run().segments;
    if (segments.empty()) {
        info.best = kNoDurationText;
        info.comparison = kNoDurationText;
        return info;
    }

    // Before the start show the first segment, after the end the last one
    size_t index = timer.current_split_index().value_or(0);
    if (index >= segments.size()) {
        index = segments.size() - 1;
    }

    const TimingMethod method = display_timing_method(timer, config);
    const std::string& comparison_name = timer.current_comparison();
    const Segment& segment = segments[index];

    info.name = segment.name;
    info.best = format_segment_time(segment.best_segment_time.get(method), config);

    const std::optional<int64_t> comparison_ms = segment.comparison(comparison_name).get(method);
    if (!comparison_ms) {
        info.comparison = kNoDurationText;
    } else {
        int64_t previous_ms = 0;
        if (index > 0) {
            previous_ms = cumulative_or_zero(segments[index - 1], comparison_name, method);
        }
        info.comparison = format_segment_time(saturating_sub(*comparison_ms, previous_ms), config);
    }

    return info;
}

} // namespace splitline

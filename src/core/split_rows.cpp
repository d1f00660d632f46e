#include "split_rows.hpp"
#include "config.hpp"
#include "split_classifier.hpp"
#include "time_display.hpp"

namespace splitline {

SplitRow compute_split_row(const ITimerSource& timer, Config& config, size_t index) {
    const auto& segments = timer.run().segments;
    const Segment& segment = segments.at(index);
    const TimingMethod method = display_timing_method(timer, config);
    const std::string& comparison_name = timer.current_comparison();

    SplitRow row;
    row.index = index;
    row.name = segment.name;

    // Until the segment is reached the row shows the comparison time
    const Time comparison = segment.comparison(comparison_name);
    row.value = format_split_time(comparison, timer, config);

    const std::optional<size_t> current_index = timer.current_split_index();
    if (!current_index) {
        return row;
    }

    // Missing baselines count as zero
    const int64_t comparison_ms = comparison.get(method).value_or(0);
    const int64_t gold_ms = segment.best_segment_time.get(method).value_or(0);

    int64_t previous_comparison_ms = 0;
    int64_t previous_split_ms = 0;
    if (index > 0) {
        const Segment& previous = segments[index - 1];
        previous_comparison_ms = previous.comparison(comparison_name).get(method).value_or(0);
        previous_split_ms = previous.split_time.get(method).value_or(0);
    }

    // A later split can be shorter than the previous one when comparisons
    // were recorded with skipped segments
    int64_t segment_comparison_ms = comparison_ms - previous_comparison_ms;
    if (segment_comparison_ms < 0) {
        segment_comparison_ms = -segment_comparison_ms;
    }

    const bool in_progress = timer.current_phase() == TimerPhase::Running ||
                             timer.current_phase() == TimerPhase::Paused;

    if (index == *current_index && in_progress) {
        row.is_current = true;

        const int64_t current_ms = current_timer_duration(timer, method);
        const int64_t diff_ms = current_ms - comparison_ms;
        const int64_t running_ms = saturating_sub(current_ms, previous_split_ms);

        // Only show the live delta once it says something: behind, or past
        // the point where a gold is still possible
        if (diff_ms > 0 || (gold_ms != 0 && running_ms >= gold_ms)) {
            row.value = format_delta(diff_ms, config.format.segment);
            row.split_class = classify_split(segment_comparison_ms, running_ms, diff_ms, gold_ms, true);
        }
    } else if (index < *current_index) {
        const std::optional<int64_t> split_ms = segment.split_time.get(method);
        if (!split_ms) {
            // Skipped
            row.value = kNoDurationText;
            return row;
        }

        const int64_t diff_ms = *split_ms - comparison_ms;
        if (config.general.split_format == SplitFormat::Time) {
            row.value = format_split_time(segment.split_time, timer, config);
        } else {
            row.value = format_delta(diff_ms, config.format.segment);
        }

        row.split_class = classify_split(segment_comparison_ms,
                                         saturating_sub(*split_ms, previous_split_ms),
                                         diff_ms,
                                         gold_ms,
                                         false);
    }

    return row;
}

std::vector<SplitRow> compute_split_rows(const ITimerSource& timer, Config& config) {
    std::vector<SplitRow> rows;
    const size_t count = timer.run().segments.size();
    rows.reserve(count);

    for (size_t i = 0; i < count; i++) {
        rows.push_back(compute_split_row(timer, config, i));
    }

    return rows;
}

} // namespace splitline

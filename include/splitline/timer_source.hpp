#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace splitline {

// Which clock a time value comes from
enum class TimingMethod {
    RealTime,
    GameTime
};

enum class TimerPhase {
    NotRunning,
    Running,
    Paused,
    Ended
};

constexpr const char* kPersonalBestComparison = "Personal Best";
constexpr const char* kBestSegmentsComparison = "Best Segments";

// A time recorded for both clocks. Either may be missing.
struct Time {
    std::optional<int64_t> real_time_ms;
    std::optional<int64_t> game_time_ms;

    std::optional<int64_t> get(TimingMethod method) const {
        return method == TimingMethod::GameTime ? game_time_ms : real_time_ms;
    }
};

// One timed section of a run
struct Segment {
    std::string name;
    std::map<std::string, Time> comparisons;  // Cumulative, keyed by comparison name
    Time best_segment_time;                    // Gold (segment duration, not cumulative)
    Time split_time;                           // Cumulative time for the current attempt

    Time comparison(const std::string& comparison_name) const {
        auto it = comparisons.find(comparison_name);
        return it != comparisons.end() ? it->second : Time{};
    }
};

struct Run {
    std::string game_name;
    std::string category_name;
    int64_t offset_ms = 0;  // Negative offsets count up to zero
    std::vector<Segment> segments;
};

// Read-only view of a running timer, as consumed by the display code
class ITimerSource {
public:
    virtual ~ITimerSource() = default;

    // Run data
    virtual const Run& run() const = 0;

    // Timer state
    virtual TimerPhase current_phase() const = 0;
    virtual std::optional<size_t> current_split_index() const = 0;
    virtual const std::string& current_comparison() const = 0;
    virtual TimingMethod current_timing_method() const = 0;

    // Durations, all in milliseconds
    virtual int64_t current_attempt_duration_ms() const = 0;  // Real time since start
    virtual int64_t pause_time_ms() const = 0;
    virtual int64_t loading_times_ms() const = 0;
};

} // namespace splitline

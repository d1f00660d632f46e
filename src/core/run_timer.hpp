#pragma once

#include "splitline/timer_source.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace splitline {

// Run timer - handles the clock, splits and comparisons of one run
class RunTimer : public ITimerSource {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit RunTimer(Run run, Clock clock = nullptr);
    ~RunTimer() override;

    // Replace the run; resets the timer without keeping the attempt
    void set_run(Run run);

    // ITimerSource interface
    const Run& run() const override { return m_run; }
    TimerPhase current_phase() const override { return m_phase; }
    std::optional<size_t> current_split_index() const override;
    const std::string& current_comparison() const override { return m_current_comparison; }
    TimingMethod current_timing_method() const override { return m_timing_method; }
    int64_t current_attempt_duration_ms() const override;
    int64_t pause_time_ms() const override;
    int64_t loading_times_ms() const override;

    // Timer control
    void start();
    void split();
    void split_or_start();
    void skip_split();
    void undo_split();
    void pause();
    void resume();
    void toggle_pause();
    void reset(bool update_splits);

    // Game time: time spent loading is removed from game time
    void set_game_time_paused(bool paused);
    bool is_game_time_paused() const { return m_game_time_paused; }

    // Comparisons
    const std::vector<std::string>& get_comparisons() const { return m_comparisons; }
    void set_current_comparison(const std::string& name);
    void next_comparison();
    void previous_comparison();

    // Timing method
    void set_timing_method(TimingMethod method) { m_timing_method = method; }
    void toggle_timing_method();

    // Sum of golds, 0 when any segment has no gold yet
    int64_t get_sum_of_best_ms(TimingMethod method) const;

    // Callbacks for GUI updates
    using SplitCallback = std::function<void(size_t split_index)>;
    void set_on_split(SplitCallback callback) { m_on_split = std::move(callback); }

private:
    std::chrono::steady_clock::time_point now() const;
    int64_t elapsed_since(std::chrono::steady_clock::time_point start) const;
    int64_t current_real_time_ms() const;
    int64_t current_game_time_ms() const;

    void clear_attempt();
    void update_best_segments();
    void update_personal_best();
    void regenerate_best_segments();

    Run m_run;
    Clock m_clock;

    // Timer state
    TimerPhase m_phase = TimerPhase::NotRunning;
    size_t m_current_split = 0;
    std::chrono::steady_clock::time_point m_start_time;
    std::chrono::steady_clock::time_point m_pause_start;
    int64_t m_accumulated_pause_ms = 0;
    int64_t m_final_attempt_ms = 0;  // Attempt duration frozen when the run ends

    // Loading times
    bool m_game_time_paused = false;
    std::chrono::steady_clock::time_point m_loading_start;
    int64_t m_accumulated_loading_ms = 0;

    // Comparisons
    std::vector<std::string> m_comparisons;
    std::string m_current_comparison = kPersonalBestComparison;
    TimingMethod m_timing_method = TimingMethod::RealTime;

    // Callbacks
    SplitCallback m_on_split;
};

} // namespace splitline

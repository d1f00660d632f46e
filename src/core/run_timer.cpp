#include "run_timer.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace splitline {

RunTimer::RunTimer(Run run, Clock clock)
    : m_run(std::move(run))
    , m_clock(std::move(clock)) {
    m_comparisons = {kPersonalBestComparison, kBestSegmentsComparison};
    regenerate_best_segments();
}

RunTimer::~RunTimer() = default;

void RunTimer::set_run(Run run) {
    m_run = std::move(run);
    clear_attempt();
    regenerate_best_segments();
}

std::chrono::steady_clock::time_point RunTimer::now() const {
    if (m_clock) {
        return m_clock();
    }
    return std::chrono::steady_clock::now();
}

int64_t RunTimer::elapsed_since(std::chrono::steady_clock::time_point start) const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(now() - start).count();
}

std::optional<size_t> RunTimer::current_split_index() const {
    if (m_phase == TimerPhase::NotRunning) {
        return std::nullopt;
    }
    return m_current_split;
}

int64_t RunTimer::current_attempt_duration_ms() const {
    switch (m_phase) {
        case TimerPhase::Running:
        case TimerPhase::Paused:
            return elapsed_since(m_start_time);
        case TimerPhase::Ended:
            return m_final_attempt_ms;
        case TimerPhase::NotRunning:
            break;
    }
    return 0;
}

int64_t RunTimer::pause_time_ms() const {
    if (m_phase == TimerPhase::Paused) {
        return m_accumulated_pause_ms + elapsed_since(m_pause_start);
    }
    return m_accumulated_pause_ms;
}

int64_t RunTimer::loading_times_ms() const {
    if (m_game_time_paused && m_phase == TimerPhase::Running) {
        return m_accumulated_loading_ms + elapsed_since(m_loading_start);
    }
    return m_accumulated_loading_ms;
}

int64_t RunTimer::current_real_time_ms() const {
    return current_attempt_duration_ms() + m_run.offset_ms - pause_time_ms();
}

int64_t RunTimer::current_game_time_ms() const {
    return current_real_time_ms() - loading_times_ms();
}

void RunTimer::start() {
    if (m_phase != TimerPhase::NotRunning || m_run.segments.empty()) {
        return;
    }

    clear_attempt();
    m_phase = TimerPhase::Running;
    m_start_time = now();
    if (m_game_time_paused) {
        m_loading_start = m_start_time;
    }
}

void RunTimer::split() {
    if (m_phase != TimerPhase::Running || m_current_split >= m_run.segments.size()) {
        return;
    }

    // Don't allow splits before the timer reaches zero
    const int64_t real_time = current_real_time_ms();
    if (real_time < 0) {
        return;
    }

    Segment& segment = m_run.segments[m_current_split];
    segment.split_time.real_time_ms = real_time;
    segment.split_time.game_time_ms = current_game_time_ms();

    const size_t split_index = m_current_split;
    m_current_split++;

    // Check if run is complete
    if (m_current_split >= m_run.segments.size()) {
        m_final_attempt_ms = current_attempt_duration_ms();
        m_accumulated_loading_ms = loading_times_ms();
        m_game_time_paused = false;
        m_phase = TimerPhase::Ended;
        std::cout << "Run finished: " << real_time << "ms" << std::endl;
    }

    if (m_on_split) {
        m_on_split(split_index);
    }
}

void RunTimer::split_or_start() {
    if (m_phase == TimerPhase::NotRunning) {
        start();
    } else {
        split();
    }
}

void RunTimer::skip_split() {
    if ((m_phase != TimerPhase::Running && m_phase != TimerPhase::Paused) ||
        m_current_split + 1 >= m_run.segments.size()) {
        return;
    }

    m_run.segments[m_current_split].split_time = Time{};
    m_current_split++;
}

void RunTimer::undo_split() {
    if (m_phase == TimerPhase::NotRunning || m_current_split == 0) {
        return;
    }

    if (m_phase == TimerPhase::Ended) {
        m_phase = TimerPhase::Running;
    }

    m_current_split--;
    m_run.segments[m_current_split].split_time = Time{};
}

void RunTimer::pause() {
    if (m_phase != TimerPhase::Running) {
        return;
    }

    // Loading time stops while paused, pause time covers it
    if (m_game_time_paused) {
        m_accumulated_loading_ms += elapsed_since(m_loading_start);
    }
    m_pause_start = now();
    m_phase = TimerPhase::Paused;
}

void RunTimer::resume() {
    if (m_phase != TimerPhase::Paused) {
        return;
    }

    m_accumulated_pause_ms += elapsed_since(m_pause_start);
    if (m_game_time_paused) {
        m_loading_start = now();
    }
    m_phase = TimerPhase::Running;
}

void RunTimer::toggle_pause() {
    if (m_phase == TimerPhase::Paused) {
        resume();
    } else {
        pause();
    }
}

void RunTimer::reset(bool update_splits) {
    if (m_phase == TimerPhase::NotRunning) {
        return;
    }

    if (update_splits) {
        update_best_segments();
        if (m_phase == TimerPhase::Ended) {
            update_personal_best();
        }
        regenerate_best_segments();
    }

    clear_attempt();
}

void RunTimer::set_game_time_paused(bool paused) {
    if (paused == m_game_time_paused) {
        return;
    }

    if (m_phase == TimerPhase::Running) {
        if (paused) {
            m_loading_start = now();
        } else {
            m_accumulated_loading_ms += elapsed_since(m_loading_start);
        }
    } else if (paused) {
        // Counted from the moment the timer runs again
        m_loading_start = now();
    }
    m_game_time_paused = paused;
}

void RunTimer::set_current_comparison(const std::string& name) {
    auto it = std::find(m_comparisons.begin(), m_comparisons.end(), name);
    if (it == m_comparisons.end()) {
        std::cerr << "Unknown comparison: " << name << std::endl;
        return;
    }
    m_current_comparison = name;
}

void RunTimer::next_comparison() {
    auto it = std::find(m_comparisons.begin(), m_comparisons.end(), m_current_comparison);
    if (it == m_comparisons.end() || ++it == m_comparisons.end()) {
        it = m_comparisons.begin();
    }
    m_current_comparison = *it;
}

void RunTimer::previous_comparison() {
    auto it = std::find(m_comparisons.begin(), m_comparisons.end(), m_current_comparison);
    if (it == m_comparisons.end() || it == m_comparisons.begin()) {
        it = m_comparisons.end();
    }
    m_current_comparison = *(--it);
}

void RunTimer::toggle_timing_method() {
    m_timing_method = m_timing_method == TimingMethod::RealTime
        ? TimingMethod::GameTime
        : TimingMethod::RealTime;
}

int64_t RunTimer::get_sum_of_best_ms(TimingMethod method) const {
    int64_t sum = 0;
    for (const auto& segment : m_run.segments) {
        std::optional<int64_t> gold = segment.best_segment_time.get(method);
        if (!gold) {
            return 0;
        }
        sum += *gold;
    }
    return sum;
}

void RunTimer::clear_attempt() {
    m_phase = TimerPhase::NotRunning;
    m_current_split = 0;
    m_accumulated_pause_ms = 0;
    m_final_attempt_ms = 0;
    m_accumulated_loading_ms = 0;

    for (auto& segment : m_run.segments) {
        segment.split_time = Time{};
    }
}

void RunTimer::update_best_segments() {
    static const TimingMethod kMethods[] = {TimingMethod::RealTime, TimingMethod::GameTime};

    for (TimingMethod method : kMethods) {
        std::optional<int64_t> previous_split = int64_t{0};

        for (auto& segment : m_run.segments) {
            std::optional<int64_t> split = segment.split_time.get(method);

            // A segment after a skipped one has no duration of its own
            if (split && previous_split) {
                const int64_t duration = *split - *previous_split;
                std::optional<int64_t>& gold = method == TimingMethod::GameTime
                    ? segment.best_segment_time.game_time_ms
                    : segment.best_segment_time.real_time_ms;
                if (!gold || duration < *gold) {
                    gold = duration;
                }
            }
            previous_split = split;
        }
    }
}

void RunTimer::update_personal_best() {
    if (m_run.segments.empty()) return;

    const Time& final_time = m_run.segments.back().split_time;
    const Time pb = m_run.segments.back().comparison(kPersonalBestComparison);

    const TimingMethod method = m_timing_method;
    std::optional<int64_t> final_ms = final_time.get(method);
    std::optional<int64_t> pb_ms = pb.get(method);
    if (!final_ms || (pb_ms && *pb_ms <= *final_ms)) {
        return;
    }

    for (auto& segment : m_run.segments) {
        segment.comparisons[kPersonalBestComparison] = segment.split_time;
    }
    std::cout << "New personal best: " << *final_ms << "ms" << std::endl;
}

void RunTimer::regenerate_best_segments() {
    std::optional<int64_t> real_sum = int64_t{0};
    std::optional<int64_t> game_sum = int64_t{0};

    for (auto& segment : m_run.segments) {
        const Time& gold = segment.best_segment_time;
        real_sum = real_sum && gold.real_time_ms ? std::optional<int64_t>(*real_sum + *gold.real_time_ms) : std::nullopt;
        game_sum = game_sum && gold.game_time_ms ? std::optional<int64_t>(*game_sum + *gold.game_time_ms) : std::nullopt;

        segment.comparisons[kBestSegmentsComparison] = Time{real_sum, game_sum};
    }
}

} // namespace splitline

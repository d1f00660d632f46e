#include "speedrun_panel.hpp"
#include "core/config.hpp"
#include "core/run_timer.hpp"
#include "core/segment_info.hpp"
#include "core/split_rows.hpp"
#include "core/time_display.hpp"

#include <imgui.h>
#include <optional>

namespace splitline {

namespace {

const ImVec4 kDefaultTextColor(0.9f, 0.9f, 0.9f, 1.0f);
const ImVec4 kCurrentRowColor(0.3f, 0.3f, 0.5f, 0.5f);

void text_right_aligned(const std::string& text, const ImVec4& color) {
    float text_width = ImGui::CalcTextSize(text.c_str()).x;
    float avail = ImGui::GetContentRegionAvail().x;
    if (avail > text_width) {
        ImGui::SetCursorPosX(ImGui::GetCursorPosX() + avail - text_width);
    }
    ImGui::PushStyleColor(ImGuiCol_Text, color);
    ImGui::TextUnformatted(text.c_str());
    ImGui::PopStyleColor();
}

} // namespace

ImVec4 get_split_class_color(SplitClass split_class) {
    switch (split_class) {
        case SplitClass::Gold:          return ImVec4(1.0f, 0.84f, 0.0f, 1.0f);
        case SplitClass::AheadGaining:  return ImVec4(0.2f, 0.8f, 0.2f, 1.0f);
        case SplitClass::AheadLosing:   return ImVec4(0.55f, 0.8f, 0.55f, 1.0f);
        case SplitClass::BehindGaining: return ImVec4(0.8f, 0.55f, 0.55f, 1.0f);
        case SplitClass::BehindLosing:  return ImVec4(0.8f, 0.2f, 0.2f, 1.0f);
        case SplitClass::None:          break;
    }
    return kDefaultTextColor;
}

SpeedrunPanel::SpeedrunPanel(ImFont* timer_font)
    : m_timer_font(timer_font) {}

SpeedrunPanel::~SpeedrunPanel() = default;

void SpeedrunPanel::render(RunTimer& timer, Config& config) {
    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);

    ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove |
                             ImGuiWindowFlags_NoSavedSettings;

    if (ImGui::Begin("Splitline", nullptr, flags)) {
        render_run_info(timer);
        ImGui::Separator();
        render_splits(timer, config);
        ImGui::Separator();
        render_segment_info(timer, config);
        render_timer(timer, config);
        ImGui::Separator();
        render_controls(timer);
    }
    ImGui::End();
}

void SpeedrunPanel::render_run_info(RunTimer& timer) {
    const Run& run = timer.run();
    if (!run.game_name.empty()) {
        ImGui::TextUnformatted(run.game_name.c_str());
    }
    if (!run.category_name.empty()) {
        ImGui::TextDisabled("%s", run.category_name.c_str());
    }
    ImGui::TextDisabled("Comparing against %s", timer.current_comparison().c_str());
}

void SpeedrunPanel::render_splits(RunTimer& timer, Config& config) {
    const std::vector<SplitRow> rows = compute_split_rows(timer, config);

    if (rows.empty()) {
        ImGui::TextDisabled("No splits loaded");
        return;
    }

    if (ImGui::BeginTable("Splits", 2, ImGuiTableFlags_RowBg)) {
        ImGui::TableSetupColumn("Split", ImGuiTableColumnFlags_WidthStretch);
        ImGui::TableSetupColumn("Time", ImGuiTableColumnFlags_WidthFixed, 90);

        for (const auto& row : rows) {
            ImGui::TableNextRow();

            if (row.is_current) {
                ImGui::TableSetBgColor(ImGuiTableBgTarget_RowBg0, ImGui::GetColorU32(kCurrentRowColor));
            }

            ImGui::TableNextColumn();
            ImGui::TextUnformatted(row.name.c_str());

            ImGui::TableNextColumn();
            text_right_aligned(row.value, get_split_class_color(row.split_class));
        }

        ImGui::EndTable();
    }
}

void SpeedrunPanel::render_segment_info(RunTimer& timer, Config& config) {
    const InfoBaseline baselines[] = {InfoBaseline::Comparison, InfoBaseline::BestSegment};

    for (InfoBaseline baseline : baselines) {
        SegmentInfo info = compute_previous_segment_info(timer, config, baseline);
        ImGui::TextUnformatted(info.label.c_str());
        ImGui::SameLine();
        text_right_aligned(info.value, get_split_class_color(info.split_class));
    }

    CurrentSegmentInfo current = compute_current_segment_info(timer, config);
    ImGui::TextDisabled("Best: %s", current.best.c_str());
    ImGui::TextDisabled("%s: %s", timer.current_comparison().c_str(), current.comparison.c_str());

    // Sum of best is 0 until every segment has a gold
    const int64_t sum_of_best = timer.get_sum_of_best_ms(display_timing_method(timer, config));
    ImGui::TextDisabled("SoB: %s", format_segment_time(
        sum_of_best > 0 ? std::optional<int64_t>(sum_of_best) : std::nullopt, config).c_str());
}

void SpeedrunPanel::render_timer(RunTimer& timer, Config& config) {
    const auto [large, small] = split_timer_readout(format_timer(timer, config));

    ImVec4 timer_color = timer.current_phase() == TimerPhase::Running ?
        ImVec4(0.2f, 0.8f, 0.2f, 1.0f) :   // Green when running
        ImVec4(0.8f, 0.8f, 0.8f, 1.0f);    // Grey otherwise

    ImGui::PushStyleColor(ImGuiCol_Text, timer_color);

    // Large part in the timer font, fraction in the default one
    if (m_timer_font) {
        ImGui::PushFont(m_timer_font);
    }
    float large_width = ImGui::CalcTextSize(large.c_str()).x;
    if (m_timer_font) {
        ImGui::PopFont();
    }
    float small_width = ImGui::CalcTextSize(small.c_str()).x;
    float window_width = ImGui::GetContentRegionAvail().x;
    ImGui::SetCursorPosX(ImGui::GetCursorPosX() + window_width - large_width - small_width);

    if (m_timer_font) {
        ImGui::PushFont(m_timer_font);
    }
    ImGui::TextUnformatted(large.c_str());
    if (m_timer_font) {
        ImGui::PopFont();
    }
    if (!small.empty()) {
        ImGui::SameLine(0.0f, 0.0f);
        ImGui::TextUnformatted(small.c_str());
    }

    ImGui::PopStyleColor();
}

void SpeedrunPanel::render_controls(RunTimer& timer) {
    float button_width = 60;

    const char* split_label = timer.current_phase() == TimerPhase::NotRunning ? "Start" : "Split";
    if (ImGui::Button(split_label, ImVec2(button_width, 0))) {
        timer.split_or_start();
    }

    ImGui::SameLine();
    if (ImGui::Button("Undo", ImVec2(button_width, 0))) {
        timer.undo_split();
    }

    ImGui::SameLine();
    if (ImGui::Button("Skip", ImVec2(button_width, 0))) {
        timer.skip_split();
    }

    ImGui::SameLine();
    if (ImGui::Button("Reset", ImVec2(button_width, 0))) {
        timer.reset(true);
    }

    const char* pause_label = timer.current_phase() == TimerPhase::Paused ? "Resume" : "Pause";
    if (ImGui::Button(pause_label, ImVec2(button_width, 0))) {
        timer.toggle_pause();
    }

    ImGui::SameLine();
    if (ImGui::Button("<", ImVec2(28, 0))) {
        timer.previous_comparison();
    }
    ImGui::SameLine(0.0f, 4.0f);
    if (ImGui::Button(">", ImVec2(28, 0))) {
        timer.next_comparison();
    }

    ImGui::SameLine();
    const char* loading_label = timer.is_game_time_paused() ? "Loaded" : "Loading";
    if (ImGui::Button(loading_label, ImVec2(button_width, 0))) {
        timer.set_game_time_paused(!timer.is_game_time_paused());
    }

    const char* method_label = timer.current_timing_method() == TimingMethod::GameTime ? "Game Time" : "Real Time";
    if (ImGui::Button(method_label)) {
        timer.toggle_timing_method();
    }
}

} // namespace splitline

#pragma once

#include "splitline/split_class.hpp"

#include <string>

struct ImFont;
struct ImVec4;

namespace splitline {

class Config;
class RunTimer;

// Timer window contents: run info, splits, segment info, timer and controls
class SpeedrunPanel {
public:
    // timer_font is used for the large part of the timer readout, may be null
    explicit SpeedrunPanel(ImFont* timer_font);
    ~SpeedrunPanel();

    // Render the panel, filling the whole window
    void render(RunTimer& timer, Config& config);

private:
    void render_run_info(RunTimer& timer);
    void render_splits(RunTimer& timer, Config& config);
    void render_segment_info(RunTimer& timer, Config& config);
    void render_timer(RunTimer& timer, Config& config);
    void render_controls(RunTimer& timer);

    ImFont* m_timer_font = nullptr;
};

// Text colour for a classified split
ImVec4 get_split_class_color(SplitClass split_class);

} // namespace splitline

#include <gtest/gtest.h>
#include "core/config.hpp"
#include "core/time_display.hpp"
#include "fake_timer.hpp"

using namespace splitline;
using splitline::testing::FakeTimer;

TEST(TimeDisplay, SignedDurationPrefixesMinus) {
    EXPECT_EQ(format_signed_duration(-61'230, "m:s.dd"), "-1:01.23");
    EXPECT_EQ(format_signed_duration(61'230, "m:s.dd"), "1:01.23");
    EXPECT_EQ(format_signed_duration(0, "s.dd"), "0.00");
}

TEST(TimeDisplay, OptionalDurationSentinel) {
    EXPECT_EQ(format_optional_duration(std::nullopt, "h:m:s.dd"), "--");
    EXPECT_EQ(format_optional_duration(10'000, "m:s"), "10");
}

TEST(TimeDisplay, DeltaSigns) {
    FormatSpec spec;
    EXPECT_EQ(format_delta(1'500, spec), "+1.50");
    EXPECT_EQ(format_delta(-250, spec), "-0.25");
    EXPECT_EQ(format_delta(0, spec), "~0.00");
    EXPECT_EQ(format_delta(-61'230, spec), "-1:01.23");
}

TEST(TimeDisplay, DeltaUsesDynamicPattern) {
    FormatSpec spec;
    spec.set_dynamic(true);
    EXPECT_EQ(format_delta(-61'230, spec), "-1:01");
    EXPECT_EQ(format_delta(2'340, spec), "+2.34");
}

TEST(TimeDisplay, SaturatingSub) {
    EXPECT_EQ(saturating_sub(5'000, 2'000), 3'000);
    EXPECT_EQ(saturating_sub(2'000, 5'000), 0);
    EXPECT_EQ(saturating_sub(2'000, 2'000), 0);
}

TEST(TimeDisplay, SplitTimeUsesRealTimeByDefault) {
    FakeTimer timer;
    Config config;
    Time time{125'340, 120'000};
    EXPECT_EQ(format_split_time(time, timer, config), "2:05.34");
}

TEST(TimeDisplay, SplitTimeUsesGameTimeFromTimer) {
    FakeTimer timer;
    timer.timing_method = TimingMethod::GameTime;
    Config config;
    Time time{125'340, 120'000};
    EXPECT_EQ(format_split_time(time, timer, config), "2:00.00");
}

TEST(TimeDisplay, SplitTimeUsesGameTimeFromConfig) {
    FakeTimer timer;
    Config config;
    config.general.use_game_time = true;
    Time time{125'340, std::nullopt};
    EXPECT_EQ(format_split_time(time, timer, config), "--");
}

TEST(TimeDisplay, SegmentTimeSentinel) {
    Config config;
    EXPECT_EQ(format_segment_time(std::nullopt, config), "--");
    EXPECT_EQ(format_segment_time(std::optional<int64_t>(3'145), config), "3.14");
}

TEST(TimeDisplay, TimerDurationAppliesOffsetPauseAndLoading) {
    FakeTimer timer;
    timer.run_data.offset_ms = 1'000;
    timer.attempt_ms = 10'000;
    timer.pause_ms = 2'000;
    timer.loading_ms = 3'000;

    EXPECT_EQ(current_timer_duration(timer, TimingMethod::RealTime), 9'000);
    EXPECT_EQ(current_timer_duration(timer, TimingMethod::GameTime), 6'000);
}

TEST(TimeDisplay, TimerFollowsGameTimeForcedByConfig) {
    FakeTimer timer;
    timer.attempt_ms = 11'000;
    timer.loading_ms = 2'000;

    Config config;
    EXPECT_EQ(format_timer(timer, config), "11.00");

    config.general.use_game_time = true;
    EXPECT_EQ(format_timer(timer, config), "9.00");
}

TEST(TimeDisplay, TimerCountsUpFromNegativeOffset) {
    FakeTimer timer;
    timer.run_data.offset_ms = -5'000;
    timer.attempt_ms = 1'500;

    Config config;
    EXPECT_EQ(format_timer(timer, config), "-3.50");
}

TEST(TimeDisplay, TimerUsesTimerFormat) {
    FakeTimer timer;
    timer.attempt_ms = 3'845'999;

    Config config;
    EXPECT_EQ(format_timer(timer, config), "1:04:05.99");

    config.format.timer.set_dynamic(true);
    EXPECT_EQ(format_timer(timer, config), "1:04:05");
}

TEST(TimeDisplay, TimerReadoutSplitsAtLastDot) {
    auto [large, small] = split_timer_readout("1:02.34");
    EXPECT_EQ(large, "1:02.");
    EXPECT_EQ(small, "34");

    auto [whole, fraction] = split_timer_readout("1:02:03");
    EXPECT_EQ(whole, "1:02:03");
    EXPECT_EQ(fraction, "");
}

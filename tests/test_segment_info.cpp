#include <gtest/gtest.h>
#include "core/config.hpp"
#include "core/segment_info.hpp"
#include "fake_timer.hpp"

using namespace splitline;
using splitline::testing::FakeTimer;

namespace {

FakeTimer make_timer() {
    FakeTimer timer;
    timer.add_segment("Forest", 10'000, 9'000);
    timer.add_segment("Castle", 25'000, 14'000);
    timer.add_segment("Tower", 40'000, 14'000);
    return timer;
}

} // namespace

TEST(SegmentInfo, PreviousSegmentEmptyBeforeFirstSplit) {
    FakeTimer timer = make_timer();
    Config config;

    SegmentInfo info = compute_previous_segment_info(timer, config, InfoBaseline::Comparison);
    EXPECT_EQ(info.label, "Previous Segment:");
    EXPECT_TRUE(info.value.empty());
    EXPECT_EQ(info.split_class, SplitClass::None);

    timer.run_at(0, 5'000);
    info = compute_previous_segment_info(timer, config, InfoBaseline::Comparison);
    EXPECT_TRUE(info.value.empty());
}

TEST(SegmentInfo, PreviousSegmentAgainstComparison) {
    FakeTimer timer = make_timer();
    timer.set_split(0, 9'500);
    timer.run_at(1, 12'000);
    Config config;

    SegmentInfo info = compute_previous_segment_info(timer, config, InfoBaseline::Comparison);
    EXPECT_EQ(info.value, "-0.50");
    EXPECT_EQ(info.split_class, SplitClass::AheadGaining);
}

TEST(SegmentInfo, PreviousSegmentAgainstGold) {
    FakeTimer timer = make_timer();
    timer.set_split(0, 9'500);
    timer.run_at(1, 12'000);
    Config config;

    SegmentInfo info = compute_previous_segment_info(timer, config, InfoBaseline::BestSegment);
    EXPECT_EQ(info.label, "Previous Segment (Best):");
    EXPECT_EQ(info.value, "+0.50");
    EXPECT_EQ(info.split_class, SplitClass::BehindLosing);
}

TEST(SegmentInfo, PreviousSegmentUsesSegmentDurations) {
    FakeTimer timer = make_timer();
    timer.set_split(0, 9'500);
    timer.set_split(1, 24'000);
    timer.run_at(2, 30'000);
    Config config;

    SegmentInfo info = compute_previous_segment_info(timer, config, InfoBaseline::Comparison);
    EXPECT_EQ(info.value, "-0.50");
    EXPECT_EQ(info.split_class, SplitClass::AheadGaining);
}

TEST(SegmentInfo, PreviousSegmentSkippedShowsNothing) {
    FakeTimer timer = make_timer();
    timer.set_split(0, 9'500);
    timer.run_at(2, 30'000);
    Config config;

    SegmentInfo info = compute_previous_segment_info(timer, config, InfoBaseline::Comparison);
    EXPECT_TRUE(info.value.empty());
}

TEST(SegmentInfo, PreviousSegmentWithoutGoldShowsNothingAgainstGold) {
    FakeTimer timer;
    timer.add_segment("Forest", 10'000, std::nullopt);
    timer.add_segment("Castle", 25'000, std::nullopt);
    timer.set_split(0, 9'500);
    timer.run_at(1, 12'000);
    Config config;

    SegmentInfo info = compute_previous_segment_info(timer, config, InfoBaseline::BestSegment);
    EXPECT_TRUE(info.value.empty());
}

TEST(SegmentInfo, CurrentSegmentBeforeStartIsFirst) {
    FakeTimer timer = make_timer();
    Config config;

    CurrentSegmentInfo info = compute_current_segment_info(timer, config);
    EXPECT_EQ(info.name, "Forest");
    EXPECT_EQ(info.best, "9.00");
    EXPECT_EQ(info.comparison, "10.00");
}

TEST(SegmentInfo, CurrentSegmentComparisonIsSegmentDuration) {
    FakeTimer timer = make_timer();
    timer.set_split(0, 9'500);
    timer.run_at(1, 12'000);
    Config config;

    CurrentSegmentInfo info = compute_current_segment_info(timer, config);
    EXPECT_EQ(info.name, "Castle");
    EXPECT_EQ(info.best, "14.00");
    EXPECT_EQ(info.comparison, "15.00");
}

TEST(SegmentInfo, CurrentSegmentAfterEndIsLast) {
    FakeTimer timer = make_timer();
    timer.phase = TimerPhase::Ended;
    timer.split_index = 3;
    Config config;

    EXPECT_EQ(compute_current_segment_info(timer, config).name, "Tower");
}

TEST(SegmentInfo, CurrentSegmentMissingValues) {
    FakeTimer timer;
    timer.add_segment("Forest", std::nullopt, std::nullopt);
    Config config;

    CurrentSegmentInfo info = compute_current_segment_info(timer, config);
    EXPECT_EQ(info.best, "--");
    EXPECT_EQ(info.comparison, "--");
}

TEST(SegmentInfo, CurrentSegmentEmptyRun) {
    FakeTimer timer;
    Config config;

    CurrentSegmentInfo info = compute_current_segment_info(timer, config);
    EXPECT_TRUE(info.name.empty());
    EXPECT_EQ(info.best, "--");
    EXPECT_EQ(info.comparison, "--");
}

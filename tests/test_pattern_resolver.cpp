#include <gtest/gtest.h>
#include "core/pattern_resolver.hpp"

using namespace splitline;

namespace {

FormatSpec make_spec(bool hours, bool minutes, bool seconds, bool decimals,
                     uint8_t places, bool dynamic) {
    FormatSpec spec;
    spec.set_show_hours(hours);
    spec.set_show_minutes(minutes);
    spec.set_show_seconds(seconds);
    spec.set_show_decimals(decimals);
    spec.set_decimal_places(places);
    spec.set_dynamic(dynamic);
    return spec;
}

} // namespace

TEST(PatternResolver, DefaultSpecIsFullPattern) {
    FormatSpec spec;
    EXPECT_EQ(compute_pattern(spec, std::nullopt), "h:m:s.dd");
}

TEST(PatternResolver, StaticIgnoresMagnitude) {
    FormatSpec spec = make_spec(true, true, true, true, 2, false);
    EXPECT_EQ(compute_pattern(spec, std::nullopt), "h:m:s.dd");
    EXPECT_EQ(compute_pattern(spec, 500), "h:m:s.dd");
    EXPECT_EQ(compute_pattern(spec, 65'000), "h:m:s.dd");
    EXPECT_EQ(compute_pattern(spec, 3'700'000), "h:m:s.dd");
}

TEST(PatternResolver, StaticMinutesSecondsWithoutDecimals) {
    FormatSpec spec = make_spec(false, true, true, false, 3, false);
    EXPECT_EQ(compute_pattern(spec, std::nullopt), "m:s");
    EXPECT_EQ(compute_pattern(spec, 59'999), "m:s");
}

TEST(PatternResolver, DynamicUnderMinuteKeepsDecimals) {
    FormatSpec spec = make_spec(false, true, true, true, 2, true);
    EXPECT_EQ(resolve_pattern(spec, 59'500), "s.dd");
}

TEST(PatternResolver, DynamicUnderHourDropsDecimals) {
    FormatSpec spec = make_spec(false, true, true, true, 3, true);
    EXPECT_EQ(resolve_pattern(spec, 60'000), "m:s");
    EXPECT_EQ(resolve_pattern(spec, 3'599'999), "m:s");
}

TEST(PatternResolver, DynamicHourPlusKeepsHours) {
    FormatSpec spec = make_spec(true, true, true, true, 2, true);
    EXPECT_EQ(resolve_pattern(spec, 3'600'000), "h:m:s");
    EXPECT_EQ(resolve_pattern(spec, 3'700'000), "h:m:s");
}

TEST(PatternResolver, DynamicFollowsEachCall) {
    FormatSpec spec = make_spec(true, true, true, true, 2, true);
    EXPECT_EQ(resolve_pattern(spec, 12'000), "s.dd");
    EXPECT_EQ(resolve_pattern(spec, 125'000), "m:s");
    EXPECT_EQ(resolve_pattern(spec, 12'000), "s.dd");
    EXPECT_FALSE(spec.cached_pattern().has_value());
}

TEST(PatternResolver, DynamicWithoutDurationUsesFlags) {
    FormatSpec spec = make_spec(true, true, true, true, 2, true);
    EXPECT_EQ(resolve_pattern(spec, std::nullopt), "h:m:s.dd");
}

TEST(PatternResolver, DynamicNegativeDurationBucketedByMagnitude) {
    FormatSpec spec = make_spec(false, true, true, true, 2, true);
    EXPECT_EQ(resolve_pattern(spec, -5'000), "s.dd");
    EXPECT_EQ(resolve_pattern(spec, -90'000), "m:s");
}

TEST(PatternResolver, DynamicKeepsDecimalsWithoutSeconds) {
    // Decimal suppression only applies when minutes and seconds are both shown
    FormatSpec spec = make_spec(false, true, false, true, 2, true);
    EXPECT_EQ(resolve_pattern(spec, 90'000), "m.dd");
}

TEST(PatternResolver, DecimalPlacesWidth) {
    FormatSpec spec = make_spec(false, false, true, true, 4, false);
    EXPECT_EQ(compute_pattern(spec, std::nullopt), "s.dddd");
}

TEST(PatternResolver, ZeroDecimalPlacesOmitsDecimals) {
    FormatSpec spec = make_spec(false, true, true, true, 0, false);
    EXPECT_EQ(compute_pattern(spec, std::nullopt), "m:s");
}

TEST(PatternResolver, DecimalPlacesClamped) {
    FormatSpec spec;
    spec.set_decimal_places(42);
    EXPECT_EQ(spec.decimal_places(), kMaxDecimalPlaces);
}

TEST(PatternResolver, NoLeadingSeparator) {
    FormatSpec spec = make_spec(false, false, true, false, 2, false);
    EXPECT_EQ(compute_pattern(spec, std::nullopt), "s");
}

TEST(PatternResolver, FallbackToSecondsWhenAllHidden) {
    FormatSpec spec = make_spec(false, false, false, false, 0, false);
    EXPECT_EQ(resolve_pattern(spec, std::nullopt), "s");
}

TEST(PatternResolver, FallbackWhenEverythingHiddenByBucket) {
    // Hours only, under a minute: nothing is left
    FormatSpec spec = make_spec(true, false, false, true, 2, true);
    EXPECT_EQ(resolve_pattern(spec, 30'000), ".dd");

    FormatSpec bare = make_spec(true, false, false, false, 2, true);
    EXPECT_EQ(resolve_pattern(bare, 30'000), "s");
}

TEST(PatternResolver, StaticIsMemoized) {
    FormatSpec spec = make_spec(false, true, true, true, 2, false);
    EXPECT_FALSE(spec.cached_pattern().has_value());

    Pattern first = resolve_pattern(spec, 1'000);
    ASSERT_TRUE(spec.cached_pattern().has_value());
    EXPECT_EQ(*spec.cached_pattern(), first);

    EXPECT_EQ(resolve_pattern(spec, 5'000'000), first);
    EXPECT_EQ(resolve_pattern(spec, std::nullopt), first);
}

TEST(PatternResolver, SetterInvalidatesCache) {
    FormatSpec spec = make_spec(false, true, true, true, 2, false);
    EXPECT_EQ(resolve_pattern(spec, std::nullopt), "m:s.dd");

    spec.set_decimal_places(3);
    EXPECT_FALSE(spec.cached_pattern().has_value());
    EXPECT_EQ(resolve_pattern(spec, std::nullopt), "m:s.ddd");
}

TEST(PatternResolver, Buckets) {
    EXPECT_EQ(bucket_for(0), MagnitudeBucket::UnderMinute);
    EXPECT_EQ(bucket_for(59'999), MagnitudeBucket::UnderMinute);
    EXPECT_EQ(bucket_for(60'000), MagnitudeBucket::UnderHour);
    EXPECT_EQ(bucket_for(3'599'999), MagnitudeBucket::UnderHour);
    EXPECT_EQ(bucket_for(3'600'000), MagnitudeBucket::HourPlus);
    EXPECT_EQ(bucket_for(-3'600'000), MagnitudeBucket::HourPlus);
    EXPECT_EQ(bucket_for(INT64_MIN), MagnitudeBucket::HourPlus);
}

TEST(PatternResolver, VisibleFieldsWithoutBucket) {
    FormatSpec spec = make_spec(true, false, true, false, 2, true);
    VisibleFields fields = resolve_visible_fields(spec, std::nullopt);
    EXPECT_TRUE(fields.hours);
    EXPECT_FALSE(fields.minutes);
    EXPECT_TRUE(fields.seconds);
    EXPECT_FALSE(fields.decimals);
}

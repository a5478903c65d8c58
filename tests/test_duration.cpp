#include "util/duration.hpp"

#include <gtest/gtest.h>

namespace geoupdate {
namespace {

using namespace std::chrono_literals;

TEST(DurationTest, ParsesSingleUnits) {
    EXPECT_EQ(*ParseDuration("90s"), std::chrono::nanoseconds(90s));
    EXPECT_EQ(*ParseDuration("250ms"), std::chrono::nanoseconds(250ms));
    EXPECT_EQ(*ParseDuration("15m"), std::chrono::nanoseconds(15min));
    EXPECT_EQ(*ParseDuration("2h"), std::chrono::nanoseconds(2h));
    EXPECT_EQ(*ParseDuration("7us"), std::chrono::nanoseconds(7us));
    EXPECT_EQ(*ParseDuration("12ns"), std::chrono::nanoseconds(12));
    EXPECT_EQ(*ParseDuration("0"), std::chrono::nanoseconds(0));
}

TEST(DurationTest, ParsesCompoundAndFractions) {
    EXPECT_EQ(*ParseDuration("1h30m"), std::chrono::nanoseconds(90min));
    EXPECT_EQ(*ParseDuration("1.5h"), std::chrono::nanoseconds(90min));
    EXPECT_EQ(*ParseDuration("2m0.5s"), std::chrono::nanoseconds(120500ms));
    EXPECT_EQ(*ParseDuration(".5s"), std::chrono::nanoseconds(500ms));
}

TEST(DurationTest, RejectsInvalid) {
    EXPECT_FALSE(ParseDuration("").has_value());
    EXPECT_FALSE(ParseDuration("10").has_value());
    EXPECT_FALSE(ParseDuration("-5s").has_value());
    EXPECT_FALSE(ParseDuration("5x").has_value());
    EXPECT_FALSE(ParseDuration("h").has_value());
    EXPECT_FALSE(ParseDuration("99999999999999h").has_value());
}

TEST(DurationTest, Formats) {
    EXPECT_EQ(FormatDuration(0ns), "0s");
    EXPECT_EQ(FormatDuration(std::chrono::nanoseconds(300ms)), "300ms");
    EXPECT_EQ(FormatDuration(std::chrono::nanoseconds(2500ms)), "2.5s");
    EXPECT_EQ(FormatDuration(std::chrono::nanoseconds(90min)), "1h30m0s");
    EXPECT_EQ(FormatDuration(std::chrono::nanoseconds(61s)), "1m1s");
}

} // namespace
} // namespace geoupdate

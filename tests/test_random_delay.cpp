#include "system/random_delay.hpp"

#include <gtest/gtest.h>

namespace geoupdate {
namespace {

using namespace std::chrono_literals;

TEST(RandomDelayTest, ZeroOrNegativeMaxYieldsZero) {
    std::chrono::nanoseconds d{5};
    ASSERT_TRUE(RandomDelayBelow(0ns, d).is_ok());
    EXPECT_EQ(d.count(), 0);
    ASSERT_TRUE(RandomDelayBelow(-10ns, d).is_ok());
    EXPECT_EQ(d.count(), 0);
}

TEST(RandomDelayTest, StaysBelowMax) {
    const std::chrono::nanoseconds max = 3ns;
    bool seen[3] = {false, false, false};
    for (int i = 0; i < 500; ++i) {
        std::chrono::nanoseconds d{};
        ASSERT_TRUE(RandomDelayBelow(max, d).is_ok());
        ASSERT_GE(d.count(), 0);
        ASSERT_LT(d, max);
        seen[d.count()] = true;
    }
    EXPECT_TRUE(seen[0] && seen[1] && seen[2]);
}

TEST(RandomDelayTest, SleepUsesInjectedClock) {
    std::chrono::nanoseconds slept{-1};
    auto res = SleepRandomDelay(std::chrono::nanoseconds(10min),
                                [&](std::chrono::nanoseconds d) { slept = d; });
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_GE(slept.count(), 0);
    EXPECT_LT(slept, std::chrono::nanoseconds(10min));
}

} // namespace
} // namespace geoupdate

#include <gtest/gtest.h>
#include "utils/units.hpp"

TEST(units, seconds2human) {
    EXPECT_EQ("0s", seconds2human(0));
    EXPECT_EQ("45s", seconds2human(45));
    EXPECT_EQ("1m0s", seconds2human(60));
    EXPECT_EQ("1m1s", seconds2human(61));
    EXPECT_EQ("3h15m", seconds2human(3 * 3600 + 15 * 60 + 7));
    EXPECT_EQ("1h0m", seconds2human(3600 + 5));
    EXPECT_EQ("2d5h", seconds2human(2 * 86400 + 5 * 3600 + 59));
}

TEST(units, seconds2human_max_units) {
    EXPECT_EQ("3h", seconds2human(3 * 3600 + 15 * 60 + 7, 1));
    EXPECT_EQ("3h15m7s", seconds2human(3 * 3600 + 15 * 60 + 7, 3));
    EXPECT_EQ("1d0h0m1s", seconds2human(86401, 4));
}

TEST(units, elapsed2human) {
    using namespace std::chrono;
    EXPECT_EQ("0.0s", elapsed2human(steady_clock::duration::zero()));
    EXPECT_EQ("3.4s", elapsed2human(milliseconds(3400)));
    EXPECT_EQ("59.9s", elapsed2human(milliseconds(59900)));
    EXPECT_EQ("1m0s", elapsed2human(seconds(60)));
    EXPECT_EQ("2m5s", elapsed2human(seconds(125)));
    EXPECT_EQ("0.0s", elapsed2human(milliseconds(-5)));
}

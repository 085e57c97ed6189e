/**
 * @file test_clock.cpp
 * @brief Unit tests for clocks and midnight_of (GoogleTest)
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>

#include "jsonsql/Clock.hpp"

#include <chrono>

using namespace jsonsql;
using namespace std::chrono;

TEST(Clock, FixedClockIsFrozen) {
    FixedClock clock(TimePoint(seconds(1700000000)));
    EXPECT_EQ(clock.now(), clock.now());
    EXPECT_EQ(clock.now().time_since_epoch(), seconds(1700000000));
}

TEST(Clock, SystemClockAdvances) {
    const Clock& clock = jsonsql::system_clock();
    TimePoint a = clock.now();
    TimePoint b = clock.now();
    EXPECT_LE(a, b);
    EXPECT_GT(a.time_since_epoch().count(), 0);
}

TEST(MidnightOf, FloorsToDayStart) {
    TimePoint t(hours(24 * 3) + hours(5) + microseconds(17));
    EXPECT_EQ(midnight_of(t), TimePoint(hours(24 * 3)));
}

TEST(MidnightOf, ExactMidnightIsUnchanged) {
    TimePoint t(hours(24 * 10));
    EXPECT_EQ(midnight_of(t), t);
}

TEST(MidnightOf, BeforeEpoch) {
    TimePoint t(-hours(1));
    EXPECT_EQ(midnight_of(t), TimePoint(-hours(24)));
}

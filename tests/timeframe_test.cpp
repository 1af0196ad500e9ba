#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>

#include "inspector/timeframe.hpp"

using namespace std::chrono_literals;

namespace {
const Timestamp T0 = timestamp_from_seconds(1500236538.0);
}

TEST(TimeFrame, FromEndSubtractsWindow) {
    auto f = TimeFrame::from_end(T0, 180s);
    EXPECT_EQ(f.start(), T0 - 180s);
    EXPECT_EQ(f.end(), T0);
    EXPECT_EQ(f.length(), 180s);
}

TEST(TimeFrame, FromStartAddsWindow) {
    auto f = TimeFrame::from_start(T0, 180s);
    EXPECT_EQ(f.start(), T0);
    EXPECT_EQ(f.end(), T0 + 180s);
}

TEST(TimeFrame, BetweenSwapsReversedEnds) {
    auto f = TimeFrame::between(T0 + 1h, T0);
    EXPECT_EQ(f.start(), T0);
    EXPECT_EQ(f.end(), T0 + 1h);
}

TEST(TimeFrame, NegativeWindowIsRejected) {
    EXPECT_THROW(TimeFrame::from_end(T0, -1s), std::invalid_argument);
    EXPECT_THROW(TimeFrame::from_start(T0, -1ns), std::invalid_argument);
}

TEST(TimeFrame, ContainsIsInclusive) {
    auto f = TimeFrame::from_end(T0, 10s);
    EXPECT_TRUE(f.contains(T0));
    EXPECT_TRUE(f.contains(T0 - 10s));
    EXPECT_TRUE(f.contains(T0 - 5s));
    EXPECT_FALSE(f.contains(T0 + 1ns));
    EXPECT_FALSE(f.contains(T0 - 10s - 1ns));
}

TEST(TimeFrame, ZeroWindowIsASingleInstant) {
    auto f = TimeFrame::from_end(T0, 0s);
    EXPECT_TRUE(f.contains(T0));
    EXPECT_FALSE(f.contains(T0 - 1ns));
    EXPECT_FALSE(f.contains(T0 + 1ns));
}

TEST(TimeFrame, ResolveAcceptsAnyTwo) {
    auto a = TimeFrame::resolve(T0, std::nullopt, 60s);
    EXPECT_EQ(a.start(), T0);
    EXPECT_EQ(a.end(), T0 + 60s);

    auto b = TimeFrame::resolve(std::nullopt, T0, Window(60s));
    EXPECT_EQ(b.start(), T0 - 60s);
    EXPECT_EQ(b.end(), T0);

    auto c = TimeFrame::resolve(T0 + 60s, T0, std::nullopt);
    EXPECT_EQ(c.start(), T0);
    EXPECT_EQ(c.end(), T0 + 60s);
}

TEST(TimeFrame, ResolvePrefersStartAndEndOverWindow) {
    auto f = TimeFrame::resolve(T0, T0 + 10s, Window(1h));
    EXPECT_EQ(f.end(), T0 + 10s);
}

TEST(TimeFrame, ResolveRejectsIncompleteInput) {
    EXPECT_THROW(TimeFrame::resolve(T0, std::nullopt, std::nullopt), std::invalid_argument);
    EXPECT_THROW(TimeFrame::resolve(std::nullopt, T0, std::nullopt), std::invalid_argument);
    EXPECT_THROW(TimeFrame::resolve(std::nullopt, std::nullopt, Window(60s)), std::invalid_argument);
    EXPECT_THROW(TimeFrame::resolve(std::nullopt, std::nullopt, std::nullopt), std::invalid_argument);
}

TEST(TimeFrame, WindowFromSeconds) {
    EXPECT_EQ(window_from_seconds(180), 180s);
    EXPECT_EQ(window_from_seconds(0.5), 500ms);
    EXPECT_EQ(window_from_seconds(0), Window::zero());
    EXPECT_THROW(window_from_seconds(std::numeric_limits<double>::infinity()), std::invalid_argument);
}

TEST(TimeFrame, OutOfRangeWindowIsRejected) {
    // would not fit in int64 nanoseconds
    EXPECT_THROW(window_from_seconds(1e10), std::invalid_argument);
    EXPECT_THROW(window_from_seconds(-1e10), std::invalid_argument);
    EXPECT_THROW(window_from_seconds(1e20), std::invalid_argument);
    EXPECT_EQ(window_from_seconds(9e9), std::chrono::seconds(9000000000LL));
}

TEST(TimeFrame, OtherEndMustFit) {
    Timestamp late = timestamp_from_seconds(9e9);
    Timestamp early = timestamp_from_seconds(-9e9);
    EXPECT_THROW(TimeFrame::from_start(late, window_from_seconds(9e9)), std::invalid_argument);
    EXPECT_THROW(TimeFrame::from_end(early, window_from_seconds(9e9)), std::invalid_argument);
    EXPECT_THROW(TimeFrame::resolve(late, std::nullopt, window_from_seconds(9e9)), std::invalid_argument);

    EXPECT_THROW(TimeFrame::between(early, late), std::invalid_argument);

    auto f = TimeFrame::from_end(late, window_from_seconds(9e9));
    EXPECT_EQ(f.start(), Timestamp{});
}

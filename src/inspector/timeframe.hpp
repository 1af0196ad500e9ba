#pragma once

#include <chrono>
#include <optional>

#include "../stamps/stamps.hpp"

using Window = std::chrono::nanoseconds;

// Inclusive [start, end] range of interest. start <= end always holds.
class TimeFrame {
    public:
        // Both throw std::invalid_argument for a negative window or when the
        // other end would not fit in a Timestamp.
        static TimeFrame from_end(Timestamp end, Window window);
        static TimeFrame from_start(Timestamp start, Window window);
        // order of a and b doesn't matter, throws if they are ~292 years apart
        static TimeFrame between(Timestamp a, Timestamp b);

        // Any two of start/end/window. start + end wins if all three are given.
        static TimeFrame resolve(std::optional<Timestamp> start,
                                 std::optional<Timestamp> end,
                                 std::optional<Window> window);

        Timestamp start() const { return start_; }
        Timestamp end() const { return end_; }
        Window length() const { return end_ - start_; }

        bool contains(Timestamp t) const {
            return start_ <= t && t <= end_;
        }

    private:
        TimeFrame(Timestamp start, Timestamp end) : start_(start), end_(end) {}

        Timestamp start_;
        Timestamp end_;
};

Window window_from_seconds(double seconds);

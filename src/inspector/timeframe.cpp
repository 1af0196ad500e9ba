#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include "timeframe.hpp"

static void check_window(Window window) {
    if (window < Window::zero())
        throw std::invalid_argument("window must not be negative");
}

TimeFrame TimeFrame::from_end(Timestamp end, Window window) {
    check_window(window);
    if (end.time_since_epoch() < Window::min() + window)
        throw std::invalid_argument("start of the time frame is out of range");
    return TimeFrame(end - window, end);
}

TimeFrame TimeFrame::from_start(Timestamp start, Window window) {
    check_window(window);
    if (start.time_since_epoch() > Window::max() - window)
        throw std::invalid_argument("end of the time frame is out of range");
    return TimeFrame(start, start + window);
}

TimeFrame TimeFrame::between(Timestamp a, Timestamp b) {
    Timestamp lo = std::min(a, b), hi = std::max(a, b);
    // length() has to fit in a Window too
    if (hi.time_since_epoch() > Window::zero() && lo.time_since_epoch() < hi.time_since_epoch() - Window::max())
        throw std::invalid_argument("time frame is too long");
    return TimeFrame(lo, hi);
}

TimeFrame TimeFrame::resolve(std::optional<Timestamp> start,
                             std::optional<Timestamp> end,
                             std::optional<Window> window) {
    if (start && end)
        return between(*start, *end);

    if (start) {
        if (!window)
            throw std::invalid_argument("start requires end or window");
        return from_start(*start, *window);
    }

    if (end) {
        if (!window)
            throw std::invalid_argument("end requires start or window");
        return from_end(*end, *window);
    }

    throw std::invalid_argument("need at least one of start or end");
}

Window window_from_seconds(double seconds) {
    if (!std::isfinite(seconds) || std::fabs(seconds) > MAX_STAMP_SECONDS)
        throw std::invalid_argument("window of " + std::to_string(seconds) + " seconds is out of range");
    return Window(std::llround(seconds * 1e9));
}

#pragma once

#include <boost/system/error_code.hpp>

#include <chrono>
#include <string>

using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;

struct Stamps {
    Timestamp birth;
    Timestamp access;
    Timestamp modify;
    // true when the fs had no birth time and we used the status change time instead
    bool birth_is_ctime;
};

// Follows symlinks. On failure ec is set and the returned stamps are zeroed.
Stamps read_stamps(const std::string& path, boost::system::error_code& ec);

// Largest magnitude in seconds that still fits int64 nanoseconds (~year 2262),
// with a second of slack for rounding the fraction.
#define MAX_STAMP_SECONDS 9223372035.0

// Throws std::invalid_argument if seconds is not finite or out of range.
Timestamp timestamp_from_seconds(double seconds);
double timestamp_to_seconds(Timestamp t);

// asctime layout, local time
std::string format_stamp(Timestamp t);

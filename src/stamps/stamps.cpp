#include <cerrno>
#include <cstdint>
#include <cmath>
#include <ctime>
#include <stdexcept>
#include <fcntl.h>
#include <sys/stat.h>

#include "stamps.hpp"

namespace sys = boost::system;

static Timestamp to_timestamp(int64_t sec, uint32_t nsec) {
    return Timestamp{std::chrono::seconds(sec) + std::chrono::nanoseconds(nsec)};
}

// Used when the kernel doesn't know about statx (pre 4.11).
static Stamps read_stamps_legacy(const std::string& path, sys::error_code& ec) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        ec.assign(errno, sys::system_category());
        return Stamps{};
    }

    Stamps s;
    s.birth  = to_timestamp(st.st_ctim.tv_sec, st.st_ctim.tv_nsec);
    s.access = to_timestamp(st.st_atim.tv_sec, st.st_atim.tv_nsec);
    s.modify = to_timestamp(st.st_mtim.tv_sec, st.st_mtim.tv_nsec);
    s.birth_is_ctime = true;
    return s;
}

Stamps read_stamps(const std::string& path, sys::error_code& ec) {
    ec.clear();

    struct statx stx;
    unsigned int mask = STATX_BTIME | STATX_ATIME | STATX_MTIME | STATX_CTIME;
    if (::statx(AT_FDCWD, path.c_str(), 0, mask, &stx) != 0) {
        if (errno == ENOSYS)
            return read_stamps_legacy(path, ec);
        ec.assign(errno, sys::system_category());
        return Stamps{};
    }

    Stamps s;
    s.access = to_timestamp(stx.stx_atime.tv_sec, stx.stx_atime.tv_nsec);
    s.modify = to_timestamp(stx.stx_mtime.tv_sec, stx.stx_mtime.tv_nsec);

    // tmpfs on older kernels, NFS, overlayfs on some setups... no btime there
    if (stx.stx_mask & STATX_BTIME) {
        s.birth = to_timestamp(stx.stx_btime.tv_sec, stx.stx_btime.tv_nsec);
        s.birth_is_ctime = false;
    } else {
        s.birth = to_timestamp(stx.stx_ctime.tv_sec, stx.stx_ctime.tv_nsec);
        s.birth_is_ctime = true;
    }
    return s;
}

Timestamp timestamp_from_seconds(double seconds) {
    if (!std::isfinite(seconds) || std::fabs(seconds) > MAX_STAMP_SECONDS)
        throw std::invalid_argument("time " + std::to_string(seconds) + " is out of range");

    double whole;
    double frac = std::modf(seconds, &whole);
    return Timestamp{std::chrono::seconds(static_cast<int64_t>(whole)) +
                     std::chrono::nanoseconds(std::llround(frac * 1e9))};
}

double timestamp_to_seconds(Timestamp t) {
    return std::chrono::duration<double>(t.time_since_epoch()).count();
}

std::string format_stamp(Timestamp t) {
    time_t tt = std::chrono::system_clock::to_time_t(
        std::chrono::time_point_cast<std::chrono::system_clock::duration>(t));
    std::tm tm{};
    localtime_r(&tt, &tm);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%a %b %e %H:%M:%S %Y", &tm);
    return buf;
}

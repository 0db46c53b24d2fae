#pragma once

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <string>
#include <type_traits>

namespace ptyshell {
namespace helpers {

/**
 * Format a wall-clock instant as ISO-8601 UTC with microseconds,
 * e.g. "2024-05-01T12:30:00.123456Z". Same layout as the debug log.
 */
static inline std::string iso_timestamp(std::chrono::system_clock::time_point tp) {
    auto secs   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - secs).count();
    if (micros < 0) { // pre-epoch instants round toward the previous second
        secs -= std::chrono::seconds(1);
        micros += 1000000;
    }
    std::time_t t = std::chrono::system_clock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char ts[64];
    std::snprintf(ts, sizeof(ts), "%04d-%02d-%02dT%02d:%02d:%02d.%06lldZ",
                  tm.tm_year+1900, tm.tm_mon+1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec,
                  static_cast<long long>(micros));
    return std::string(ts);
}

static inline std::string iso_timestamp_now() {
    return iso_timestamp(std::chrono::system_clock::now());
}

// strerror_r has two flavours (XSI returns int, GNU returns char*); handle both.
static inline std::string errno_message(int err) {
    char buf[256] = {0};
    auto pick = [&](auto r) -> const char* {
        if constexpr (std::is_same_v<decltype(r), char*>) return r;
        else return r == 0 ? buf : "unknown error";
    };
    return std::string(pick(::strerror_r(err, buf, sizeof(buf))));
}

} // namespace helpers
} // namespace ptyshell

#include "core/time_utils.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>

namespace puv {

int64_t nowSteadyNs() {
    const auto now = std::chrono::steady_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
}

int64_t nowSteadyMs() {
    return nowSteadyNs() / 1000000LL;
}

int64_t nowWallMs() {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

std::string formatIsoUtc(int64_t wall_ms) {
    const std::time_t secs = static_cast<std::time_t>(wall_ms / 1000);
    const int millis = static_cast<int>(wall_ms % 1000);
    std::tm tm_utc{};
    gmtime_r(&secs, &tm_utc);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm_utc.tm_year + 1900, tm_utc.tm_mon + 1, tm_utc.tm_mday,
                  tm_utc.tm_hour, tm_utc.tm_min, tm_utc.tm_sec, millis);
    return buf;
}

}  // namespace puv

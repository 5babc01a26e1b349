#include "dlog_time.h"

#include <cstdio>
#include <cstdlib>
#include <ctime>

namespace dlog {

static void getLocalTime(const DLogTime& logTime, struct tm& tmTime, uint64_t& nanos) {
    auto epochNanos =
        std::chrono::duration_cast<std::chrono::nanoseconds>(logTime.time_since_epoch()).count();
    time_t secs = (time_t)(epochNanos / 1000000000ll);
    nanos = (uint64_t)(epochNanos % 1000000000ll);
    localtime_r(&secs, &tmTime);
}

static void appendUtcOffset(std::string& str, const struct tm& tmTime) {
    long offsetSecs = tmTime.tm_gmtoff;
    if (offsetSecs == 0) {
        str.append("Z");
        return;
    }
    char sign = offsetSecs < 0 ? '-' : '+';
    long absOffsetMinutes = labs(offsetSecs) / 60;
    char buf[16];
    snprintf(buf, sizeof(buf), "%c%02ld:%02ld", sign, absOffsetMinutes / 60,
             absOffsetMinutes % 60);
    str.append(buf);
}

std::string formatRfc3164Time(const DLogTime& logTime) {
    struct tm tmTime;
    uint64_t nanos = 0;
    getLocalTime(logTime, tmTime, nanos);
    char buf[32];
    size_t len = strftime(buf, sizeof(buf), "%b %e %H:%M:%S", &tmTime);
    return std::string(buf, len);
}

std::string formatRfc3339Time(const DLogTime& logTime, bool withMillis /* = false */) {
    struct tm tmTime;
    uint64_t nanos = 0;
    getLocalTime(logTime, tmTime, nanos);
    char buf[64];
    size_t len = strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tmTime);
    std::string res(buf, len);
    if (withMillis) {
        snprintf(buf, sizeof(buf), ".%03u", (unsigned)(nanos / 1000000));
        res.append(buf);
    }
    appendUtcOffset(res, tmTime);
    return res;
}

std::string formatRfc3339NanoTime(const DLogTime& logTime) {
    struct tm tmTime;
    uint64_t nanos = 0;
    getLocalTime(logTime, tmTime, nanos);
    char buf[64];
    size_t len = strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tmTime);
    std::string res(buf, len);
    if (nanos > 0) {
        snprintf(buf, sizeof(buf), ".%09u", (unsigned)nanos);
        std::string fraction(buf);
        while (fraction.back() == '0') {
            fraction.pop_back();
        }
        res.append(fraction);
    }
    appendUtcOffset(res, tmTime);
    return res;
}

}  // namespace dlog

#ifndef __DLOG_TIME_H__
#define __DLOG_TIME_H__

#include <string>

#include "dlog_record.h"

namespace dlog {

/** @brief Formats time in RFC 3164 (BSD syslog) style: "Mmm dd hh:mm:ss" (local time). */
extern std::string formatRfc3164Time(const DLogTime& logTime);

/**
 * @brief Formats time in RFC 3339 style (local time with UTC offset), optionally with millisecond
 * precision.
 */
extern std::string formatRfc3339Time(const DLogTime& logTime, bool withMillis = false);

/**
 * @brief Formats time in RFC 3339 style with nanosecond precision (trailing zeros of the fraction
 * are trimmed).
 */
extern std::string formatRfc3339NanoTime(const DLogTime& logTime);

}  // namespace dlog

#endif  // __DLOG_TIME_H__

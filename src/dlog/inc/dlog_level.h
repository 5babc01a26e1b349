#ifndef __DLOG_LEVEL_H__
#define __DLOG_LEVEL_H__

#include <cstdint>
#include <cstdlib>

#include "dlog_def.h"

namespace dlog {

/**
 * @enum Log level constants, ordered from most severe to least severe. The numeric values match
 * the syslog severity of each level, so that a smaller value always means a more severe level.
 */
enum DLogLevel : uint32_t {
    /** @var Panic log level. The process aborts the current flow after logging. */
    DLEVEL_PANIC = 1,

    /** @var Fatal log level. The process cannot continue and will terminate. */
    DLEVEL_FATAL = 2,

    /** @var Error log level. An error condition occurred. Operation can continue. */
    DLEVEL_ERROR = 3,

    /** @var Warning log level. Some condition requires attention, but is not an error. */
    DLEVEL_WARN = 4,

    /** @var Notice log level. Normal but significant condition (syslog only). */
    DLEVEL_NOTICE = 5,

    /** @var Informative log level. */
    DLEVEL_INFO = 6,

    /** @var Debug log level. */
    DLEVEL_DEBUG = 7
};

/** @brief Converts log level constant to (lower-case) string. */
extern DLOG_API const char* dlogLevelToStr(DLogLevel logLevel);

/**
 * @brief Converts log level string to log level constant. Parsing is case-insensitive, and
 * "warning" is accepted as an alias of "warn".
 * @param logLevelStr The input log level string.
 * @param[out] logLevel The resulting log level.
 * @return True if parsing succeeded, otherwise false.
 */
extern DLOG_API bool dlogLevelFromStr(const char* logLevelStr, DLogLevel& logLevel);

/**
 * @brief Converts log level string to log level constant, resolving unknown strings to
 * @ref DLEVEL_INFO.
 */
extern DLOG_API DLogLevel dlogLevelFromStrDefault(const char* logLevelStr);

/** @brief Retrieves the syslog severity (0-7) of a log level. */
inline int dlogLevelToSyslogSeverity(DLogLevel logLevel) {
    switch (logLevel) {
        case DLEVEL_PANIC:
        case DLEVEL_FATAL:
            return 2;
        case DLEVEL_ERROR:
            return 3;
        case DLEVEL_WARN:
            return 4;
        case DLEVEL_NOTICE:
            return 5;
        case DLEVEL_DEBUG:
            return 7;
        case DLEVEL_INFO:
        default:
            return 6;
    }
}

/** @brief Queries whether a log level is a valid per-target filter level. */
extern DLOG_API bool dlogIsValidFilterLevel(const char* filterLevelStr);

}  // namespace dlog

#endif  // __DLOG_LEVEL_H__

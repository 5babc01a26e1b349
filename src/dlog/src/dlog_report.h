#ifndef __DLOG_REPORT_H__
#define __DLOG_REPORT_H__

#include <cerrno>
#include <cstdarg>
#include <string>

#include "dlog_def.h"
#include "dlog_level.h"
#include "dlog_report_handler.h"

namespace dlog {

class DLOG_API DLogReport {
public:
    /** @brief Installs a report handler (null restores the default stderr handler). */
    static void setReportHandler(DLogReportHandler* reportHandler);

    /** @brief Retrieves the installed report handler. */
    static DLogReportHandler* getReportHandler();

    /** @brief Configures dlog internal log message report level. */
    static void setReportLevel(DLogLevel reportLevel);

    /** @brief Retrieves dlog internal log message report level. */
    static DLogLevel getReportLevel();

    /** @brief Reports a DLog internal log message. */
    static void report(const DLogReportLogger& logger, DLogLevel logLevel, const char* file,
                       int line, const char* function, const char* fmt, ...);

    /** @brief Converts system error code to string. */
    static char* sysErrorToStr(int sysErrorCode);

    /** @brief Disables reports for current thread. */
    static void disableCurrentThreadReports();

    /** @brief Enabled reports for current thread. */
    static void enableCurrentThreadReports();

    /** @brief Forces usage of the default report handler. */
    static void startUseDefaultReportHandler();

    /** @brief Stops forcing usage of the default report handler. */
    static void stopUseDefaultReportHandler();
};

/** @brief Disables reports for the current thread for the life time of the object. */
class DLogScopedDisableReport {
public:
    DLogScopedDisableReport() { DLogReport::disableCurrentThreadReports(); }
    DLogScopedDisableReport(const DLogScopedDisableReport&) = delete;
    DLogScopedDisableReport(DLogScopedDisableReport&&) = delete;
    DLogScopedDisableReport& operator=(const DLogScopedDisableReport&) = delete;
    ~DLogScopedDisableReport() { DLogReport::enableCurrentThreadReports(); }
};

/**
 * @brief Forces the default (stderr) report handler for the current thread for the life time of
 * the object. Used in every context that must not re-enter the log dispatch path.
 */
class DLogScopedDefaultReport {
public:
    DLogScopedDefaultReport() { DLogReport::startUseDefaultReportHandler(); }
    DLogScopedDefaultReport(const DLogScopedDefaultReport&) = delete;
    DLogScopedDefaultReport(DLogScopedDefaultReport&&) = delete;
    DLogScopedDefaultReport& operator=(const DLogScopedDefaultReport&) = delete;
    ~DLogScopedDefaultReport() { DLogReport::stopUseDefaultReportHandler(); }
};

/** @brief Helper macro for declaring internal logger by name. */
#define DLOG_DECLARE_REPORT_LOGGER(name) static DLogReportLogger sLogger(#name);

/** @brief Helper macro for getting a reference to the internal logger. */
#define DLOG_REPORT_LOGGER sLogger

#define DLOG_SCOPED_DISABLE_REPORT() DLogScopedDisableReport __scopedDisableReport
#define DLOG_SCOPED_DEFAULT_REPORT() DLogScopedDefaultReport __scopedDefaultReport

/** @brief Generic reporting macro. */
#define DLOG_REPORT_EX(logger, level, fmt, ...) \
    DLogReport::report(logger, level, __FILE__, __LINE__, DLOG_FUNCTION, fmt, ##__VA_ARGS__)

/** @brief Generic reporting macro. */
#define DLOG_REPORT(level, fmt, ...) DLOG_REPORT_EX(sLogger, level, fmt, ##__VA_ARGS__)

/** @brief Report error message to enclosing application/library. */
#define DLOG_REPORT_FATAL(fmt, ...) DLOG_REPORT(DLEVEL_FATAL, fmt, ##__VA_ARGS__)
#define DLOG_REPORT_ERROR(fmt, ...) DLOG_REPORT(DLEVEL_ERROR, fmt, ##__VA_ARGS__)
#define DLOG_REPORT_WARN(fmt, ...) DLOG_REPORT(DLEVEL_WARN, fmt, ##__VA_ARGS__)
#define DLOG_REPORT_NOTICE(fmt, ...) DLOG_REPORT(DLEVEL_NOTICE, fmt, ##__VA_ARGS__)
#define DLOG_REPORT_INFO(fmt, ...) DLOG_REPORT(DLEVEL_INFO, fmt, ##__VA_ARGS__)
#define DLOG_REPORT_DEBUG(fmt, ...) DLOG_REPORT(DLEVEL_DEBUG, fmt, ##__VA_ARGS__)

/** @brief Report system call failure with error code to enclosing application/library. */
#define DLOG_REPORT_SYS_ERROR_NUM(sysCall, sysErr, fmt, ...)                \
    DLOG_REPORT_ERROR("System call " #sysCall "() failed: %d (%s)", sysErr, \
                      DLogReport::sysErrorToStr(sysErr));                   \
    DLOG_REPORT_ERROR(fmt, ##__VA_ARGS__);

/**
 * @brief Report system call failure (error code taken from errno) to enclosing
 * application/library.
 */
#define DLOG_REPORT_SYS_ERROR(sysCall, fmt, ...)                        \
    {                                                                   \
        int sysErr = errno;                                             \
        DLOG_REPORT_SYS_ERROR_NUM(sysCall, sysErr, fmt, ##__VA_ARGS__); \
    }

}  // namespace dlog

#endif  // __DLOG_REPORT_H__

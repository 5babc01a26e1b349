#ifndef __DLOG_LOGGER_H__
#define __DLOG_LOGGER_H__

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <memory>
#include <mutex>
#include <vector>

#include "dlog_def.h"
#include "dlog_hook.h"
#include "dlog_level.h"
#include "dlog_record.h"
#include "dlog_report_handler.h"

namespace dlog {

/** @enum Console output format of the host logger. */
enum DLogFormat : uint32_t {
    /** @var Human readable text lines. */
    DLOG_FORMAT_TEXT,

    /** @var One JSON object per line. */
    DLOG_FORMAT_JSON
};

/** @brief Converts a format string ("json" or "text") to format constant. */
extern DLOG_API bool dlogFormatFromStr(const char* formatStr, DLogFormat& format);

/**
 * @brief The host logging framework. Each accepted log call is turned into a single immutable
 * @ref DLogRecord, written to the console sink (if any), and handed to every registered hook.
 */
class DLOG_API DLogLogger {
public:
    /**
     * @brief Construct a new logger object.
     * @param sink The console sink. Pass null to disable console output.
     */
    DLogLogger(FILE* sink = stderr);
    DLogLogger(const DLogLogger&) = delete;
    DLogLogger(DLogLogger&&) = delete;
    DLogLogger& operator=(const DLogLogger&) = delete;
    ~DLogLogger() {}

    /** @brief Sets the minimum log level accepted by the logger. */
    inline void setLogLevel(DLogLevel logLevel) {
        m_logLevel.store(logLevel, std::memory_order_relaxed);
    }

    /** @brief Retrieves the minimum log level accepted by the logger. */
    inline DLogLevel getLogLevel() const { return m_logLevel.load(std::memory_order_relaxed); }

    /** @brief Sets the console output format. */
    inline void setFormat(DLogFormat format) { m_format.store(format, std::memory_order_relaxed); }

    /** @brief Retrieves the console output format. */
    inline DLogFormat getFormat() const { return m_format.load(std::memory_order_relaxed); }

    /** @brief Sets whether the console output includes the issuing file and line. */
    inline void setIncludeCaller(bool includeCaller) {
        m_includeCaller.store(includeCaller, std::memory_order_relaxed);
    }

    /** @brief Queries whether the console output includes the issuing file and line. */
    inline bool getIncludeCaller() const { return m_includeCaller.load(std::memory_order_relaxed); }

    /** @brief Replaces the console sink (null disables console output). */
    void setSink(FILE* sink);

    /** @brief Queries whether the logger accepts records with the given level. */
    inline bool canLog(DLogLevel logLevel) const { return logLevel <= getLogLevel(); }

    /** @brief Registers a hook. The hook must outlive its registration. */
    void addHook(DLogHook* hook);

    /** @brief Unregisters a hook. */
    void removeHook(DLogHook* hook);

    /**
     * @brief Logs a message with fields. No log level checking takes place.
     * @param logLevel The log level.
     * @param file The issuing file name.
     * @param line The issuing line.
     * @param function The issuing function.
     * @param msg The log message.
     * @param fields The record fields (JSON object).
     */
    void log(DLogLevel logLevel, const char* file, int line, const char* function,
             const std::string& msg, const nlohmann::json& fields = nlohmann::json::object());

    /** @brief Formats a log message (printf-style) and logs it without fields. */
    void logFormat(DLogLevel logLevel, const char* file, int line, const char* function,
                   const char* fmt, ...);

    /** @brief Formats a log message (printf-style) and logs it without fields. */
    void logFormatV(DLogLevel logLevel, const char* file, int line, const char* function,
                    const char* fmt, va_list args);

private:
    typedef std::vector<DLogHook*> HookList;

    std::atomic<DLogLevel> m_logLevel;
    std::atomic<DLogFormat> m_format;
    std::atomic<bool> m_includeCaller;

    // copy-on-write hook list, so that firing hooks requires no lock
    std::atomic<std::shared_ptr<const HookList>> m_hooks;
    std::mutex m_hookLock;

    FILE* m_sink;
    std::mutex m_sinkLock;

    void writeConsole(const DLogRecord& logRecord, const char* file, int line,
                      const char* function);
};

/**
 * @brief Report handler that routes dlog internal reports into a host logger, so they reach all
 * registered hooks (and therefore all active outputs).
 */
class DLOG_API DLogLoggerReportHandler : public DLogReportHandler {
public:
    DLogLoggerReportHandler(DLogLogger* logger, DLogLevel reportLevel = DLEVEL_WARN)
        : DLogReportHandler(reportLevel), m_logger(logger) {}
    DLogLoggerReportHandler(const DLogLoggerReportHandler&) = delete;
    DLogLoggerReportHandler(DLogLoggerReportHandler&&) = delete;
    DLogLoggerReportHandler& operator=(const DLogLoggerReportHandler&) = delete;
    ~DLogLoggerReportHandler() final {}

    void onReportV(const DLogReportLogger& reportLogger, DLogLevel logLevel, const char* file,
                   int line, const char* function, const char* fmt, va_list args) final;

    void onReport(const DLogReportLogger& reportLogger, DLogLevel logLevel, const char* file,
                  int line, const char* function, const char* msg) final;

private:
    DLogLogger* m_logger;
};

}  // namespace dlog

/** @brief Logs a formatted message through a logger (printf-style). */
#define DLOG_EX(logger, level, fmt, ...)                                                 \
    if ((logger)->canLog(level)) {                                                       \
        (logger)->logFormat(level, __FILE__, __LINE__, DLOG_FUNCTION, fmt, ##__VA_ARGS__); \
    }

/** @brief Logs a message with fields through a logger. */
#define DLOG_FIELDS_EX(logger, level, fields, msg)                           \
    if ((logger)->canLog(level)) {                                           \
        (logger)->log(level, __FILE__, __LINE__, DLOG_FUNCTION, msg, fields); \
    }

#define DLOG_PANIC_EX(logger, fmt, ...) DLOG_EX(logger, dlog::DLEVEL_PANIC, fmt, ##__VA_ARGS__)
#define DLOG_FATAL_EX(logger, fmt, ...) DLOG_EX(logger, dlog::DLEVEL_FATAL, fmt, ##__VA_ARGS__)
#define DLOG_ERROR_EX(logger, fmt, ...) DLOG_EX(logger, dlog::DLEVEL_ERROR, fmt, ##__VA_ARGS__)
#define DLOG_WARN_EX(logger, fmt, ...) DLOG_EX(logger, dlog::DLEVEL_WARN, fmt, ##__VA_ARGS__)
#define DLOG_NOTICE_EX(logger, fmt, ...) DLOG_EX(logger, dlog::DLEVEL_NOTICE, fmt, ##__VA_ARGS__)
#define DLOG_INFO_EX(logger, fmt, ...) DLOG_EX(logger, dlog::DLEVEL_INFO, fmt, ##__VA_ARGS__)
#define DLOG_DEBUG_EX(logger, fmt, ...) DLOG_EX(logger, dlog::DLEVEL_DEBUG, fmt, ##__VA_ARGS__)

#endif  // __DLOG_LOGGER_H__

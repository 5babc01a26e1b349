#ifndef __DLOG_REPORT_HANDLER_H__
#define __DLOG_REPORT_HANDLER_H__

#include <cstdarg>
#include <string>

#include "dlog_def.h"
#include "dlog_level.h"

namespace dlog {

/** @brief DLog's internal reporting logger. Each module declares one by name. */
class DLOG_API DLogReportLogger {
public:
    DLogReportLogger(const char* name) : m_name(name) {}
    DLogReportLogger(const DLogReportLogger&) = delete;
    DLogReportLogger(DLogReportLogger&&) = delete;
    DLogReportLogger& operator=(const DLogReportLogger&) = delete;
    ~DLogReportLogger() {}

    /** @brief Retrieves the name of the logger. */
    inline const char* getName() const { return m_name.c_str(); }

private:
    std::string m_name;
};

/**
 * @brief DLog internal message report handling interface. User can derive, implement and install
 * it through @ref DLogReport::setReportHandler().
 */
class DLOG_API DLogReportHandler {
public:
    /** @brief Disable copy constructor. */
    DLogReportHandler(const DLogReportHandler&) = delete;

    /** @brief Disable move constructor. */
    DLogReportHandler(DLogReportHandler&&) = delete;

    /** @brief Disable assignment operator. */
    DLogReportHandler& operator=(const DLogReportHandler&) = delete;

    /** @brief Destructor. */
    virtual ~DLogReportHandler() {}

    /** @brief Reports DLog internal log message. */
    virtual void onReportV(const DLogReportLogger& reportLogger, DLogLevel logLevel,
                           const char* file, int line, const char* function, const char* fmt,
                           va_list args) = 0;

    /** @brief Reports DLog internal log message. */
    virtual void onReport(const DLogReportLogger& reportLogger, DLogLevel logLevel,
                          const char* file, int line, const char* function, const char* msg) = 0;

    /** @brief Configures report level. */
    virtual void setReportLevel(DLogLevel reportLevel) { m_reportLevel = reportLevel; }

    /** @brief Retrieves report level. */
    inline DLogLevel getReportLevel() const { return m_reportLevel; }

protected:
    /** @brief Constructor. */
    DLogReportHandler(DLogLevel reportLevel = DLEVEL_WARN) : m_reportLevel(reportLevel) {}

private:
    DLogLevel m_reportLevel;
};

/** @brief Installs a handler for dlog's internal log message reporting (null restores default). */
extern DLOG_API void setReportHandler(DLogReportHandler* reportHandler);

/** @brief Configures the log level of dlog's internal log message reports. */
extern DLOG_API void setReportLevel(DLogLevel reportLevel);

/** @brief Retrieves the log level of dlog's internal log message reports. */
extern DLOG_API DLogLevel getReportLevel();

}  // namespace dlog

#endif  // __DLOG_REPORT_HANDLER_H__

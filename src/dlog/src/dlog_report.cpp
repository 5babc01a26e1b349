#include "dlog_report.h"

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>

#include "dlog_common.h"
#include "dlog_time.h"

namespace dlog {

static thread_local uint64_t sDisableReportCount = 0;

static thread_local uint64_t sDefaultReportCount = 0;

static thread_local bool sIsReporting = false;

class DLogDefaultReportHandler : public DLogReportHandler {
public:
    DLogDefaultReportHandler() {}
    DLogDefaultReportHandler(const DLogDefaultReportHandler&) = delete;
    DLogDefaultReportHandler(DLogDefaultReportHandler&&) = delete;
    DLogDefaultReportHandler& operator=(const DLogDefaultReportHandler&) = delete;
    ~DLogDefaultReportHandler() final {}

    void onReportV(const DLogReportLogger& reportLogger, DLogLevel logLevel, const char* file,
                   int line, const char* function, const char* fmt, va_list args) override {
        std::string msg;
        formatStringV(msg, fmt, args);
        onReport(reportLogger, logLevel, file, line, function, msg.c_str());
    }

    void onReport(const DLogReportLogger& reportLogger, DLogLevel logLevel, const char* file,
                  int line, const char* function, const char* msg) override {
        // NOTE: the message is formatted in one buffer in order to emit full message in one call
        // and avoid intermixing messages from several threads
        std::string buffer = formatRfc3339Time(std::chrono::system_clock::now(), true);
        appendFormat(buffer, " %-6s [%d] dlog.%s ", dlogLevelToStr(logLevel),
                     (int)getCurrentThreadId(), reportLogger.getName());
        buffer.append(msg);
        buffer.append("\n");
        if (logLevel <= DLEVEL_ERROR) {
            appendFormat(buffer, "Error location: file: %s, line: %d, function: %s\n", file,
                         line, function);
        }
        fputs(buffer.c_str(), stderr);
        fflush(stderr);
    }
};

static DLogDefaultReportHandler sDefaultReportHandler;
static std::atomic<DLogReportHandler*> sReportHandler(&sDefaultReportHandler);
static std::atomic<DLogLevel> sReportLevel(DLEVEL_WARN);

void DLogReport::setReportHandler(DLogReportHandler* reportHandler) {
    if (reportHandler == nullptr) {
        reportHandler = &sDefaultReportHandler;
    }
    reportHandler->setReportLevel(getReportLevel());
    sReportHandler.store(reportHandler, std::memory_order_release);
}

DLogReportHandler* DLogReport::getReportHandler() {
    return sReportHandler.load(std::memory_order_acquire);
}

void DLogReport::setReportLevel(DLogLevel reportLevel) {
    sReportLevel.store(reportLevel, std::memory_order_relaxed);
    getReportHandler()->setReportLevel(reportLevel);
}

DLogLevel DLogReport::getReportLevel() { return sReportLevel.load(std::memory_order_relaxed); }

void DLogReport::report(const DLogReportLogger& reportLogger, DLogLevel logLevel, const char* file,
                        int line, const char* function, const char* fmt, ...) {
    if (sDisableReportCount == 0 && logLevel <= getReportLevel()) {
        va_list args;
        va_start(args, fmt);

        // a report issued while reporting (or in a context that must not re-enter the dispatch
        // path) goes directly to stderr
        if (sIsReporting || sDefaultReportCount > 0) {
            sDefaultReportHandler.onReportV(reportLogger, logLevel, file, line, function, fmt,
                                            args);
        } else {
            sIsReporting = true;
            DLogReportHandler* reportHandler = getReportHandler();
            reportHandler->onReportV(reportLogger, logLevel, file, line, function, fmt, args);
            sIsReporting = false;
        }

        va_end(args);
    }
}

char* DLogReport::sysErrorToStr(int sysErrorCode) {
    const int BUF_LEN = 256;
    static thread_local char buf[BUF_LEN];
#if (_POSIX_C_SOURCE >= 200112L) && !_GNU_SOURCE
    (void)strerror_r(sysErrorCode, buf, BUF_LEN);
    return buf;
#else
    return strerror_r(sysErrorCode, buf, BUF_LEN);
#endif
}

void DLogReport::disableCurrentThreadReports() { ++sDisableReportCount; }

void DLogReport::enableCurrentThreadReports() {
    if (sDisableReportCount > 0) {
        --sDisableReportCount;
    }
}

void DLogReport::startUseDefaultReportHandler() { ++sDefaultReportCount; }

void DLogReport::stopUseDefaultReportHandler() {
    if (sDefaultReportCount > 0) {
        --sDefaultReportCount;
    }
}

void setReportHandler(DLogReportHandler* reportHandler) {
    DLogReport::setReportHandler(reportHandler);
}

void setReportLevel(DLogLevel reportLevel) { DLogReport::setReportLevel(reportLevel); }

DLogLevel getReportLevel() { return DLogReport::getReportLevel(); }

}  // namespace dlog

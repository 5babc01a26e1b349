#include "dlog_logger.h"

#include <algorithm>
#include <cstring>

#include "dlog_common.h"
#include "dlog_report.h"
#include "dlog_time.h"

namespace dlog {

bool dlogFormatFromStr(const char* formatStr, DLogFormat& format) {
    if (formatStr == nullptr) {
        return false;
    }
    std::string lower = strToLower(formatStr);
    if (lower == "json") {
        format = DLOG_FORMAT_JSON;
        return true;
    }
    if (lower == "text") {
        format = DLOG_FORMAT_TEXT;
        return true;
    }
    return false;
}

DLogLogger::DLogLogger(FILE* sink /* = stderr */)
    : m_logLevel(DLEVEL_INFO),
      m_format(DLOG_FORMAT_TEXT),
      m_includeCaller(false),
      m_hooks(std::make_shared<const HookList>()),
      m_sink(sink) {}

void DLogLogger::setSink(FILE* sink) {
    std::unique_lock<std::mutex> lock(m_sinkLock);
    m_sink = sink;
}

void DLogLogger::addHook(DLogHook* hook) {
    std::unique_lock<std::mutex> lock(m_hookLock);
    std::shared_ptr<const HookList> hooks = m_hooks.load(std::memory_order_acquire);
    if (std::find(hooks->begin(), hooks->end(), hook) != hooks->end()) {
        return;
    }
    std::shared_ptr<HookList> newHooks = std::make_shared<HookList>(*hooks);
    newHooks->push_back(hook);
    m_hooks.store(newHooks, std::memory_order_release);
}

void DLogLogger::removeHook(DLogHook* hook) {
    std::unique_lock<std::mutex> lock(m_hookLock);
    std::shared_ptr<const HookList> hooks = m_hooks.load(std::memory_order_acquire);
    std::shared_ptr<HookList> newHooks = std::make_shared<HookList>(*hooks);
    newHooks->erase(std::remove(newHooks->begin(), newHooks->end(), hook), newHooks->end());
    m_hooks.store(newHooks, std::memory_order_release);
}

void DLogLogger::log(DLogLevel logLevel, const char* file, int line, const char* function,
                     const std::string& msg,
                     const nlohmann::json& fields /* = nlohmann::json::object() */) {
    DLogRecordPtr logRecord = std::make_shared<const DLogRecord>(logLevel, msg, fields);
    writeConsole(*logRecord, file, line, function);

    // hooks are fired without any lock held
    std::shared_ptr<const HookList> hooks = m_hooks.load(std::memory_order_acquire);
    for (DLogHook* hook : *hooks) {
        hook->fire(logRecord);
    }
}

void DLogLogger::logFormat(DLogLevel logLevel, const char* file, int line, const char* function,
                           const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logFormatV(logLevel, file, line, function, fmt, args);
    va_end(args);
}

void DLogLogger::logFormatV(DLogLevel logLevel, const char* file, int line, const char* function,
                            const char* fmt, va_list args) {
    std::string msg;
    formatStringV(msg, fmt, args);
    log(logLevel, file, line, function, msg);
}

void DLogLogger::writeConsole(const DLogRecord& logRecord, const char* file, int line,
                              const char* function) {
    std::unique_lock<std::mutex> lock(m_sinkLock);
    if (m_sink == nullptr) {
        return;
    }

    std::string buffer;
    bool includeCaller = getIncludeCaller() && file != nullptr;
    if (getFormat() == DLOG_FORMAT_JSON) {
        nlohmann::json entry = nlohmann::json::object();
        entry["time"] = formatRfc3339Time(logRecord.m_logTime, true);
        entry["level"] = dlogLevelToStr(logRecord.m_logLevel);
        entry["msg"] = logRecord.m_logMsg;
        for (const auto& field : logRecord.m_fields.items()) {
            entry[field.key()] = field.value();
        }
        if (includeCaller) {
            entry["caller"] = std::string(file) + ":" + std::to_string(line);
        }
        buffer = entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    } else {
        buffer = formatRfc3339Time(logRecord.m_logTime, true);
        appendFormat(buffer, " %-6s %s", dlogLevelToStr(logRecord.m_logLevel),
                     logRecord.m_logMsg.c_str());
        for (const auto& field : logRecord.m_fields.items()) {
            buffer.append(" ");
            buffer.append(field.key());
            buffer.append("=");
            if (field.value().is_string()) {
                buffer.append(field.value().get<std::string>());
            } else {
                buffer.append(
                    field.value().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
            }
        }
        if (includeCaller) {
            appendFormat(buffer, " (%s:%d %s)", file, line, function);
        }
    }
    buffer.append("\n");
    fputs(buffer.c_str(), m_sink);
    fflush(m_sink);
}

void DLogLoggerReportHandler::onReportV(const DLogReportLogger& reportLogger, DLogLevel logLevel,
                                        const char* file, int line, const char* function,
                                        const char* fmt, va_list args) {
    std::string msg;
    formatStringV(msg, fmt, args);
    onReport(reportLogger, logLevel, file, line, function, msg.c_str());
}

void DLogLoggerReportHandler::onReport(const DLogReportLogger& reportLogger, DLogLevel logLevel,
                                       const char* file, int line, const char* function,
                                       const char* msg) {
    if (m_logger->canLog(logLevel)) {
        nlohmann::json fields = nlohmann::json::object();
        fields["component"] = std::string("dlog.") + reportLogger.getName();
        m_logger->log(logLevel, file, line, function, msg, fields);
    }
}

}  // namespace dlog

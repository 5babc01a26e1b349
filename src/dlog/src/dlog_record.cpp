#include "dlog_record.h"

#include "dlog_time.h"

namespace dlog {

std::string dlogRecordToJsonBody(const DLogRecord& logRecord) {
    nlohmann::json body = nlohmann::json::object();
    body["level"] = dlogLevelToStr(logRecord.m_logLevel);
    body["message"] = logRecord.m_logMsg;
    if (!logRecord.m_fields.empty()) {
        body["fields"] = logRecord.m_fields;
    }
    // NOTE: invalid UTF-8 sequences are replaced rather than failing the whole record
    return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json dlogRecordToJson(const DLogRecord& logRecord) {
    nlohmann::json entry = nlohmann::json::object();
    entry["timestamp"] = formatRfc3339NanoTime(logRecord.m_logTime);
    entry["level"] = dlogLevelToStr(logRecord.m_logLevel);
    entry["message"] = logRecord.m_logMsg;
    if (!logRecord.m_fields.empty()) {
        entry["fields"] = logRecord.m_fields;
    }
    return entry;
}

}  // namespace dlog

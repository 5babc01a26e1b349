#ifndef __DLOG_RECORD_H__
#define __DLOG_RECORD_H__

#include <chrono>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "dlog_def.h"
#include "dlog_level.h"

namespace dlog {

/** @typedef Log record time stamp type. */
typedef std::chrono::system_clock::time_point DLogTime;

/**
 * @brief The immutable unit dispatched to outputs. A record is created once per log call and
 * shared (read-only) by all outputs that accept it.
 */
struct DLOG_API DLogRecord {
    DLogRecord() : m_logTime(std::chrono::system_clock::now()), m_logLevel(DLEVEL_INFO) {}
    DLogRecord(DLogLevel logLevel, const std::string& logMsg,
               const nlohmann::json& fields = nlohmann::json::object())
        : m_logTime(std::chrono::system_clock::now()),
          m_logLevel(logLevel),
          m_logMsg(logMsg),
          m_fields(fields.is_object() ? fields : nlohmann::json::object()) {}
    DLogRecord(const DLogRecord&) = default;
    DLogRecord(DLogRecord&&) = default;
    DLogRecord& operator=(const DLogRecord&) = default;
    ~DLogRecord() {}

    /** @var The time when the record was created. */
    DLogTime m_logTime;

    /** @var The record's log level. */
    DLogLevel m_logLevel;

    /** @var The log message. */
    std::string m_logMsg;

    /** @var Free-form key/value fields (always a JSON object, possibly empty). */
    nlohmann::json m_fields;
};

/** @typedef Shared immutable log record, as passed to outputs. */
typedef std::shared_ptr<const DLogRecord> DLogRecordPtr;

/**
 * @brief Renders the record as the JSON object {"level", "message", "fields"}, where fields are
 * omitted when empty. Used as the syslog message body in both RFC 3164 and RFC 5424 formats.
 */
extern DLOG_API std::string dlogRecordToJsonBody(const DLogRecord& logRecord);

/**
 * @brief Converts the record to the JSON object {"timestamp", "level", "message", "fields"} used
 * in HTTP batches. Time stamp is in RFC 3339 format with nanosecond precision.
 */
extern DLOG_API nlohmann::json dlogRecordToJson(const DLogRecord& logRecord);

}  // namespace dlog

#endif  // __DLOG_RECORD_H__

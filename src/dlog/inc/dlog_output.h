#ifndef __DLOG_OUTPUT_H__
#define __DLOG_OUTPUT_H__

#include <memory>
#include <string>

#include "dlog_def.h"
#include "dlog_error.h"
#include "dlog_record.h"

namespace dlog {

/**
 * @brief Parent class for all log outputs. An output is the live runtime connection or buffer
 * object backing an enabled logging target.
 */
class DLOG_API DLogOutput {
public:
    virtual ~DLogOutput() {}
    DLogOutput(const DLogOutput&) = delete;
    DLogOutput(DLogOutput&&) = delete;
    DLogOutput& operator=(const DLogOutput&) = delete;

    /** @brief Retrieves the output's name (for reporting purposes). */
    inline const char* getName() const { return m_name.c_str(); }

    /**
     * @brief Writes a log record to the output. The call must not block indefinitely, and never
     * throws. Missing record fields are simply omitted from the rendered form.
     * @param logRecord The log record to write.
     * @param[out] errorMsg Optionally receives failure description.
     * @return The operation result.
     */
    virtual DLogErrorCode write(const DLogRecord& logRecord, std::string* errorMsg = nullptr) = 0;

    /**
     * @brief Releases all output resources. Calling close twice is harmless.
     * @param[out] errorMsg Optionally receives failure description.
     * @return The operation result.
     */
    virtual DLogErrorCode close(std::string* errorMsg = nullptr) = 0;

protected:
    DLogOutput(const char* name) : m_name(name) {}

private:
    std::string m_name;
};

/** @typedef Shared output handle (outputs are shared between the manager and snapshots). */
typedef std::shared_ptr<DLogOutput> DLogOutputPtr;

}  // namespace dlog

#endif  // __DLOG_OUTPUT_H__

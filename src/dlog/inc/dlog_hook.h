#ifndef __DLOG_HOOK_H__
#define __DLOG_HOOK_H__

#include "dlog_def.h"
#include "dlog_record.h"

namespace dlog {

/**
 * @brief Observer interface registered with the host logger. Every accepted log record is passed
 * to all registered hooks. Implementations must not block the calling thread.
 */
class DLOG_API DLogHook {
public:
    virtual ~DLogHook() {}
    DLogHook(const DLogHook&) = delete;
    DLogHook(DLogHook&&) = delete;
    DLogHook& operator=(const DLogHook&) = delete;

    /** @brief Handles a single log record. */
    virtual void fire(const DLogRecordPtr& logRecord) = 0;

protected:
    DLogHook() {}
};

}  // namespace dlog

#endif  // __DLOG_HOOK_H__

#ifndef __DLOG_DISPATCH_HOOK_H__
#define __DLOG_DISPATCH_HOOK_H__

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "dlog_async_output.h"
#include "dlog_def.h"
#include "dlog_hook.h"
#include "dlog_level.h"

namespace dlog {

/** @struct A single active output paired with its target's filter level. */
struct DLOG_API DLogDispatchEntry {
    std::string m_targetId;
    std::shared_ptr<DLogAsyncOutput> m_output;
    DLogLevel m_filterLevel;
};

/** @struct Immutable collection of active outputs, replaced wholesale on every change. */
struct DLOG_API DLogDispatchSnapshot {
    std::vector<DLogDispatchEntry> m_entries;
};

/** @typedef Shared immutable snapshot handle. */
typedef std::shared_ptr<const DLogDispatchSnapshot> DLogDispatchSnapshotPtr;

/**
 * @brief Queries whether a record with the given level passes a target's filter level (i.e. the
 * record is at least as severe as the filter level).
 */
inline bool dlogShouldDispatch(DLogLevel recordLevel, DLogLevel filterLevel) {
    return recordLevel <= filterLevel;
}

/**
 * @brief The hook registered with the host logger. Each record is handed asynchronously to every
 * output in the current snapshot whose filter level admits it. The hook reads the snapshot through
 * an atomic load only, and never takes any lock of the manager that publishes it.
 */
class DLOG_API DLogDispatchHook : public DLogHook {
public:
    DLogDispatchHook() : m_snapshot(std::make_shared<const DLogDispatchSnapshot>()) {}
    DLogDispatchHook(const DLogDispatchHook&) = delete;
    DLogDispatchHook(DLogDispatchHook&&) = delete;
    DLogDispatchHook& operator=(const DLogDispatchHook&) = delete;
    ~DLogDispatchHook() final {}

    void fire(const DLogRecordPtr& logRecord) final;

    /** @brief Publishes a new snapshot (null publishes an empty snapshot). */
    void publish(DLogDispatchSnapshotPtr snapshot);

    /** @brief Retrieves the current snapshot. */
    inline DLogDispatchSnapshotPtr getSnapshot() const {
        return m_snapshot.load(std::memory_order_acquire);
    }

private:
    std::atomic<DLogDispatchSnapshotPtr> m_snapshot;
};

}  // namespace dlog

#endif  // __DLOG_DISPATCH_HOOK_H__

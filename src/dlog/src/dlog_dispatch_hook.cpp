#include "dlog_dispatch_hook.h"

namespace dlog {

void DLogDispatchHook::fire(const DLogRecordPtr& logRecord) {
    // NOTE: snapshot access requires no lock, it is never modified after publication
    DLogDispatchSnapshotPtr snapshot = getSnapshot();
    for (const DLogDispatchEntry& entry : snapshot->m_entries) {
        if (dlogShouldDispatch(logRecord->m_logLevel, entry.m_filterLevel)) {
            entry.m_output->submit(logRecord);
        }
    }
}

void DLogDispatchHook::publish(DLogDispatchSnapshotPtr snapshot) {
    if (snapshot == nullptr) {
        snapshot = std::make_shared<const DLogDispatchSnapshot>();
    }
    m_snapshot.store(snapshot, std::memory_order_release);
}

}  // namespace dlog

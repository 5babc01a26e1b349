#include "dlog_async_output.h"

#include "dlog_report.h"

namespace dlog {

DLOG_DECLARE_REPORT_LOGGER(DLogAsyncOutput)

DLogAsyncOutput::~DLogAsyncOutput() { (void)close(); }

bool DLogAsyncOutput::start() {
    std::unique_lock<std::mutex> lock(m_lock);
    if (m_started || m_closed) {
        return m_started;
    }
    m_writeThread = std::thread(&DLogAsyncOutput::writeThread, this);
    m_started = true;
    return true;
}

void DLogAsyncOutput::submit(const DLogRecordPtr& logRecord) {
    std::unique_lock<std::mutex> lock(m_lock);
    if (m_closed) {
        return;
    }
    if (m_queueLimit > 0 && m_queue.size() >= m_queueLimit) {
        m_dropCount.fetch_add(1, std::memory_order_relaxed);
        if (!m_dropBurst) {
            m_dropBurst = true;
            DLOG_SCOPED_DEFAULT_REPORT();
            DLOG_REPORT_WARN("Output %s queue is full (%u records), dropping log records",
                             getName(), m_queueLimit);
        }
        return;
    }
    m_submitCount.fetch_add(1, std::memory_order_relaxed);
    m_queue.push_back(logRecord);
    m_cv.notify_one();
}

DLogErrorCode DLogAsyncOutput::write(const DLogRecord& logRecord,
                                     std::string* errorMsg /* = nullptr */) {
    {
        std::unique_lock<std::mutex> lock(m_lock);
        if (m_closed) {
            if (errorMsg != nullptr) {
                *errorMsg = "output is closed";
            }
            return DLOG_E_CLOSED;
        }
    }
    submit(std::make_shared<const DLogRecord>(logRecord));
    return DLOG_E_OK;
}

DLogErrorCode DLogAsyncOutput::close(std::string* errorMsg /* = nullptr */) {
    bool started = false;
    {
        std::unique_lock<std::mutex> lock(m_lock);
        if (m_closed) {
            return DLOG_E_OK;
        }
        m_closed = true;
        started = m_started;
    }
    if (started) {
        stopWriteThread();
    }
    return m_output->close(errorMsg);
}

void DLogAsyncOutput::writeThread() {
    // write failures must never re-enter the dispatch path
    DLOG_SCOPED_DEFAULT_REPORT();
    RecordQueue queue;
    while (true) {
        {
            // wait for queue event
            std::unique_lock<std::mutex> lock(m_lock);
            m_cv.wait(lock, [this] { return m_stop || !m_queue.empty(); });
            if (m_queue.empty()) {
                // stop requested and nothing is left
                break;
            }

            // drain queue (lock still held)
            queue.splice(queue.end(), m_queue);
            m_dropBurst = false;
        }

        // write to output outside of lock scope (allow loggers to push records)
        writeQueue(queue);
    }
}

void DLogAsyncOutput::writeQueue(RecordQueue& queue) {
    for (const DLogRecordPtr& logRecord : queue) {
        std::string errorMsg;
        DLogErrorCode rc = m_output->write(*logRecord, &errorMsg);
        if (rc == DLOG_E_OK) {
            m_writeCount.fetch_add(1, std::memory_order_relaxed);
            if (m_failing) {
                m_failing = false;
                DLOG_REPORT_NOTICE("Output %s recovered", getName());
            }
        } else {
            m_failCount.fetch_add(1, std::memory_order_relaxed);
            // report only the first failure of a consecutive run
            if (!m_failing) {
                m_failing = true;
                DLOG_REPORT_ERROR("Failed to write log record to output %s: %s (%s)", getName(),
                                  errorMsg.c_str(), dlogErrorCodeToString(rc));
            }
        }
    }
    queue.clear();
}

void DLogAsyncOutput::stopWriteThread() {
    {
        std::unique_lock<std::mutex> lock(m_lock);
        m_stop = true;
        m_cv.notify_one();
    }
    m_writeThread.join();
}

}  // namespace dlog

#ifndef __DLOG_ASYNC_OUTPUT_H__
#define __DLOG_ASYNC_OUTPUT_H__

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <list>
#include <mutex>
#include <thread>

#include "dlog_def.h"
#include "dlog_output.h"

namespace dlog {

/**
 * @brief An output wrapper deferring writes to a dedicated worker thread, so that a slow or
 * blocked output never delays the logging call site or other outputs. Records are written in
 * submission order (per-output FIFO).
 */
class DLOG_API DLogAsyncOutput : public DLogOutput {
public:
    /**
     * @brief Construct a new asynchronous output object.
     * @param output The wrapped output.
     * @param queueLimit Maximum number of pending records (zero means unbounded).
     */
    DLogAsyncOutput(const DLogOutputPtr& output, uint32_t queueLimit)
        : DLogOutput(output->getName()),
          m_output(output),
          m_queueLimit(queueLimit),
          m_stop(false),
          m_started(false),
          m_closed(false),
          m_dropBurst(false),
          m_failing(false),
          m_submitCount(0),
          m_writeCount(0),
          m_failCount(0),
          m_dropCount(0) {}
    DLogAsyncOutput(const DLogAsyncOutput&) = delete;
    DLogAsyncOutput(DLogAsyncOutput&&) = delete;
    DLogAsyncOutput& operator=(const DLogAsyncOutput&) = delete;
    ~DLogAsyncOutput() final;

    /** @brief Starts the worker thread. */
    bool start();

    /** @brief Queues a shared record for delivery. Never blocks on the wrapped output. */
    void submit(const DLogRecordPtr& logRecord);

    /** @brief Queues a copy of the record for delivery. */
    DLogErrorCode write(const DLogRecord& logRecord, std::string* errorMsg = nullptr) final;

    /**
     * @brief Stops accepting records, delivers the remaining queue, stops the worker thread and
     * closes the wrapped output.
     */
    DLogErrorCode close(std::string* errorMsg = nullptr) final;

    /** @brief Retrieves the wrapped output. */
    inline const DLogOutputPtr& getOutput() const { return m_output; }

    /** @brief Queries whether all submitted records were processed (written or failed). */
    inline bool isCaughtUp() const {
        return m_submitCount.load(std::memory_order_relaxed) ==
               m_writeCount.load(std::memory_order_relaxed) +
                   m_failCount.load(std::memory_order_relaxed);
    }

    inline uint64_t getSubmitCount() const { return m_submitCount.load(std::memory_order_relaxed); }
    inline uint64_t getWriteCount() const { return m_writeCount.load(std::memory_order_relaxed); }
    inline uint64_t getFailCount() const { return m_failCount.load(std::memory_order_relaxed); }
    inline uint64_t getDropCount() const { return m_dropCount.load(std::memory_order_relaxed); }

private:
    typedef std::list<DLogRecordPtr> RecordQueue;

    DLogOutputPtr m_output;
    uint32_t m_queueLimit;
    std::thread m_writeThread;
    RecordQueue m_queue;
    std::mutex m_lock;
    std::condition_variable m_cv;
    bool m_stop;
    bool m_started;
    bool m_closed;
    bool m_dropBurst;
    bool m_failing;

    std::atomic<uint64_t> m_submitCount;
    std::atomic<uint64_t> m_writeCount;
    std::atomic<uint64_t> m_failCount;
    std::atomic<uint64_t> m_dropCount;

    void writeThread();

    void writeQueue(RecordQueue& queue);

    void stopWriteThread();
};

}  // namespace dlog

#endif  // __DLOG_ASYNC_OUTPUT_H__

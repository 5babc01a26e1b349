#ifndef __DLOG_HTTP_OUTPUT_H__
#define __DLOG_HTTP_OUTPUT_H__

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "dlog_def.h"
#include "dlog_http_client.h"
#include "dlog_output.h"

namespace dlog {

/**
 * @brief Batching webhook output. Records are buffered in memory and POSTed as a JSON array,
 * either when the buffer reaches the batch size, or periodically by a background flusher. A batch
 * that fails delivery is dropped.
 */
class DLOG_API DLogHttpOutput : public DLogOutput {
public:
    /**
     * @brief Construct a new HTTP output object.
     * @param name The output name (for reporting purposes).
     * @param url The webhook URL.
     * @param authToken Optional bearer token.
     * @param batchSize The batch size that triggers immediate flush.
     * @param flushIntervalSeconds The periodic flush interval in seconds.
     * @param httpConfig HTTP client timeouts.
     */
    DLogHttpOutput(const char* name, const std::string& url, const std::string& authToken,
                   uint32_t batchSize, uint32_t flushIntervalSeconds,
                   const DLogHttpConfig& httpConfig = DLogHttpConfig());
    DLogHttpOutput(const DLogHttpOutput&) = delete;
    DLogHttpOutput(DLogHttpOutput&&) = delete;
    DLogHttpOutput& operator=(const DLogHttpOutput&) = delete;
    ~DLogHttpOutput() final;

    /** @brief Parses the URL, creates the HTTP client and starts the background flusher. */
    DLogErrorCode start(std::string* errorMsg = nullptr);

    /** @brief Appends a record to the batch buffer. Never waits for network I/O. */
    DLogErrorCode write(const DLogRecord& logRecord, std::string* errorMsg = nullptr) final;

    /**
     * @brief Stops the flusher, performs one final flush, and waits for it to complete.
     * @return DLOG_E_HTTP_ERROR if a batch was dropped while closing.
     */
    DLogErrorCode close(std::string* errorMsg = nullptr) final;

    /** @brief Retrieves the number of successfully delivered batches. */
    inline uint64_t getSentBatchCount() const {
        return m_sentBatchCount.load(std::memory_order_relaxed);
    }

    /** @brief Retrieves the number of dropped (failed) batches. */
    inline uint64_t getFailedBatchCount() const {
        return m_failedBatchCount.load(std::memory_order_relaxed);
    }

    /** @brief Retrieves the number of records in dropped batches. */
    inline uint64_t getDroppedRecordCount() const {
        return m_droppedRecordCount.load(std::memory_order_relaxed);
    }

private:
    class AuthAssistant : public DLogHttpClientAssistant {
    public:
        AuthAssistant(const char* outputName, const std::string& authToken)
            : DLogHttpClientAssistant(outputName), m_authToken(authToken) {}
        ~AuthAssistant() final {}

        void embedHeaders(httplib::Headers& headers) final;

    private:
        std::string m_authToken;
    };

    std::string m_url;
    std::string m_serverAddress;
    std::string m_endpoint;
    uint32_t m_batchSize;
    uint32_t m_flushIntervalSeconds;
    DLogHttpConfig m_httpConfig;
    AuthAssistant m_assistant;
    DLogHttpClient m_client;

    std::vector<DLogRecord> m_buffer;
    std::mutex m_lock;
    std::condition_variable m_cv;
    bool m_flushRequested;
    bool m_stop;
    bool m_started;
    bool m_closed;
    std::thread m_flushThread;

    std::atomic<uint64_t> m_sentBatchCount;
    std::atomic<uint64_t> m_failedBatchCount;
    std::atomic<uint64_t> m_droppedRecordCount;

    void flushThread();

    void flushBatch(std::vector<DLogRecord>& batch);
};

}  // namespace dlog

#endif  // __DLOG_HTTP_OUTPUT_H__

#include "dlog_http_output.h"

#include <chrono>

#include "dlog_common.h"
#include "dlog_report.h"

namespace dlog {

DLOG_DECLARE_REPORT_LOGGER(DLogHttpOutput)

void DLogHttpOutput::AuthAssistant::embedHeaders(httplib::Headers& headers) {
    if (!m_authToken.empty()) {
        headers.insert(httplib::Headers::value_type("Authorization", "Bearer " + m_authToken));
    }
}

DLogHttpOutput::DLogHttpOutput(const char* name, const std::string& url,
                               const std::string& authToken, uint32_t batchSize,
                               uint32_t flushIntervalSeconds,
                               const DLogHttpConfig& httpConfig /* = DLogHttpConfig() */)
    : DLogOutput(name),
      m_url(url),
      m_batchSize(batchSize == 0 ? 1 : batchSize),
      m_flushIntervalSeconds(flushIntervalSeconds == 0 ? 1 : flushIntervalSeconds),
      m_httpConfig(httpConfig),
      m_assistant(name, authToken),
      m_flushRequested(false),
      m_stop(false),
      m_started(false),
      m_closed(false),
      m_sentBatchCount(0),
      m_failedBatchCount(0),
      m_droppedRecordCount(0) {}

DLogHttpOutput::~DLogHttpOutput() { (void)close(); }

DLogErrorCode DLogHttpOutput::start(std::string* errorMsg /* = nullptr */) {
    if (m_started) {
        return DLOG_E_OK;
    }
    if (!parseUrl(m_url, m_serverAddress, m_endpoint)) {
        DLOG_REPORT_ERROR("Invalid HTTP output URL: %s", m_url.c_str());
        if (errorMsg != nullptr) {
            *errorMsg = "invalid URL: " + m_url;
        }
        return DLOG_E_INVALID_ARGUMENT;
    }
    m_client.initialize(m_serverAddress.c_str(), getName(), m_httpConfig, &m_assistant);
    if (!m_client.start()) {
        if (errorMsg != nullptr) {
            *errorMsg = "failed to create HTTP client for " + m_serverAddress;
        }
        return DLOG_E_HTTP_ERROR;
    }
    m_buffer.reserve(m_batchSize);
    m_flushThread = std::thread(&DLogHttpOutput::flushThread, this);
    m_started = true;
    return DLOG_E_OK;
}

DLogErrorCode DLogHttpOutput::write(const DLogRecord& logRecord,
                                    std::string* errorMsg /* = nullptr */) {
    std::unique_lock<std::mutex> lock(m_lock);
    if (m_closed || !m_started) {
        if (errorMsg != nullptr) {
            *errorMsg = "HTTP output is closed";
        }
        return DLOG_E_CLOSED;
    }
    m_buffer.push_back(logRecord);
    if (m_buffer.size() >= m_batchSize) {
        // flush takes place in the background, so the caller never waits for the round-trip
        m_flushRequested = true;
        m_cv.notify_one();
    }
    return DLOG_E_OK;
}

DLogErrorCode DLogHttpOutput::close(std::string* errorMsg /* = nullptr */) {
    uint64_t failedBatchCount = 0;
    {
        std::unique_lock<std::mutex> lock(m_lock);
        failedBatchCount = m_failedBatchCount.load(std::memory_order_relaxed);
        if (m_closed) {
            return DLOG_E_OK;
        }
        m_closed = true;
        m_stop = true;
        m_cv.notify_one();
    }

    // flusher performs final flush before terminating
    if (m_flushThread.joinable()) {
        m_flushThread.join();
    }
    m_client.stop();

    // the final flush result is the only delivery failure visible to the caller
    if (m_failedBatchCount.load(std::memory_order_relaxed) > failedBatchCount) {
        if (errorMsg != nullptr) {
            *errorMsg = "failed to deliver pending log records to " + m_url;
        }
        return DLOG_E_HTTP_ERROR;
    }
    return DLOG_E_OK;
}

void DLogHttpOutput::flushThread() {
    // delivery failures are reported to stderr only, never back into the dispatch path
    DLOG_SCOPED_DEFAULT_REPORT();
    std::vector<DLogRecord> batch;
    batch.reserve(m_batchSize);
    bool stop = false;
    while (!stop) {
        {
            std::unique_lock<std::mutex> lock(m_lock);
            m_cv.wait_for(lock, std::chrono::seconds(m_flushIntervalSeconds),
                          [this] { return m_stop || m_flushRequested; });
            stop = m_stop;
            m_flushRequested = false;
            batch.swap(m_buffer);
        }

        // POST outside of lock scope (allow writers to keep buffering)
        if (!batch.empty()) {
            flushBatch(batch);
            batch.clear();
        }
    }
}

void DLogHttpOutput::flushBatch(std::vector<DLogRecord>& batch) {
    std::string body;
    try {
        nlohmann::json payload = nlohmann::json::array();
        for (const DLogRecord& logRecord : batch) {
            payload.push_back(dlogRecordToJson(logRecord));
        }
        body = payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    } catch (const nlohmann::json::exception& e) {
        DLOG_REPORT_ERROR("Failed to serialize HTTP batch of %zu records for %s: %s", batch.size(),
                          getName(), e.what());
        m_failedBatchCount.fetch_add(1, std::memory_order_relaxed);
        m_droppedRecordCount.fetch_add(batch.size(), std::memory_order_relaxed);
        return;
    }

    std::string errorMsg;
    std::pair<bool, int> res =
        m_client.post(m_endpoint.c_str(), body.c_str(), body.length(), "application/json",
                      &errorMsg);
    if (!res.first) {
        // no retry, the batch is dropped
        DLOG_REPORT_ERROR("Dropping HTTP batch of %zu records for %s: %s", batch.size(), getName(),
                          errorMsg.c_str());
        m_failedBatchCount.fetch_add(1, std::memory_order_relaxed);
        m_droppedRecordCount.fetch_add(batch.size(), std::memory_order_relaxed);
        return;
    }
    m_sentBatchCount.fetch_add(1, std::memory_order_relaxed);
}

}  // namespace dlog

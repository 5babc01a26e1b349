#ifndef __DLOG_TEST_COMMON_H__
#define __DLOG_TEST_COMMON_H__

#include <gtest/gtest.h>
#include <httplib.h>

#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "db/dlog_target_store.h"
#include "dlog_logger.h"
#include "dlog_manager.h"
#include "dlog_output.h"
#include "dlog_settings.h"
#include "dlog_target_config.h"

#define DLOG_TEST_WAIT_MILLIS 5000

// host logger used by tests (console output to stderr)
extern dlog::DLogLogger* sTestLogger;

extern bool initTestEnv();
extern void termTestEnv();

/** @brief Polls a condition until it holds or the timeout expires. */
extern bool waitFor(const std::function<bool()>& cond,
                    uint32_t timeoutMillis = DLOG_TEST_WAIT_MILLIS);

/** @brief Builds a valid syslog target configuration. */
extern dlog::DLogTargetConfig makeSyslogConfig(const std::string& name, const std::string& host,
                                               int port, const std::string& protocol = "tcp");

/** @brief Builds a valid HTTP target configuration. */
extern dlog::DLogTargetConfig makeHttpConfig(const std::string& name, const std::string& url);

class DLogEnvironment : public ::testing::Environment {
public:
    ~DLogEnvironment() override {}

    // Override this to define how to set up the environment.
    void SetUp() override { initTestEnv(); }

    // Override this to define how to tear down the environment.
    void TearDown() override { termTestEnv(); }
};

/** @brief Local syslog collector over TCP or UDP, capturing received lines. */
class TestSyslogServer {
public:
    TestSyslogServer(bool useUdp = false)
        : m_useUdp(useUdp), m_listenSocket(-1), m_port(0), m_stop(false), m_connectionCount(0) {}
    TestSyslogServer(const TestSyslogServer&) = delete;
    TestSyslogServer(TestSyslogServer&&) = delete;
    TestSyslogServer& operator=(const TestSyslogServer&) = delete;
    ~TestSyslogServer() { stop(); }

    /** @brief Binds to an ephemeral loopback port and starts receiving. */
    bool start();

    void stop();

    /** @brief Drops all accepted connections (TCP only), the listener keeps running. */
    void dropConnections();

    inline int getPort() const { return m_port; }

    inline uint32_t getConnectionCount() const {
        return m_connectionCount.load(std::memory_order_relaxed);
    }

    std::vector<std::string> getLines();

    void clearLines();

    bool waitForLines(size_t lineCount, uint32_t timeoutMillis = DLOG_TEST_WAIT_MILLIS);

private:
    bool m_useUdp;
    int m_listenSocket;
    int m_port;
    std::atomic<bool> m_stop;
    std::atomic<uint32_t> m_connectionCount;
    std::thread m_acceptThread;
    std::vector<std::thread> m_clientThreads;
    std::vector<int> m_clientSockets;
    std::vector<std::string> m_lines;
    std::mutex m_lock;
    std::condition_variable m_cv;

    void acceptLoop();
    void udpLoop();
    void clientLoop(int clientSocket);
    void addLine(const std::string& line);
};

/** @brief Local webhook sink recording request bodies and authorization headers. */
class TestWebhookServer {
public:
    TestWebhookServer() : m_port(0), m_responseStatus(200) {}
    TestWebhookServer(const TestWebhookServer&) = delete;
    TestWebhookServer(TestWebhookServer&&) = delete;
    TestWebhookServer& operator=(const TestWebhookServer&) = delete;
    ~TestWebhookServer() { stop(); }

    bool start();

    void stop();

    /** @brief Retrieves the webhook URL (path "/logs"). */
    std::string getUrl() const;

    /** @brief Sets the HTTP status returned for subsequent requests. */
    inline void setResponseStatus(int status) {
        m_responseStatus.store(status, std::memory_order_relaxed);
    }

    std::vector<std::string> getBodies();

    std::vector<std::string> getAuthHeaders();

    std::vector<std::string> getContentTypes();

    bool waitForRequests(size_t requestCount, uint32_t timeoutMillis = DLOG_TEST_WAIT_MILLIS);

private:
    httplib::Server m_server;
    int m_port;
    std::atomic<int> m_responseStatus;
    std::thread m_serverThread;
    std::vector<std::string> m_bodies;
    std::vector<std::string> m_authHeaders;
    std::vector<std::string> m_contentTypes;
    std::mutex m_lock;
    std::condition_variable m_cv;
};

/** @brief An output capturing written records in memory. */
class TestCaptureOutput : public dlog::DLogOutput {
public:
    TestCaptureOutput(const char* name = "capture")
        : DLogOutput(name), m_failWrites(false), m_writeDelayMillis(0), m_closeCount(0) {}
    TestCaptureOutput(const TestCaptureOutput&) = delete;
    TestCaptureOutput(TestCaptureOutput&&) = delete;
    TestCaptureOutput& operator=(const TestCaptureOutput&) = delete;
    ~TestCaptureOutput() final {}

    dlog::DLogErrorCode write(const dlog::DLogRecord& logRecord,
                              std::string* errorMsg = nullptr) final;

    dlog::DLogErrorCode close(std::string* errorMsg = nullptr) final;

    inline void setFailWrites(bool failWrites) {
        m_failWrites.store(failWrites, std::memory_order_relaxed);
    }

    inline void setWriteDelayMillis(uint32_t delayMillis) {
        m_writeDelayMillis.store(delayMillis, std::memory_order_relaxed);
    }

    inline uint32_t getCloseCount() const { return m_closeCount.load(std::memory_order_relaxed); }

    std::vector<std::string> getMessages();

    std::vector<dlog::DLogLevel> getLevels();

    size_t getRecordCount();

    bool waitForRecords(size_t recordCount, uint32_t timeoutMillis = DLOG_TEST_WAIT_MILLIS);

private:
    std::atomic<bool> m_failWrites;
    std::atomic<uint32_t> m_writeDelayMillis;
    std::atomic<uint32_t> m_closeCount;
    std::vector<dlog::DLogRecord> m_records;
    std::mutex m_lock;
};

/**
 * @brief Manager creating capture outputs for all targets. Targets whose host is
 * "unreachable.invalid" fail to be created.
 */
class TestManager : public dlog::DLogManager {
public:
    TestManager(const dlog::DLogParams& params = dlog::DLogParams())
        : DLogManager(params), m_createCount(0) {}
    TestManager(const TestManager&) = delete;
    TestManager(TestManager&&) = delete;
    TestManager& operator=(const TestManager&) = delete;
    ~TestManager() override {}

    inline uint32_t getCreateCount() const { return m_createCount.load(std::memory_order_relaxed); }

    /** @brief Retrieves the capture output most recently created for a target. */
    std::shared_ptr<TestCaptureOutput> getCapture(const std::string& id);

    /** @brief Creates an output directly (no reconciliation). */
    inline dlog::DLogErrorCode createTestOutput(const dlog::DLogTargetConfig& config,
                                                dlog::DLogOutputPtr& output,
                                                std::string* errorMsg = nullptr) {
        return createOutput(config, output, errorMsg);
    }

protected:
    dlog::DLogErrorCode createOutput(const dlog::DLogTargetConfig& config,
                                     dlog::DLogOutputPtr& output, std::string* errorMsg) override;

private:
    std::atomic<uint32_t> m_createCount;
    std::map<std::string, std::shared_ptr<TestCaptureOutput>> m_captures;
    std::mutex m_lock;
};

#endif  // __DLOG_TEST_COMMON_H__

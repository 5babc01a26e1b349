#include "dlog_test_common.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>

dlog::DLogLogger* sTestLogger = nullptr;

bool initTestEnv() {
    sTestLogger = new (std::nothrow) dlog::DLogLogger(stderr);
    if (sTestLogger == nullptr) {
        fprintf(stderr, "Failed to create test logger, out of memory\n");
        return false;
    }
    sTestLogger->setLogLevel(dlog::DLEVEL_INFO);
    return true;
}

void termTestEnv() {
    if (sTestLogger != nullptr) {
        delete sTestLogger;
        sTestLogger = nullptr;
    }
}

bool waitFor(const std::function<bool()>& cond,
             uint32_t timeoutMillis /* = DLOG_TEST_WAIT_MILLIS */) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMillis);
    while (!cond()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return cond();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

dlog::DLogTargetConfig makeSyslogConfig(const std::string& name, const std::string& host, int port,
                                        const std::string& protocol /* = "tcp" */) {
    dlog::DLogTargetConfig config;
    config.m_name = name;
    config.m_type = DLOG_TARGET_TYPE_SYSLOG;
    config.m_enabled = true;
    config.m_protocol = protocol;
    config.m_host = host;
    config.m_port = port;
    config.m_tag = "dlogtest";
    config.m_format = DLOG_SYSLOG_FORMAT_RFC3164;
    config.m_filterLevel = "debug";
    return config;
}

dlog::DLogTargetConfig makeHttpConfig(const std::string& name, const std::string& url) {
    dlog::DLogTargetConfig config;
    config.m_name = name;
    config.m_type = DLOG_TARGET_TYPE_HTTP;
    config.m_enabled = true;
    config.m_url = url;
    config.m_filterLevel = "debug";
    config.m_batchSize = 10;
    config.m_flushIntervalSeconds = 1;
    return config;
}

bool TestSyslogServer::start() {
    m_listenSocket = socket(AF_INET, m_useUdp ? SOCK_DGRAM : SOCK_STREAM, 0);
    if (m_listenSocket == -1) {
        perror("socket");
        return false;
    }
    int reuse = 1;
    setsockopt(m_listenSocket, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    sockaddr_in addr = {};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    if (bind(m_listenSocket, (sockaddr*)&addr, sizeof(addr)) == -1) {
        perror("bind");
        ::close(m_listenSocket);
        m_listenSocket = -1;
        return false;
    }
    socklen_t addrLen = sizeof(addr);
    if (getsockname(m_listenSocket, (sockaddr*)&addr, &addrLen) == -1) {
        perror("getsockname");
        ::close(m_listenSocket);
        m_listenSocket = -1;
        return false;
    }
    m_port = ntohs(addr.sin_port);

    if (m_useUdp) {
        m_acceptThread = std::thread(&TestSyslogServer::udpLoop, this);
    } else {
        if (listen(m_listenSocket, 16) == -1) {
            perror("listen");
            ::close(m_listenSocket);
            m_listenSocket = -1;
            return false;
        }
        m_acceptThread = std::thread(&TestSyslogServer::acceptLoop, this);
    }
    return true;
}

void TestSyslogServer::stop() {
    if (m_listenSocket == -1) {
        return;
    }
    m_stop.store(true);
    if (m_acceptThread.joinable()) {
        m_acceptThread.join();
    }
    // accept thread is gone, client thread list is stable (each client thread closes its socket)
    for (std::thread& clientThread : m_clientThreads) {
        clientThread.join();
    }
    m_clientThreads.clear();
    ::close(m_listenSocket);
    m_listenSocket = -1;
}

void TestSyslogServer::dropConnections() {
    std::unique_lock<std::mutex> lock(m_lock);
    for (int clientSocket : m_clientSockets) {
        shutdown(clientSocket, SHUT_RDWR);
    }
}

std::vector<std::string> TestSyslogServer::getLines() {
    std::unique_lock<std::mutex> lock(m_lock);
    return m_lines;
}

void TestSyslogServer::clearLines() {
    std::unique_lock<std::mutex> lock(m_lock);
    m_lines.clear();
}

bool TestSyslogServer::waitForLines(size_t lineCount,
                                    uint32_t timeoutMillis /* = DLOG_TEST_WAIT_MILLIS */) {
    std::unique_lock<std::mutex> lock(m_lock);
    return m_cv.wait_for(lock, std::chrono::milliseconds(timeoutMillis),
                         [this, lineCount] { return m_lines.size() >= lineCount; });
}

void TestSyslogServer::acceptLoop() {
    while (!m_stop.load()) {
        pollfd pfd = {m_listenSocket, POLLIN, 0};
        int res = poll(&pfd, 1, 50);
        if (res <= 0 || (pfd.revents & POLLIN) == 0) {
            continue;
        }
        int clientSocket = accept(m_listenSocket, nullptr, nullptr);
        if (clientSocket == -1) {
            continue;
        }
        std::unique_lock<std::mutex> lock(m_lock);
        m_clientSockets.push_back(clientSocket);
        m_clientThreads.push_back(std::thread(&TestSyslogServer::clientLoop, this, clientSocket));
        m_connectionCount.fetch_add(1, std::memory_order_relaxed);
    }
}

void TestSyslogServer::udpLoop() {
    char buf[65536];
    while (!m_stop.load()) {
        pollfd pfd = {m_listenSocket, POLLIN, 0};
        int res = poll(&pfd, 1, 50);
        if (res <= 0 || (pfd.revents & POLLIN) == 0) {
            continue;
        }
        ssize_t len = recvfrom(m_listenSocket, buf, sizeof(buf), 0, nullptr, nullptr);
        if (len <= 0) {
            continue;
        }
        std::string line(buf, (size_t)len);
        if (!line.empty() && line.back() == '\n') {
            line.pop_back();
        }
        addLine(line);
    }
}

void TestSyslogServer::clientLoop(int clientSocket) {
    std::string pending;
    char buf[4096];
    while (!m_stop.load()) {
        pollfd pfd = {clientSocket, POLLIN, 0};
        int res = poll(&pfd, 1, 50);
        if (res == 0) {
            continue;
        }
        if (res < 0) {
            break;
        }
        ssize_t len = recv(clientSocket, buf, sizeof(buf), 0);
        if (len <= 0) {
            break;
        }
        pending.append(buf, (size_t)len);
        std::string::size_type pos = pending.find('\n');
        while (pos != std::string::npos) {
            addLine(pending.substr(0, pos));
            pending.erase(0, pos + 1);
            pos = pending.find('\n');
        }
    }

    std::unique_lock<std::mutex> lock(m_lock);
    m_clientSockets.erase(std::remove(m_clientSockets.begin(), m_clientSockets.end(), clientSocket),
                          m_clientSockets.end());
    ::close(clientSocket);
}

void TestSyslogServer::addLine(const std::string& line) {
    std::unique_lock<std::mutex> lock(m_lock);
    m_lines.push_back(line);
    m_cv.notify_all();
}

bool TestWebhookServer::start() {
    m_server.Post("/logs", [this](const httplib::Request& req, httplib::Response& res) {
        {
            std::unique_lock<std::mutex> lock(m_lock);
            m_bodies.push_back(req.body);
            m_authHeaders.push_back(req.get_header_value("Authorization"));
            m_contentTypes.push_back(req.get_header_value("Content-Type"));
        }
        m_cv.notify_all();
        res.status = m_responseStatus.load(std::memory_order_relaxed);
        res.set_content("{}", "application/json");
    });
    m_port = m_server.bind_to_any_port("127.0.0.1");
    if (m_port <= 0) {
        fprintf(stderr, "Failed to bind webhook test server\n");
        return false;
    }
    m_serverThread = std::thread([this]() { m_server.listen_after_bind(); });
    m_server.wait_until_ready();
    return true;
}

void TestWebhookServer::stop() {
    if (m_serverThread.joinable()) {
        m_server.stop();
        m_serverThread.join();
    }
}

std::string TestWebhookServer::getUrl() const {
    return "http://127.0.0.1:" + std::to_string(m_port) + "/logs";
}

std::vector<std::string> TestWebhookServer::getBodies() {
    std::unique_lock<std::mutex> lock(m_lock);
    return m_bodies;
}

std::vector<std::string> TestWebhookServer::getAuthHeaders() {
    std::unique_lock<std::mutex> lock(m_lock);
    return m_authHeaders;
}

std::vector<std::string> TestWebhookServer::getContentTypes() {
    std::unique_lock<std::mutex> lock(m_lock);
    return m_contentTypes;
}

bool TestWebhookServer::waitForRequests(size_t requestCount,
                                        uint32_t timeoutMillis /* = DLOG_TEST_WAIT_MILLIS */) {
    std::unique_lock<std::mutex> lock(m_lock);
    return m_cv.wait_for(lock, std::chrono::milliseconds(timeoutMillis),
                         [this, requestCount] { return m_bodies.size() >= requestCount; });
}

dlog::DLogErrorCode TestCaptureOutput::write(const dlog::DLogRecord& logRecord,
                                             std::string* errorMsg /* = nullptr */) {
    uint32_t delayMillis = m_writeDelayMillis.load(std::memory_order_relaxed);
    if (delayMillis > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(delayMillis));
    }
    if (m_failWrites.load(std::memory_order_relaxed)) {
        if (errorMsg != nullptr) {
            *errorMsg = "capture output write failure";
        }
        return dlog::DLOG_E_NET_ERROR;
    }
    std::unique_lock<std::mutex> lock(m_lock);
    m_records.push_back(logRecord);
    return dlog::DLOG_E_OK;
}

dlog::DLogErrorCode TestCaptureOutput::close(std::string* errorMsg /* = nullptr */) {
    (void)errorMsg;
    m_closeCount.fetch_add(1, std::memory_order_relaxed);
    return dlog::DLOG_E_OK;
}

std::vector<std::string> TestCaptureOutput::getMessages() {
    std::unique_lock<std::mutex> lock(m_lock);
    std::vector<std::string> messages;
    for (const dlog::DLogRecord& logRecord : m_records) {
        messages.push_back(logRecord.m_logMsg);
    }
    return messages;
}

std::vector<dlog::DLogLevel> TestCaptureOutput::getLevels() {
    std::unique_lock<std::mutex> lock(m_lock);
    std::vector<dlog::DLogLevel> levels;
    for (const dlog::DLogRecord& logRecord : m_records) {
        levels.push_back(logRecord.m_logLevel);
    }
    return levels;
}

size_t TestCaptureOutput::getRecordCount() {
    std::unique_lock<std::mutex> lock(m_lock);
    return m_records.size();
}

bool TestCaptureOutput::waitForRecords(size_t recordCount,
                                       uint32_t timeoutMillis /* = DLOG_TEST_WAIT_MILLIS */) {
    return waitFor([this, recordCount]() { return getRecordCount() >= recordCount; },
                   timeoutMillis);
}

std::shared_ptr<TestCaptureOutput> TestManager::getCapture(const std::string& id) {
    std::unique_lock<std::mutex> lock(m_lock);
    auto itr = m_captures.find(id);
    if (itr == m_captures.end()) {
        return nullptr;
    }
    return itr->second;
}

dlog::DLogErrorCode TestManager::createOutput(const dlog::DLogTargetConfig& config,
                                              dlog::DLogOutputPtr& output, std::string* errorMsg) {
    m_createCount.fetch_add(1, std::memory_order_relaxed);
    if (config.m_type.compare(DLOG_TARGET_TYPE_SYSLOG) != 0 &&
        config.m_type.compare(DLOG_TARGET_TYPE_HTTP) != 0) {
        return DLogManager::createOutput(config, output, errorMsg);
    }
    if (config.m_host.compare("unreachable.invalid") == 0) {
        if (errorMsg != nullptr) {
            *errorMsg = "failed to connect to unreachable.invalid";
        }
        return dlog::DLOG_E_NET_ERROR;
    }
    std::shared_ptr<TestCaptureOutput> capture =
        std::make_shared<TestCaptureOutput>(config.m_name.c_str());
    {
        std::unique_lock<std::mutex> lock(m_lock);
        m_captures[config.m_id] = capture;
    }
    output = capture;
    return dlog::DLOG_E_OK;
}

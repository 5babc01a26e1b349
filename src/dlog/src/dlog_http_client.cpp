#include "dlog_http_client.h"

#include <chrono>

#include "dlog_report.h"

namespace dlog {

DLOG_DECLARE_REPORT_LOGGER(DLogHttpClient)

bool DLogHttpClientAssistant::handleResult(const httplib::Result& result) {
    if (result->status < 200 || result->status > 299) {
        DLOG_REPORT_ERROR("Received error status %d from %s server, body: %s, reason: %s",
                          result->status, m_outputName.c_str(), result->body.c_str(),
                          result->reason.c_str());
        return false;
    }
    return true;
}

void DLogHttpClient::initialize(const char* serverAddress, const char* outputName,
                                const DLogHttpConfig& httpConfig,
                                DLogHttpClientAssistant* assistant /* = nullptr */) {
    // save configuration
    m_serverAddress = serverAddress;
    m_outputName = outputName;
    m_config = httpConfig;
    m_assistant = assistant;
}

bool DLogHttpClient::start() {
    m_client = createClient();
    return m_client != nullptr;
}

bool DLogHttpClient::stop() {
    if (m_client != nullptr) {
        delete m_client;
        m_client = nullptr;
    }
    return true;
}

std::pair<bool, int> DLogHttpClient::post(const char* endpoint, const char* body, size_t len,
                                          const char* contentType /* = "application/json" */,
                                          std::string* errorMsg /* = nullptr */) {
    if (m_client == nullptr) {
        if (errorMsg != nullptr) {
            *errorMsg = "HTTP client is not started";
        }
        return {false, -1};
    }

    // start with assistant headers
    httplib::Headers headers;
    if (m_assistant != nullptr) {
        m_assistant->embedHeaders(headers);
    }

    DLOG_REPORT_DEBUG("Sending %zu bytes to %s at HTTP server %s%s", len, m_outputName.c_str(),
                      m_serverAddress.c_str(), endpoint);
    httplib::Result res = m_client->Post(endpoint, headers, body, len, contentType);
    if (!res) {
        std::string errorStr = httplib::to_string(res.error());
        DLOG_REPORT_ERROR("Failed to POST HTTP request to %s: %s", m_outputName.c_str(),
                          errorStr.c_str());
        if (errorMsg != nullptr) {
            *errorMsg = "HTTP request failed: " + errorStr;
        }
        return {false, -1};  // no status when result evaluates to false
    }

    DLOG_REPORT_DEBUG("%s server returned HTTP status: %d", m_outputName.c_str(), res->status);
    bool success = (m_assistant != nullptr) ? m_assistant->handleResult(res)
                                            : (res->status >= 200 && res->status <= 299);
    if (!success && errorMsg != nullptr) {
        *errorMsg = "HTTP request returned status " + std::to_string(res->status);
    }
    return {success, res->status};
}

httplib::Client* DLogHttpClient::createClient() {
    DLOG_REPORT_DEBUG("Creating HTTP client to %s server at: %s", m_outputName.c_str(),
                      m_serverAddress.c_str());
    httplib::Client* client = new (std::nothrow) httplib::Client(m_serverAddress);
    if (client == nullptr) {
        DLOG_REPORT_ERROR("Failed to allocate HTTP client, out of memory");
        return nullptr;
    }
    if (!client->is_valid()) {
        DLOG_REPORT_ERROR("HTTP connection to %s server at %s is not valid", m_outputName.c_str(),
                          m_serverAddress.c_str());
        delete client;
        return nullptr;
    }

    // set connection timeouts
    client->set_connection_timeout(std::chrono::milliseconds(m_config.m_connectTimeoutMillis));
    client->set_write_timeout(std::chrono::milliseconds(m_config.m_writeTimeoutMillis));
    client->set_read_timeout(std::chrono::milliseconds(m_config.m_readTimeoutMillis));
    return client;
}

}  // namespace dlog

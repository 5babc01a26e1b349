#ifndef __DLOG_HTTP_CLIENT_H__
#define __DLOG_HTTP_CLIENT_H__

#include <httplib.h>

#include <string>
#include <utility>

#include "dlog_def.h"
#include "dlog_http_config.h"

namespace dlog {

/** @brief An assistant to carry out HTTP client operations. */
class DLOG_API DLogHttpClientAssistant {
public:
    virtual ~DLogHttpClientAssistant() {}
    DLogHttpClientAssistant(const DLogHttpClientAssistant&) = delete;
    DLogHttpClientAssistant(DLogHttpClientAssistant&&) = delete;
    DLogHttpClientAssistant& operator=(const DLogHttpClientAssistant&) = delete;

    /** @brief Embed headers in outgoing HTTP message. */
    virtual void embedHeaders(httplib::Headers& headers) {}

    /**
     * @brief Handles HTTP result. By default any 2xx status is regarded as success.
     * @param result The result to examine.
     * @return True if the result is regarded as success.
     */
    virtual bool handleResult(const httplib::Result& result);

protected:
    /**
     * @brief Construct a new assistant object.
     * @param outputName The output name (for error reporting purposes).
     */
    DLogHttpClientAssistant(const char* outputName) : m_outputName(outputName) {}

private:
    std::string m_outputName;
};

/** @brief Sends log data over HTTP. No resend takes place, failed messages are discarded. */
class DLOG_API DLogHttpClient {
public:
    DLogHttpClient() : m_client(nullptr), m_assistant(nullptr) {}
    DLogHttpClient(const DLogHttpClient&) = delete;
    DLogHttpClient(DLogHttpClient&&) = delete;
    DLogHttpClient& operator=(const DLogHttpClient&) = delete;
    ~DLogHttpClient() { stop(); }

    /**
     * @brief Initializes the HTTP client.
     * @param serverAddress The HTTP server address (scheme://host[:port]).
     * @param outputName The output name (for logging purposes).
     * @param httpConfig Timeouts configuration.
     * @param assistant Optional assistant in carrying out client operations.
     */
    void initialize(const char* serverAddress, const char* outputName,
                    const DLogHttpConfig& httpConfig, DLogHttpClientAssistant* assistant = nullptr);

    /** @brief Starts the HTTP client. */
    bool start();

    /** @brief Stops the HTTP client. */
    bool stop();

    /**
     * @brief Sends HTTP message to a given endpoint (using HTTP POST).
     * @param endpoint The endpoint. Expected resource path starting with forward slash.
     * @param body The message's body.
     * @param len The message's length.
     * @param contentType The message's content type.
     * @param[out] errorMsg Optionally receives failure description.
     * @return std::pair<bool, int> A pair denoting whether message sending was successful and the
     * HTTP status returned by the server (-1 on transport error).
     */
    std::pair<bool, int> post(const char* endpoint, const char* body, size_t len,
                              const char* contentType = "application/json",
                              std::string* errorMsg = nullptr);

private:
    std::string m_serverAddress;
    std::string m_outputName;
    DLogHttpConfig m_config;
    httplib::Client* m_client;
    DLogHttpClientAssistant* m_assistant;

    httplib::Client* createClient();
};

}  // namespace dlog

#endif  // __DLOG_HTTP_CLIENT_H__

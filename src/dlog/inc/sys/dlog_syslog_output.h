#ifndef __DLOG_SYSLOG_OUTPUT_H__
#define __DLOG_SYSLOG_OUTPUT_H__

#include <openssl/ssl.h>

#include <cstdint>
#include <mutex>
#include <string>

#include "dlog_def.h"
#include "dlog_output.h"
#include "dlog_target_config.h"

namespace dlog {

/**
 * @brief Remote syslog output. Maintains a single persistent connection (TCP, UDP or TLS over TCP)
 * to a syslog collector, and formats each record as RFC 3164 or RFC 5424. On write failure the
 * connection is re-established once and the write is retried once.
 */
class DLOG_API DLogSyslogOutput : public DLogOutput {
public:
    /**
     * @brief Construct a new syslog output object (no connection is made yet).
     * @param config The syslog target configuration.
     * @param facility The syslog facility.
     * @param connectTimeoutMillis Connect (and send) timeout in milliseconds.
     */
    DLogSyslogOutput(const DLogTargetConfig& config, int facility, uint32_t connectTimeoutMillis);
    DLogSyslogOutput(const DLogSyslogOutput&) = delete;
    DLogSyslogOutput(DLogSyslogOutput&&) = delete;
    DLogSyslogOutput& operator=(const DLogSyslogOutput&) = delete;
    ~DLogSyslogOutput() final;

    /** @brief Makes the initial connection to the syslog collector. */
    DLogErrorCode connect(std::string* errorMsg = nullptr);

    /** @brief Formats and sends a record. Concurrent writes are serialized. */
    DLogErrorCode write(const DLogRecord& logRecord, std::string* errorMsg = nullptr) final;

    /** @brief Closes the connection. Subsequent writes fail without reconnecting. */
    DLogErrorCode close(std::string* errorMsg = nullptr) final;

    /** @brief Queries whether the output currently has a live connection. */
    bool isConnected();

    /** @brief Computes syslog priority value (facility * 8 + severity). */
    static int computePriority(int facility, DLogLevel logLevel);

    /**
     * @brief Formats a record as a syslog line (including terminating new line).
     * @param logRecord The log record.
     * @param format The syslog format ("rfc3164" or "rfc5424").
     * @param facility The syslog facility.
     * @param tag The syslog tag.
     * @param hostName The host name (RFC 5424 only, "-" is used when empty).
     * @param pid The process id.
     */
    static std::string formatMessage(const DLogRecord& logRecord, const std::string& format,
                                     int facility, const std::string& tag,
                                     const std::string& hostName, int pid);

    /** @brief Formats record fields as RFC 5424 structured data ("-" if there are no fields). */
    static std::string formatStructuredData(const DLogRecord& logRecord, const std::string& tag);

private:
    std::string m_protocol;
    std::string m_host;
    int m_port;
    std::string m_tag;
    std::string m_format;
    bool m_useTls;
    std::string m_tlsCert;
    std::string m_tlsKey;
    std::string m_tlsCA;
    bool m_tlsSkipVerify;
    int m_facility;
    uint32_t m_connectTimeoutMillis;

    int m_socket;
    SSL_CTX* m_sslCtx;
    SSL* m_ssl;
    bool m_closed;
    std::mutex m_lock;

    DLogErrorCode dial(std::string* errorMsg);
    DLogErrorCode connectSocket(std::string* errorMsg);
    DLogErrorCode initTls(std::string* errorMsg);
    DLogErrorCode connectTls(std::string* errorMsg);
    void closeConnection();
    DLogErrorCode sendMsg(const std::string& msg, std::string* errorMsg);
};

}  // namespace dlog

#endif  // __DLOG_SYSLOG_OUTPUT_H__

#ifndef __DLOG_TARGET_CONFIG_H__
#define __DLOG_TARGET_CONFIG_H__

#include <cstdint>
#include <string>

#include "dlog_def.h"
#include "dlog_error.h"

/** @def Target types. */
#define DLOG_TARGET_TYPE_SYSLOG "syslog"
#define DLOG_TARGET_TYPE_HTTP "http"

/** @def Syslog transport protocols. */
#define DLOG_SYSLOG_PROTOCOL_TCP "tcp"
#define DLOG_SYSLOG_PROTOCOL_UDP "udp"
#define DLOG_SYSLOG_PROTOCOL_TLS "tcp+tls"

/** @def Syslog message formats. */
#define DLOG_SYSLOG_FORMAT_RFC3164 "rfc3164"
#define DLOG_SYSLOG_FORMAT_RFC5424 "rfc5424"

/** @def Target configuration defaults. */
#define DLOG_TARGET_DEFAULT_PROTOCOL DLOG_SYSLOG_PROTOCOL_TCP
#define DLOG_TARGET_DEFAULT_PORT 514
#define DLOG_TARGET_DEFAULT_TAG "dlog"
#define DLOG_TARGET_DEFAULT_FORMAT DLOG_SYSLOG_FORMAT_RFC3164
#define DLOG_TARGET_DEFAULT_FILTER_LEVEL "info"
#define DLOG_TARGET_DEFAULT_BATCH_SIZE 100
#define DLOG_TARGET_DEFAULT_FLUSH_INTERVAL_SECONDS 10

namespace dlog {

/** @struct Persisted configuration of a single logging target. */
struct DLOG_API DLogTargetConfig {
    /** @brief Target identifier (generated when empty on creation). */
    std::string m_id;

    /** @brief Unique target name. */
    std::string m_name;

    /** @brief Target type ("syslog" or "http"). */
    std::string m_type;

    /** @brief Specifies whether the target is active. */
    bool m_enabled;

    /** @brief Syslog transport protocol ("tcp", "udp" or "tcp+tls"). */
    std::string m_protocol;

    /** @brief Syslog collector host name or address. */
    std::string m_host;

    /** @brief Syslog collector port. */
    int m_port;

    /** @brief Syslog tag (application name). */
    std::string m_tag;

    /** @brief Syslog message format ("rfc3164" or "rfc5424"). */
    std::string m_format;

    /** @brief Specifies whether TLS is used for the syslog connection. */
    bool m_tlsEnabled;

    /** @brief PEM encoded client certificate. */
    std::string m_tlsCert;

    /** @brief PEM encoded client private key. */
    std::string m_tlsKey;

    /** @brief PEM encoded CA certificate(s). */
    std::string m_tlsCA;

    /** @brief Disables server certificate verification. */
    bool m_tlsSkipVerify;

    /** @brief Minimum level forwarded to the target ("debug", "info", "warn" or "error"). */
    std::string m_filterLevel;

    /** @brief Optional bearer token for HTTP targets. */
    std::string m_authToken;

    /** @brief HTTP endpoint URL. */
    std::string m_url;

    /** @brief HTTP batch size (zero means default). */
    int m_batchSize;

    /** @brief HTTP flush interval in seconds (zero means default). */
    int m_flushIntervalSeconds;

    /** @brief Creation time (epoch seconds). */
    int64_t m_createdAt;

    /** @brief Last update time (epoch seconds). */
    int64_t m_updatedAt;

    DLogTargetConfig()
        : m_enabled(false),
          m_port(0),
          m_tlsEnabled(false),
          m_tlsSkipVerify(false),
          m_batchSize(0),
          m_flushIntervalSeconds(0),
          m_createdAt(0),
          m_updatedAt(0) {}
};

/**
 * @brief Validates a target configuration, stopping at the first violation.
 * @param config The configuration to validate.
 * @param[out] errorMsg Optionally receives a description naming the offending field.
 * @return DLOG_E_OK if the configuration is valid, otherwise DLOG_E_INVALID_ARGUMENT.
 */
extern DLOG_API DLogErrorCode dlogValidateTargetConfig(const DLogTargetConfig& config,
                                                       std::string* errorMsg = nullptr);

/**
 * @brief Queries whether two configurations of the same target differ in a way that requires the
 * output to be recreated. The filter level is excluded, as it is reapplied without reconnecting.
 */
extern DLOG_API bool dlogTargetConfigChanged(const DLogTargetConfig& oldConfig,
                                             const DLogTargetConfig& newConfig);

}  // namespace dlog

#endif  // __DLOG_TARGET_CONFIG_H__

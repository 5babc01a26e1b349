#include "dlog_target_config.h"

#include "dlog_level.h"

namespace dlog {

static DLogErrorCode reportInvalid(const char* reason, std::string* errorMsg) {
    if (errorMsg != nullptr) {
        *errorMsg = reason;
    }
    return DLOG_E_INVALID_ARGUMENT;
}

DLogErrorCode dlogValidateTargetConfig(const DLogTargetConfig& config,
                                       std::string* errorMsg /* = nullptr */) {
    if (config.m_name.empty()) {
        return reportInvalid("target name is required", errorMsg);
    }

    if (config.m_type == DLOG_TARGET_TYPE_SYSLOG) {
        if (config.m_host.empty()) {
            return reportInvalid("host is required for syslog targets", errorMsg);
        }
        if (config.m_port < 1 || config.m_port > 65535) {
            return reportInvalid("port must be between 1 and 65535", errorMsg);
        }
        if (config.m_protocol != DLOG_SYSLOG_PROTOCOL_TCP &&
            config.m_protocol != DLOG_SYSLOG_PROTOCOL_UDP &&
            config.m_protocol != DLOG_SYSLOG_PROTOCOL_TLS) {
            return reportInvalid("invalid protocol", errorMsg);
        }
        if (config.m_format != DLOG_SYSLOG_FORMAT_RFC3164 &&
            config.m_format != DLOG_SYSLOG_FORMAT_RFC5424) {
            return reportInvalid("invalid format", errorMsg);
        }
    } else if (config.m_type == DLOG_TARGET_TYPE_HTTP) {
        if (config.m_url.empty()) {
            return reportInvalid("URL is required for HTTP targets", errorMsg);
        }
    } else {
        return reportInvalid("invalid target type", errorMsg);
    }

    if (!dlogIsValidFilterLevel(config.m_filterLevel.c_str())) {
        return reportInvalid("invalid filter level", errorMsg);
    }
    return DLOG_E_OK;
}

bool dlogTargetConfigChanged(const DLogTargetConfig& oldConfig, const DLogTargetConfig& newConfig) {
    // NOTE: filter level is not compared, it is applied through the dispatch snapshot
    return oldConfig.m_type != newConfig.m_type || oldConfig.m_protocol != newConfig.m_protocol ||
           oldConfig.m_host != newConfig.m_host || oldConfig.m_port != newConfig.m_port ||
           oldConfig.m_tag != newConfig.m_tag || oldConfig.m_format != newConfig.m_format ||
           oldConfig.m_tlsEnabled != newConfig.m_tlsEnabled ||
           oldConfig.m_tlsCert != newConfig.m_tlsCert ||
           oldConfig.m_tlsKey != newConfig.m_tlsKey || oldConfig.m_tlsCA != newConfig.m_tlsCA ||
           oldConfig.m_tlsSkipVerify != newConfig.m_tlsSkipVerify ||
           oldConfig.m_url != newConfig.m_url || oldConfig.m_authToken != newConfig.m_authToken ||
           oldConfig.m_batchSize != newConfig.m_batchSize ||
           oldConfig.m_flushIntervalSeconds != newConfig.m_flushIntervalSeconds;
}

}  // namespace dlog

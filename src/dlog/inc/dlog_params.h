#ifndef __DLOG_PARAMS_H__
#define __DLOG_PARAMS_H__

#include <cstdint>

#include "dlog_def.h"
#include "dlog_http_config.h"
#include "dlog_target_config.h"

/** @def By default wait for 10 seconds before declaring syslog connection failure. */
#define DLOG_DEFAULT_CONNECT_TIMEOUT_MILLIS 10000

/** @def By default each output can have up to 10000 records pending delivery. */
#define DLOG_DEFAULT_ASYNC_QUEUE_LIMIT 10000

/** @def Syslog facility used for all messages (daemon). */
#define DLOG_DEFAULT_SYSLOG_FACILITY 3

namespace dlog {

/** @struct Logging target manager parameters. */
struct DLOG_API DLogParams {
    /** @brief Syslog connect timeout in milliseconds. */
    uint32_t m_connectTimeoutMillis;

    /** @brief HTTP client timeouts. */
    DLogHttpConfig m_httpConfig;

    /**
     * @brief Maximum number of records pending asynchronous delivery per output. Records arriving
     * when the queue is full are dropped. Zero means unbounded.
     */
    uint32_t m_asyncQueueLimit;

    /** @brief HTTP batch size used when a target specifies none. */
    uint32_t m_defaultBatchSize;

    /** @brief HTTP flush interval (seconds) used when a target specifies none. */
    uint32_t m_defaultFlushIntervalSeconds;

    /** @brief Syslog facility (daemon by default). */
    int m_syslogFacility;

    DLogParams()
        : m_connectTimeoutMillis(DLOG_DEFAULT_CONNECT_TIMEOUT_MILLIS),
          m_asyncQueueLimit(DLOG_DEFAULT_ASYNC_QUEUE_LIMIT),
          m_defaultBatchSize(DLOG_TARGET_DEFAULT_BATCH_SIZE),
          m_defaultFlushIntervalSeconds(DLOG_TARGET_DEFAULT_FLUSH_INTERVAL_SECONDS),
          m_syslogFacility(DLOG_DEFAULT_SYSLOG_FACILITY) {}
};

}  // namespace dlog

#endif  // __DLOG_PARAMS_H__

#ifndef __DLOG_HTTP_CONFIG_H__
#define __DLOG_HTTP_CONFIG_H__

#include <cstdint>

#include "dlog_def.h"

/** @def By default wait for 10 seconds before declaring connection failure. */
#define DLOG_HTTP_DEFAULT_CONNECT_TIMEOUT_MILLIS 10000

/** @def By default wait for 10 seconds before declaring write failure. */
#define DLOG_HTTP_DEFAULT_WRITE_TIMEOUT_MILLIS 10000

/** @def By default wait for 10 seconds before declaring read failure. */
#define DLOG_HTTP_DEFAULT_READ_TIMEOUT_MILLIS 10000

namespace dlog {

/** @brief Pack all HTTP client timeouts in one place. */
struct DLOG_API DLogHttpConfig {
    /** @brief The timeout for HTTP connect to be declared as failed. */
    uint32_t m_connectTimeoutMillis;

    /** @brief The timeout for HTTP write to be declared as failed. */
    uint32_t m_writeTimeoutMillis;

    /** @brief The timeout for HTTP read to be declared as failed. */
    uint32_t m_readTimeoutMillis;

    DLogHttpConfig()
        : m_connectTimeoutMillis(DLOG_HTTP_DEFAULT_CONNECT_TIMEOUT_MILLIS),
          m_writeTimeoutMillis(DLOG_HTTP_DEFAULT_WRITE_TIMEOUT_MILLIS),
          m_readTimeoutMillis(DLOG_HTTP_DEFAULT_READ_TIMEOUT_MILLIS) {}
};

}  // namespace dlog

#endif  // __DLOG_HTTP_CONFIG_H__

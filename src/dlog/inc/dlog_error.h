#ifndef __DLOG_ERROR_H__
#define __DLOG_ERROR_H__

#include <cstdint>

#include "dlog_def.h"

namespace dlog {

/** @enum Error codes returned by fallible dlog operations. */
enum DLogErrorCode : uint32_t {
    /** @var Operation succeeded. */
    DLOG_E_OK,

    /** @var Invalid argument (e.g. target configuration failed validation). */
    DLOG_E_INVALID_ARGUMENT,

    /** @var Requested object (e.g. logging target) was not found. */
    DLOG_E_NOT_FOUND,

    /** @var Object already exists (e.g. duplicate target name). */
    DLOG_E_ALREADY_EXISTS,

    /** @var Database operation failed. */
    DLOG_E_DB_ERROR,

    /** @var Network operation failed (resolve, connect, send). */
    DLOG_E_NET_ERROR,

    /** @var TLS setup or handshake failed. */
    DLOG_E_TLS_ERROR,

    /** @var HTTP request failed or returned non-success status. */
    DLOG_E_HTTP_ERROR,

    /** @var Output or connection is closed. */
    DLOG_E_CLOSED,

    /** @var Operation is not allowed in current object state. */
    DLOG_E_INVALID_STATE,

    /** @var Out of memory. */
    DLOG_E_NOMEM,

    /** @var Internal error. */
    DLOG_E_INTERNAL_ERROR
};

/** @brief Converts error code to string. */
extern DLOG_API const char* dlogErrorCodeToString(DLogErrorCode rc);

}  // namespace dlog

#endif  // __DLOG_ERROR_H__

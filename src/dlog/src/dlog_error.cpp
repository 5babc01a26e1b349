#include "dlog_error.h"

namespace dlog {

const char* dlogErrorCodeToString(DLogErrorCode rc) {
    switch (rc) {
        case DLOG_E_OK:
            return "No error";
        case DLOG_E_INVALID_ARGUMENT:
            return "Invalid argument";
        case DLOG_E_NOT_FOUND:
            return "Not found";
        case DLOG_E_ALREADY_EXISTS:
            return "Already exists";
        case DLOG_E_DB_ERROR:
            return "Database error";
        case DLOG_E_NET_ERROR:
            return "Network error";
        case DLOG_E_TLS_ERROR:
            return "TLS error";
        case DLOG_E_HTTP_ERROR:
            return "HTTP error";
        case DLOG_E_CLOSED:
            return "Closed";
        case DLOG_E_INVALID_STATE:
            return "Invalid state";
        case DLOG_E_NOMEM:
            return "Out of memory";
        case DLOG_E_INTERNAL_ERROR:
            return "Internal error";
        default:
            return "N/A";
    }
}

}  // namespace dlog

#include "dlog_level.h"

#include <strings.h>

#include <cstring>

namespace dlog {

static DLogLevel gLogLevels[] = {DLEVEL_PANIC,  DLEVEL_FATAL, DLEVEL_ERROR, DLEVEL_WARN,
                                 DLEVEL_NOTICE, DLEVEL_INFO,  DLEVEL_DEBUG};

static const char* gLogLevelStr[] = {"panic", "fatal", "error", "warn",
                                     "notice", "info", "debug"};

static const uint32_t gLogLevelCount = sizeof(gLogLevels) / sizeof(gLogLevels[0]);
static const uint32_t gLogLevelStrCount = sizeof(gLogLevelStr) / sizeof(gLogLevelStr[0]);

static_assert(gLogLevelCount == gLogLevelStrCount);

const char* dlogLevelToStr(DLogLevel logLevel) {
    for (uint32_t i = 0; i < gLogLevelCount; ++i) {
        if (gLogLevels[i] == logLevel) {
            return gLogLevelStr[i];
        }
    }
    return "N/A";
}

bool dlogLevelFromStr(const char* logLevelStr, DLogLevel& logLevel) {
    if (logLevelStr == nullptr) {
        return false;
    }
    if (strcasecmp(logLevelStr, "warning") == 0) {
        logLevel = DLEVEL_WARN;
        return true;
    }
    for (uint32_t i = 0; i < gLogLevelCount; ++i) {
        if (strcasecmp(logLevelStr, gLogLevelStr[i]) == 0) {
            logLevel = gLogLevels[i];
            return true;
        }
    }
    return false;
}

DLogLevel dlogLevelFromStrDefault(const char* logLevelStr) {
    DLogLevel logLevel = DLEVEL_INFO;
    if (!dlogLevelFromStr(logLevelStr, logLevel)) {
        return DLEVEL_INFO;
    }
    return logLevel;
}

bool dlogIsValidFilterLevel(const char* filterLevelStr) {
    if (filterLevelStr == nullptr) {
        return false;
    }
    return strcmp(filterLevelStr, "debug") == 0 || strcmp(filterLevelStr, "info") == 0 ||
           strcmp(filterLevelStr, "warn") == 0 || strcmp(filterLevelStr, "error") == 0;
}

}  // namespace dlog

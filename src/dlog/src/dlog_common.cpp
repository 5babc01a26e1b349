#include "dlog_common.h"

#include <pthread.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cinttypes>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <random>

namespace dlog {

void formatStringV(std::string& str, const char* fmt, va_list args) {
    char buf[512];
    va_list argsCopy;
    va_copy(argsCopy, args);
    int len = vsnprintf(buf, sizeof(buf), fmt, argsCopy);
    va_end(argsCopy);
    if (len < 0) {
        str.clear();
    } else if ((size_t)len < sizeof(buf)) {
        str.assign(buf, len);
    } else {
        str.resize(len + 1);
        vsnprintf(&str[0], len + 1, fmt, args);
        str.resize(len);
    }
}

void appendFormat(std::string& str, const char* fmt, ...) {
    std::string tmp;
    va_list args;
    va_start(args, fmt);
    formatStringV(tmp, fmt, args);
    va_end(args);
    str.append(tmp);
}

const std::string& getHostName() {
    static const std::string sHostName = []() {
        char buf[256];
        if (gethostname(buf, sizeof(buf)) != 0) {
            return std::string();
        }
        buf[sizeof(buf) - 1] = 0;
        return std::string(buf);
    }();
    return sHostName;
}

std::string generateUuid() {
    static thread_local std::mt19937_64 sGen(std::random_device{}());
    uint64_t hi = sGen();
    uint64_t lo = sGen();

    // version 4, variant 10xx
    hi = (hi & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    lo = (lo & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;

    char buf[37];
    snprintf(buf, sizeof(buf), "%08" PRIx64 "-%04" PRIx64 "-%04" PRIx64 "-%04" PRIx64 "-%012" PRIx64,
             hi >> 32, (hi >> 16) & 0xFFFF, hi & 0xFFFF, lo >> 48, lo & 0xFFFFFFFFFFFFull);
    return buf;
}

std::string strToLower(const std::string& str) {
    std::string res = str;
    std::transform(res.begin(), res.end(), res.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return res;
}

bool parseBool(const std::string& str, bool& value) {
    std::string lower = strToLower(str);
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        value = true;
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        value = false;
        return true;
    }
    return false;
}

bool parseInt64(const std::string& str, int64_t& value) {
    if (str.empty()) {
        return false;
    }
    char* endPtr = nullptr;
    errno = 0;
    long long res = strtoll(str.c_str(), &endPtr, 10);
    if (errno != 0 || endPtr == str.c_str() || *endPtr != 0) {
        return false;
    }
    value = (int64_t)res;
    return true;
}

bool parseUrl(const std::string& url, std::string& serverAddress, std::string& path) {
    std::string::size_type schemePos = url.find("://");
    if (schemePos == std::string::npos || schemePos == 0) {
        return false;
    }
    std::string scheme = strToLower(url.substr(0, schemePos));
    if (scheme != "http" && scheme != "https") {
        return false;
    }
    std::string::size_type hostPos = schemePos + 3;
    std::string::size_type pathPos = url.find_first_of("/?#", hostPos);
    if (pathPos == hostPos) {
        // no host
        return false;
    }
    if (pathPos == std::string::npos) {
        serverAddress = url;
        path = "/";
    } else {
        serverAddress = url.substr(0, pathPos);
        path = url.substr(pathPos);
        if (path[0] != '/') {
            path.insert(0, "/");
        }
    }
    return true;
}

SigPipeGuard::SigPipeGuard() : m_wasPending(false), m_blocked(false) {
    sigset_t pending;
    sigemptyset(&pending);
    if (sigpending(&pending) == 0) {
        m_wasPending = sigismember(&pending, SIGPIPE);
    }
    sigset_t blockMask;
    sigemptyset(&blockMask);
    sigaddset(&blockMask, SIGPIPE);
    m_blocked = (pthread_sigmask(SIG_BLOCK, &blockMask, &m_oldMask) == 0);
}

SigPipeGuard::~SigPipeGuard() {
    if (!m_blocked) {
        return;
    }
    // consume any SIGPIPE raised meanwhile, unless it was pending before
    if (!m_wasPending) {
        sigset_t pending;
        sigemptyset(&pending);
        if (sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE)) {
            sigset_t sigPipeMask;
            sigemptyset(&sigPipeMask);
            sigaddset(&sigPipeMask, SIGPIPE);
            struct timespec zeroTimeout = {0, 0};
            while (sigtimedwait(&sigPipeMask, nullptr, &zeroTimeout) == -1 && errno == EINTR) {
            }
        }
    }
    pthread_sigmask(SIG_SETMASK, &m_oldMask, nullptr);
}

}  // namespace dlog

#ifndef __DLOG_COMMON_H__
#define __DLOG_COMMON_H__

#include <signal.h>
#include <sys/syscall.h>
#include <unistd.h>

#include <cstdarg>
#include <cstdint>
#include <string>

#include "dlog_def.h"

#ifdef SYS_gettid
#define gettid() syscall(SYS_gettid)
#else
#error "SYS_gettid unavailable on this platform"
#endif

namespace dlog {

inline uint64_t getCurrentThreadId() { return (uint64_t)gettid(); }

/** @brief Formats a printf-style message into a string (replacing its contents). */
extern void formatStringV(std::string& str, const char* fmt, va_list args);

/** @brief Appends a printf-style formatted message to a string. */
extern void appendFormat(std::string& str, const char* fmt, ...);

/** @brief Retrieves the (cached) host name of the machine. */
extern const std::string& getHostName();

/** @brief Retrieves the current process id. */
inline int getProcessId() { return (int)getpid(); }

/** @brief Generates a random (version 4) UUID in canonical text form. */
extern std::string generateUuid();

/** @brief Converts a string to lower case. */
extern std::string strToLower(const std::string& str);

/** @brief Parses a boolean string ("true/false", "yes/no", "on/off", "1/0"). */
extern bool parseBool(const std::string& str, bool& value);

/** @brief Parses a (whole) string as a signed 64 bit integer. */
extern bool parseInt64(const std::string& str, int64_t& value);

/**
 * @brief Splits a URL into server address (scheme://host[:port]) and resource path (including
 * query, starting with forward slash).
 */
extern bool parseUrl(const std::string& url, std::string& serverAddress, std::string& path);

/**
 * @brief Blocks SIGPIPE for the current thread for the life time of the object, and discards any
 * SIGPIPE raised meanwhile (e.g. by writing into a broken TLS connection).
 */
class SigPipeGuard {
public:
    SigPipeGuard();
    SigPipeGuard(const SigPipeGuard&) = delete;
    SigPipeGuard(SigPipeGuard&&) = delete;
    SigPipeGuard& operator=(const SigPipeGuard&) = delete;
    ~SigPipeGuard();

private:
    sigset_t m_oldMask;
    bool m_wasPending;
    bool m_blocked;
};

}  // namespace dlog

#endif  // __DLOG_COMMON_H__

#ifndef __DLOG_DEF_H__
#define __DLOG_DEF_H__

// clang settings
#ifdef __clang__
#define DLOG_CLANG
#if defined(__linux__)
#define DLOG_LINUX
#define DLOG_API __attribute__((visibility("default")))
#else
#error "Unsupported platform"
#endif

// Linux/gcc settings
#elif defined(__linux__)
#define DLOG_LINUX
#define DLOG_GCC
#define DLOG_API __attribute__((visibility("default")))
#else
#error "Unsupported platform"
#endif

#define DLOG_CPP_VER __cplusplus

// define fallthrough attribute
#if (DLOG_CPP_VER >= 201703L)
#define DLOG_FALLTHROUGH [[fallthrough]]
#else
#define DLOG_FALLTHROUGH
#endif

/** @def Define a unified function name macro */
#ifdef DLOG_GCC
#define DLOG_FUNCTION __PRETTY_FUNCTION__
#else
#define DLOG_FUNCTION __func__
#endif

#endif  // __DLOG_DEF_H__

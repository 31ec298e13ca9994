#ifndef __DEBUG_HPP_
#define __DEBUG_HPP_

#include "logger.hpp"

class DebugLogger {
public:
	static inline Logger *console_log = nullptr;
	static inline Logger *system_log = nullptr;
};

#ifdef DEBUG_ENABLE

#ifdef DEBUG_TO_SYSTEMLOG
#define __DEBUG_LOG(level, fmt, ...) \
	do { \
		if (DebugLogger::console_log) DebugLogger::console_log->level(fmt, ##__VA_ARGS__); \
		if (DebugLogger::system_log && DebugLogger::system_log->is_ready()) DebugLogger::system_log->level(fmt, ##__VA_ARGS__); \
	} while (0)
#else
#define __DEBUG_LOG(level, fmt, ...) \
	do { \
		if (DebugLogger::console_log) DebugLogger::console_log->level(fmt, ##__VA_ARGS__); \
	} while (0)
#endif

#if (DEBUG_LEVEL >= 1)
#define DEBUG_ERROR(fmt, ...) __DEBUG_LOG(error, fmt, ##__VA_ARGS__)
#else
#define DEBUG_ERROR(fmt, ...)
#endif

#if (DEBUG_LEVEL >= 2)
#define DEBUG_WARN(fmt, ...) __DEBUG_LOG(warn, fmt, ##__VA_ARGS__)
#else
#define DEBUG_WARN(fmt, ...)
#endif

#if (DEBUG_LEVEL >= 3)
#define DEBUG_INFO(fmt, ...) __DEBUG_LOG(info, fmt, ##__VA_ARGS__)
#else
#define DEBUG_INFO(fmt, ...)
#endif

// NOTE: TRACE never goes to the system log, it is emitted from the timer and
// provider callback contexts
#if (DEBUG_LEVEL >= 4)
#define DEBUG_TRACE(fmt, ...) \
	do { \
		if (DebugLogger::console_log) DebugLogger::console_log->trace(fmt, ##__VA_ARGS__); \
	} while (0)
#else
#define DEBUG_TRACE(fmt, ...)
#endif

#else

#define DEBUG_ERROR(fmt, ...)
#define DEBUG_WARN(fmt, ...)
#define DEBUG_INFO(fmt, ...)
#define DEBUG_TRACE(fmt, ...)

#endif

#endif // __DEBUG_HPP_

#pragma once

#include <string>
#include <cstring>
#include <stdint.h>
#include <stdio.h>
#include <stdarg.h>

#include "messages.hpp"


enum LogLevel {
	LOG_LEVEL_OFF,
	LOG_LEVEL_ERROR,
	LOG_LEVEL_WARN,
	LOG_LEVEL_INFO,
	LOG_LEVEL_DEBUG
};


class LogFormatter {
public:
	virtual ~LogFormatter() {}
	virtual const std::string header() = 0;
	virtual const std::string log_entry(const LogEntry& e) = 0;
};

class Logger {

private:
	int m_log_level = LOG_LEVEL_DEBUG;

	void vlog(LogType type, const char *msg, va_list args);

public:
	virtual ~Logger() {}

	static void sync_datetime(LogHeader &header);

	void set_log_level(int level);
	void warn(const char *msg, ...);
	void error(const char *msg, ...);
	void info(const char *msg, ...);
	void trace(const char *msg, ...);

	virtual void write(void *) = 0;
	virtual void read(void *, int index = 0) = 0;
	virtual unsigned int num_entries() = 0;
	virtual bool is_ready() = 0;
};

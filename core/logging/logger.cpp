#include "debug.hpp"
#include "logger.hpp"
#include "rtc.hpp"
#include "timeutils.hpp"

extern RTC *rtc;


void Logger::sync_datetime(LogHeader &header) {
#ifdef DEBUG_USING_RTC
	if (rtc) {
		uint16_t year;
		convert_datetime_to_epoch(rtc->gettime(), year, header.month, header.day, header.hours, header.minutes, header.seconds);
		header.year = year;
	}
	else
#endif
	{
		header.year = header.month = header.day = header.hours = header.minutes = header.seconds = 0;
	}
}

void Logger::set_log_level(int level) {
	m_log_level = level;
}

void Logger::vlog(LogType type, const char *msg, va_list args) {
	LogEntry buffer;
	vsnprintf(reinterpret_cast<char*>(buffer.data), sizeof(buffer.data), msg, args);
	buffer.header.log_type = type;
	buffer.header.payload_size = std::strlen(reinterpret_cast<char*>(buffer.data));
	sync_datetime(buffer.header);
	write(&buffer);
}

void Logger::warn(const char *msg, ...) {
	if (m_log_level >= LOG_LEVEL_WARN) {
		va_list args;
		va_start(args, msg);
		vlog(LOG_WARN, msg, args);
		va_end(args);
	}
}

void Logger::error(const char *msg, ...) {
	if (m_log_level >= LOG_LEVEL_ERROR) {
		va_list args;
		va_start(args, msg);
		vlog(LOG_ERROR, msg, args);
		va_end(args);
	}
}

void Logger::info(const char *msg, ...) {
	if (m_log_level >= LOG_LEVEL_INFO) {
		va_list args;
		va_start(args, msg);
		vlog(LOG_INFO, msg, args);
		va_end(args);
	}
}

void Logger::trace(const char *msg, ...) {
	if (m_log_level >= LOG_LEVEL_DEBUG) {
		va_list args;
		va_start(args, msg);
		vlog(LOG_TRACE, msg, args);
		va_end(args);
	}
}

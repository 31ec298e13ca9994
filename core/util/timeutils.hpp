#ifndef __TIMEUTILS_HPP_H
#define __TIMEUTILS_HPP_H

#include <ctime>
#include <cstring>
#include <stdint.h>

static inline void convert_datetime_to_epoch(std::time_t time, uint16_t &year, uint8_t &month, uint8_t &day, uint8_t &hour, uint8_t &min, uint8_t &sec)
{
	std::tm date_time;
	gmtime_r(&time, &date_time);

	day = date_time.tm_mday;
	month = date_time.tm_mon + 1;
	year = date_time.tm_year + 1900;
	hour = date_time.tm_hour;
	min = date_time.tm_min;
	sec = date_time.tm_sec;
}

#endif // __TIMEUTILS_HPP_H

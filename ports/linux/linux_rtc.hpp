#pragma once

#include <ctime>
#include "rtc.hpp"

// System wall clock, settime() applies an offset rather than changing the host clock
class LinuxRTC : public RTC {
public:
	LinuxRTC() : m_offset(0), m_is_set(false) {}

	std::time_t gettime() override {
		return std::time(nullptr) + m_offset;
	}
	void settime(std::time_t t) override {
		m_offset = t - std::time(nullptr);
		m_is_set = true;
	}
	bool is_set() override {
		return m_is_set;
	}

private:
	std::time_t m_offset;
	bool m_is_set;
};

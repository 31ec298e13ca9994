#pragma once

#include <cstring>
#include "logger.hpp"
#include "messages.hpp"

#define FAKE_LOG_MAX_ENTRIES  (256)

class FakeLog : public Logger {
private:
	LogEntry m_entry[FAKE_LOG_MAX_ENTRIES];
	unsigned int m_index;

public:

	FakeLog() : m_index(0) {}

	bool is_ready() override {
		return true;
	}

	void write(void *entry) override {
		std::memcpy(&m_entry[m_index++ % FAKE_LOG_MAX_ENTRIES], entry, sizeof(LogEntry));
	}

	void read(void *entry, int index=0) override {
		std::memcpy(entry, &m_entry[index % FAKE_LOG_MAX_ENTRIES], sizeof(LogEntry));
	}

	unsigned int num_entries() override {
		return m_index;
	}

	// Entries of one log type only, in write order
	unsigned int num_entries(LogType type) {
		unsigned int count = 0;
		for (unsigned int i = 0; i < m_index && i < FAKE_LOG_MAX_ENTRIES; i++)
			if (m_entry[i].header.log_type == type)
				count++;
		return count;
	}

	template <typename T>
	T read_last(LogType type) {
		T entry;
		std::memset(&entry, 0, sizeof(entry));
		for (unsigned int i = m_index; i > 0; i--) {
			if (m_entry[(i - 1) % FAKE_LOG_MAX_ENTRIES].header.log_type == type) {
				std::memcpy(&entry, &m_entry[(i - 1) % FAKE_LOG_MAX_ENTRIES], sizeof(T));
				break;
			}
		}
		return entry;
	}
};

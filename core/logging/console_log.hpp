#ifndef __CONSOLE_LOG_HPP_
#define __CONSOLE_LOG_HPP_

#include "logger.hpp"
#include "messages.hpp"
#include "error.hpp"


class ConsoleLog : public Logger {

private:
	void debug_formatter(const char *level, LogHeader *header, const char *msg) {
		printf("%02u/%02u/%04u %02u:%02u:%02u [%s]\t%s\r\n", header->day, header->month, header->year, header->hours, header->minutes, header->seconds, level, msg);
	}
	void fix_formatter(const FixLogEntry *entry) {
		const char *name = log_type_name[entry->header.log_type];
		if (entry->event_type == FixEventType::FIX)
			printf("[%s]\trequest: %u lat: %lf lon: %lf hAcc: %lf onTime: %u ms\r\n", name, (unsigned int)entry->request_id,
					entry->lat, entry->lon, entry->hAcc, (unsigned int)entry->onTime);
		else
			printf("[%s]\trequest: %u event: %d onTime: %u ms\r\n", name, (unsigned int)entry->request_id,
					static_cast<int>(entry->event_type), (unsigned int)entry->onTime);
	}
	void provider_formatter(const ProviderLogEntry *entry) {
		const char *name = log_type_name[entry->header.log_type];
		printf("[%s]\tstate: %s accuracy_hint: %lf pending: %u\r\n", name, provider_state_str(entry->state),
				entry->accuracy_hint, (unsigned int)entry->num_pending);
	}
	void authorization_formatter(const AuthorizationLogEntry *entry) {
		const char *name = log_type_name[entry->header.log_type];
		printf("[%s]\tstatus: %s\r\n", name, authorization_status_str(entry->status));
	}

public:
	bool is_ready() override { return true; }
	unsigned int num_entries() override { return 0; }
	void read(void *, int) override { }
	void write(void *entry) override {
		LogEntry *p = (LogEntry *)entry;
		switch (p->header.log_type) {
		case LOG_ERROR:
		case LOG_WARN:
		case LOG_INFO:
		case LOG_TRACE:
			debug_formatter(log_type_name[p->header.log_type], &p->header, (const char * )p->data);
			break;
		case LOG_FIX:
			fix_formatter((const FixLogEntry *)entry);
			break;
		case LOG_PROVIDER:
			provider_formatter((const ProviderLogEntry *)entry);
			break;
		case LOG_AUTHORIZATION:
			authorization_formatter((const AuthorizationLogEntry *)entry);
			break;
		default:
			// Not yet supported
			break;
		}
	}
};

#endif // __CONSOLE_LOG_HPP_

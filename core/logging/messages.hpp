#ifndef __MESSAGES_HPP_
#define __MESSAGES_HPP_

#include <stdint.h>
#include "base_types.hpp"

#define MAX_LOG_PAYLOAD    120

static constexpr const char *log_type_name[8] = {
	"FIX",
	"PROVIDER",
	"AUTHORIZATION",
	"ERROR",
	"WARN",
	"INFO",
	"TRACE"
};

enum LogType : uint8_t {
	LOG_FIX,
	LOG_PROVIDER,
	LOG_AUTHORIZATION,
	LOG_ERROR,
	LOG_WARN,
	LOG_INFO,
	LOG_TRACE
};

struct __attribute__((packed)) LogHeader {
	uint8_t  day;
	uint8_t  month;
	uint16_t year;
	uint8_t  hours;
	uint8_t  minutes;
	uint8_t  seconds;
	LogType  log_type;
	uint8_t  payload_size;
};

struct LogEntry {
	LogHeader header;
	union {
		uint8_t data[MAX_LOG_PAYLOAD];
	};
};

enum class FixEventType : uint8_t { FIX, TIMED_OUT, CANCELLED, RESTRICTED, PROVIDER_FAILURE };

// One entry per resolved one-shot request
struct __attribute__((packed)) FixLogEntry {
	LogHeader header;
	union {
		struct {
			FixEventType event_type;
			uint32_t     request_id;
			double       desired_accuracy;
			double       lat;
			double       lon;
			double       hAcc;
			uint32_t     onTime;            // ms from submission to resolution
			int32_t      provider_error;
		};
		uint8_t data[MAX_LOG_PAYLOAD];
	};
};

// One entry per provider power state transition
struct __attribute__((packed)) ProviderLogEntry {
	LogHeader header;
	union {
		struct {
			BaseProviderState state;
			double            accuracy_hint;
			uint32_t          num_pending;
		};
		uint8_t data[MAX_LOG_PAYLOAD];
	};
};

struct __attribute__((packed)) AuthorizationLogEntry {
	LogHeader header;
	union {
		struct {
			BaseAuthorizationStatus status;
		};
		uint8_t data[MAX_LOG_PAYLOAD];
	};
};

#endif // __MESSAGES_HPP_

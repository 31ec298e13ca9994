#ifndef __ERROR_HPP_
#define __ERROR_HPP_

enum ErrorCode : int {
	// Request outcomes, delivered to the request callback
	LOCATION_RESTRICTED,
	LOCATION_TIMED_OUT,
	LOCATION_CANCELLED,
	LOCATION_PROVIDER_FAILURE,

	// Thrown
	BAD_PARAMETER,
	DUPLICATE_REQUEST_ID,
	SCHEDULER_QUEUE_FULL,
	RESOURCE_NOT_AVAILABLE
};

static inline const char *error_code_str(ErrorCode e) {
	switch (e) {
	case LOCATION_RESTRICTED:
		return "RESTRICTED";
	case LOCATION_TIMED_OUT:
		return "TIMED_OUT";
	case LOCATION_CANCELLED:
		return "CANCELLED";
	case LOCATION_PROVIDER_FAILURE:
		return "PROVIDER_FAILURE";
	case BAD_PARAMETER:
		return "BAD_PARAMETER";
	case DUPLICATE_REQUEST_ID:
		return "DUPLICATE_REQUEST_ID";
	case SCHEDULER_QUEUE_FULL:
		return "SCHEDULER_QUEUE_FULL";
	case RESOURCE_NOT_AVAILABLE:
		return "RESOURCE_NOT_AVAILABLE";
	default:
		return "UNKNOWN";
	}
}

#endif // __ERROR_HPP_

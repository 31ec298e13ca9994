#pragma once

#include <cstdint>

// Power state of the location provider as driven by the LocationScheduler
enum class BaseProviderState : uint8_t {
	IDLE,
	LOW_POWER,
	ACTIVE
};

// Residual power state while only continuous tracking demand remains
enum class BaseTrackingMode : uint8_t {
	LOW_POWER,
	ACTIVE
};

enum class BaseAuthorizationStatus : uint8_t {
	NOT_DETERMINED,
	NOT_AVAILABLE,   // Location services disabled system wide
	RESTRICTED,
	DENIED,
	ALLOWED_WHILE_IN_USE,
	ALLOWED_ALWAYS
};

static inline bool authorization_is_forbidden(BaseAuthorizationStatus status) {
	return status == BaseAuthorizationStatus::RESTRICTED ||
		   status == BaseAuthorizationStatus::DENIED ||
		   status == BaseAuthorizationStatus::NOT_AVAILABLE;
}

static inline bool authorization_is_allowed(BaseAuthorizationStatus status) {
	return status == BaseAuthorizationStatus::ALLOWED_WHILE_IN_USE ||
		   status == BaseAuthorizationStatus::ALLOWED_ALWAYS;
}

static inline const char *provider_state_str(BaseProviderState state) {
	switch (state) {
	case BaseProviderState::IDLE:
		return "IDLE";
	case BaseProviderState::LOW_POWER:
		return "LOW_POWER";
	case BaseProviderState::ACTIVE:
		return "ACTIVE";
	default:
		return "UNKNOWN";
	}
}

static inline const char *authorization_status_str(BaseAuthorizationStatus status) {
	switch (status) {
	case BaseAuthorizationStatus::NOT_DETERMINED:
		return "Not Determined";
	case BaseAuthorizationStatus::NOT_AVAILABLE:
		return "Not Available";
	case BaseAuthorizationStatus::RESTRICTED:
		return "Restricted";
	case BaseAuthorizationStatus::DENIED:
		return "Denied";
	case BaseAuthorizationStatus::ALLOWED_WHILE_IN_USE:
		return "When In Use";
	case BaseAuthorizationStatus::ALLOWED_ALWAYS:
		return "Allowed Always";
	default:
		return "Unknown";
	}
}

#pragma once

#include <ctime>
#include "base_types.hpp"
#include "events.hpp"

struct LocationSample {
	double      latitude;              // Degrees
	double      longitude;             // Degrees
	double      altitude;              // m
	double      horizontal_accuracy;   // m, <= 0 means no fix
	double      vertical_accuracy;     // m
	double      speed;                 // m/s
	double      course;                // Degrees
	std::time_t timestamp;
};

// A sample only counts as a fix once the provider reports a positive accuracy
static inline bool sample_is_fix(const LocationSample& sample) {
	return sample.horizontal_accuracy > 0;
}

// Strict inequality: a sample exactly at the threshold does not satisfy it
static inline bool sample_satisfies(const LocationSample& sample, double desired_accuracy) {
	return sample_is_fix(sample) && sample.horizontal_accuracy < desired_accuracy;
}

struct ProviderSettings {
	double desired_accuracy;   // m
	double distance_filter;    // m, 0 = no filter
};

struct LocationEventSample {
	const LocationSample& sample;
	LocationEventSample(const LocationSample& a) : sample(a) {}
};
struct LocationEventError {
	int error_code;
	LocationEventError(int a) : error_code(a) {}
};
struct LocationEventAuthorization {
	BaseAuthorizationStatus status;
	LocationEventAuthorization(BaseAuthorizationStatus a) : status(a) {}
};

class LocationProviderEventListener {
public:
	virtual ~LocationProviderEventListener() {}
	virtual void react(const LocationEventSample&) {}
	virtual void react(const LocationEventError&) {}
	virtual void react(const LocationEventAuthorization&) {}
};

// Platform adapter producing position samples.  Events may be emitted from any
// thread but must be emitted with InterruptLock held, which is also what
// listeners subscribe under.  All start/stop methods must be idempotent.
class LocationProvider : public EventEmitter<LocationProviderEventListener> {
public:
	virtual ~LocationProvider() {}
	virtual void start_low_power() = 0;
	virtual void stop_low_power() = 0;
	virtual void start_active(double accuracy_hint) = 0;
	virtual void stop_active() = 0;
	virtual void configure(const ProviderSettings& settings) = 0;
	virtual BaseAuthorizationStatus current_authorization() = 0;
};

#pragma once

#include "location_provider.hpp"
#include "location_request.hpp"

// Downstream boundary for continuous tracking consumers.  The scheduler only
// asks whether continuous demand exists and pushes events into it; fan-out to
// individual consumers is the sink's business.
class TrackingSink {
public:
	virtual ~TrackingSink() {}
	virtual bool has_continuous_demand() = 0;
	virtual void notify_sample(const LocationSample& sample) = 0;
	virtual void notify_error(const LocationError& error) = 0;
	virtual void notify_authorization(BaseAuthorizationStatus status) = 0;
};

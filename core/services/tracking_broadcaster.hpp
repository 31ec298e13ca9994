#pragma once

#include <functional>
#include <map>
#include <set>

#include "events.hpp"
#include "interrupt_lock.hpp"
#include "tracking_sink.hpp"

struct TrackingEventSample {
	const LocationSample& sample;
	TrackingEventSample(const LocationSample& a) : sample(a) {}
};
struct TrackingEventError {
	const LocationError& error;
	TrackingEventError(const LocationError& a) : error(a) {}
};
struct TrackingEventAuthorization {
	BaseAuthorizationStatus status;
	TrackingEventAuthorization(BaseAuthorizationStatus a) : status(a) {}
};

class TrackingListener {
public:
	virtual ~TrackingListener() {}
	virtual void react(const TrackingEventSample&) {}
	virtual void react(const TrackingEventError&) {}
	virtual void react(const TrackingEventAuthorization&) {}
};

// Fans scheduler events out to listeners.  Listeners registered through
// start_tracking() constitute continuous demand; listeners registered with
// subscribe() only observe errors and authorization changes.
class TrackingBroadcaster : public TrackingSink, public EventEmitter<TrackingListener> {
public:
	void set_demand_changed_callback(std::function<void()> callback);
	void start_tracking(TrackingListener& listener);
	void stop_tracking(TrackingListener& listener);
	unsigned int num_tracking();

	bool has_continuous_demand() override;
	void notify_sample(const LocationSample& sample) override;
	void notify_error(const LocationError& error) override;
	void notify_authorization(BaseAuthorizationStatus status) override;

private:
	std::set<TrackingListener *> m_tracking;
	std::function<void()> m_demand_changed_callback;

	void demand_changed(bool had_demand);

	// Listeners are called without InterruptLock held
	template<typename E> void notify_all(E const& e) {
		std::map<TrackingListener *, bool> subscribers;
		{
			InterruptLock lock;
			subscribers = listeners();
		}
		for (auto m : subscribers) {
			if (m.second)
				m.first->react(e);
		}
	}
};

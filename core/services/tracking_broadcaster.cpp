#include "tracking_broadcaster.hpp"
#include "interrupt_lock.hpp"
#include "debug.hpp"

void TrackingBroadcaster::set_demand_changed_callback(std::function<void()> callback) {
	InterruptLock lock;
	m_demand_changed_callback = callback;
}

void TrackingBroadcaster::start_tracking(TrackingListener& listener) {
	bool had_demand;
	{
		InterruptLock lock;
		had_demand = !m_tracking.empty();
		m_tracking.insert(&listener);
		subscribe(listener);
	}
	DEBUG_TRACE("TrackingBroadcaster::start_tracking: %u tracking", num_tracking());
	demand_changed(had_demand);
}

void TrackingBroadcaster::stop_tracking(TrackingListener& listener) {
	bool had_demand;
	{
		InterruptLock lock;
		had_demand = !m_tracking.empty();
		if (!m_tracking.erase(&listener))
			return;
		unsubscribe(listener);
	}
	DEBUG_TRACE("TrackingBroadcaster::stop_tracking: %u tracking", num_tracking());
	demand_changed(had_demand);
}

unsigned int TrackingBroadcaster::num_tracking() {
	InterruptLock lock;
	return m_tracking.size();
}

bool TrackingBroadcaster::has_continuous_demand() {
	InterruptLock lock;
	return !m_tracking.empty();
}

void TrackingBroadcaster::notify_sample(const LocationSample& sample) {
	std::set<TrackingListener *> tracking;
	{
		InterruptLock lock;
		tracking = m_tracking;
	}
	for (auto listener : tracking)
		listener->react(TrackingEventSample(sample));
}

void TrackingBroadcaster::notify_error(const LocationError& error) {
	notify_all(TrackingEventError(error));
}

void TrackingBroadcaster::notify_authorization(BaseAuthorizationStatus status) {
	notify_all(TrackingEventAuthorization(status));
}

// Only edges between "no demand" and "some demand" matter to the scheduler
void TrackingBroadcaster::demand_changed(bool had_demand) {
	std::function<void()> callback;
	{
		InterruptLock lock;
		if (had_demand == !m_tracking.empty())
			return;
		callback = m_demand_changed_callback;
	}
	if (callback)
		callback();
}

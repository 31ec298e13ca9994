#include <vector>
#include <thread>
#include <future>
#include <memory>
#include <chrono>

#include "tracking_broadcaster.hpp"
#include "interrupt_lock.hpp"
#include "fake_location_provider.hpp"

#include "CppUTest/TestHarness.h"
#include "CppUTestExt/MockSupport.h"

#include "mock_tracking_listener.hpp"


// Counts events delivered while another thread is unable to take InterruptLock
class LockCheckingListener : public TrackingListener {
public:
	unsigned int num_events = 0;
	unsigned int num_locked = 0;

	void join() {
		for (auto& t : m_threads)
			t.join();
		m_threads.clear();
	}

private:
	std::vector<std::thread> m_threads;

	void check() {
		num_events++;
		auto acquired = std::make_shared<std::promise<void>>();
		std::future<void> done = acquired->get_future();
		m_threads.emplace_back([acquired]() {
			InterruptLock lock;
			acquired->set_value();
		});
		if (done.wait_for(std::chrono::milliseconds(200)) != std::future_status::ready)
			num_locked++;
	}

	void react(const TrackingEventSample&) override { check(); }
	void react(const TrackingEventError&) override { check(); }
	void react(const TrackingEventAuthorization&) override { check(); }
};


TEST_GROUP(TrackingBroadcaster)
{
	TrackingBroadcaster *broadcaster;
	MockTrackingListener *listener_a;
	MockTrackingListener *listener_b;
	unsigned int demand_changes;

	void setup() {
		broadcaster = new TrackingBroadcaster;
		listener_a = new MockTrackingListener;
		listener_b = new MockTrackingListener;
		demand_changes = 0;
		broadcaster->set_demand_changed_callback([this]() { demand_changes++; });
	}

	void teardown() {
		delete listener_a;
		delete listener_b;
		delete broadcaster;
	}
};


TEST(TrackingBroadcaster, DemandFollowsTrackingListeners)
{
	CHECK_FALSE(broadcaster->has_continuous_demand());

	broadcaster->start_tracking(*listener_a);
	CHECK_TRUE(broadcaster->has_continuous_demand());
	CHECK_EQUAL(1U, demand_changes);

	// A second tracker does not change whether demand exists
	broadcaster->start_tracking(*listener_b);
	CHECK_EQUAL(1U, demand_changes);
	CHECK_EQUAL(2U, broadcaster->num_tracking());

	broadcaster->stop_tracking(*listener_a);
	CHECK_TRUE(broadcaster->has_continuous_demand());
	CHECK_EQUAL(1U, demand_changes);

	broadcaster->stop_tracking(*listener_b);
	CHECK_FALSE(broadcaster->has_continuous_demand());
	CHECK_EQUAL(2U, demand_changes);

	// Stopping a listener that is not tracking changes nothing
	broadcaster->stop_tracking(*listener_b);
	CHECK_EQUAL(2U, demand_changes);
}

TEST(TrackingBroadcaster, SamplesOnlyReachTrackingListeners)
{
	broadcaster->start_tracking(*listener_a);
	broadcaster->subscribe(*listener_b);

	mock().expectOneCall("sample").onObject(listener_a).withDoubleParameter("horizontal_accuracy", 12.0);
	broadcaster->notify_sample(make_sample(12.0));
	mock().checkExpectations();
	mock().clear();
}

TEST(TrackingBroadcaster, ErrorsAndAuthorizationReachAllSubscribers)
{
	broadcaster->start_tracking(*listener_a);
	broadcaster->subscribe(*listener_b);

	mock().expectOneCall("error").onObject(listener_a).withIntParameter("code", LOCATION_PROVIDER_FAILURE).withIntParameter("provider_error", 3);
	mock().expectOneCall("error").onObject(listener_b).withIntParameter("code", LOCATION_PROVIDER_FAILURE).withIntParameter("provider_error", 3);
	broadcaster->notify_error(LocationError { LOCATION_PROVIDER_FAILURE, 3 });

	mock().expectOneCall("authorization").onObject(listener_a).withUnsignedIntParameter("status", static_cast<unsigned int>(BaseAuthorizationStatus::DENIED));
	mock().expectOneCall("authorization").onObject(listener_b).withUnsignedIntParameter("status", static_cast<unsigned int>(BaseAuthorizationStatus::DENIED));
	broadcaster->notify_authorization(BaseAuthorizationStatus::DENIED);

	mock().checkExpectations();
	mock().clear();
}

TEST(TrackingBroadcaster, StoppedListenerReceivesNothing)
{
	broadcaster->start_tracking(*listener_a);
	broadcaster->stop_tracking(*listener_a);

	mock().expectNoCall("sample");
	mock().expectNoCall("error");
	broadcaster->notify_sample(make_sample(12.0));
	broadcaster->notify_error(LocationError { LOCATION_PROVIDER_FAILURE, 1 });
	mock().checkExpectations();
	mock().clear();
}

TEST(TrackingBroadcaster, ListenersAreCalledWithoutInterruptLock)
{
	LockCheckingListener listener;
	broadcaster->start_tracking(listener);

	broadcaster->notify_sample(make_sample(12.0));
	listener.join();
	broadcaster->notify_error(LocationError { LOCATION_PROVIDER_FAILURE, 2 });
	listener.join();
	broadcaster->notify_authorization(BaseAuthorizationStatus::DENIED);
	listener.join();

	CHECK_EQUAL(3U, listener.num_events);
	CHECK_EQUAL(0U, listener.num_locked);

	broadcaster->stop_tracking(listener);
}

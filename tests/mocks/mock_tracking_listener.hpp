#pragma once

#include "tracking_broadcaster.hpp"

class MockTrackingListener : public TrackingListener {
public:
	void react(const TrackingEventSample& e) override {
		mock().actualCall("sample").onObject(this).withDoubleParameter("horizontal_accuracy", e.sample.horizontal_accuracy);
	}
	void react(const TrackingEventError& e) override {
		mock().actualCall("error").onObject(this).withIntParameter("code", e.error.code).withIntParameter("provider_error", e.error.provider_error);
	}
	void react(const TrackingEventAuthorization& e) override {
		mock().actualCall("authorization").onObject(this).withUnsignedIntParameter("status", static_cast<unsigned int>(e.status));
	}
};

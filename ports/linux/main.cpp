#include <thread>
#include <chrono>
#include <cstdio>

#include "scheduler.hpp"
#include "location_scheduler.hpp"
#include "deadline_manager.hpp"
#include "tracking_broadcaster.hpp"
#include "config_store_ram.hpp"
#include "console_log.hpp"
#include "linux_timer.hpp"
#include "linux_rtc.hpp"
#include "simulated_location_provider.hpp"
#include "debug.hpp"

#define DEMO_LATITUDE       (50.3755)
#define DEMO_LONGITUDE      (-4.1427)
#define TRACKING_PERIOD_MS  (3000)

// Global contexts
Timer *system_timer;
Scheduler *system_scheduler;
ConfigurationStore *configuration_store;
RTC *rtc;


class ConsoleTrackingListener : public TrackingListener {
public:
	unsigned int num_samples = 0;

private:
	void react(const TrackingEventSample& e) override {
		num_samples++;
		printf("[TRACKING]\tlat: %lf lon: %lf hAcc: %lf\r\n", e.sample.latitude, e.sample.longitude, e.sample.horizontal_accuracy);
	}
	void react(const TrackingEventError& e) override {
		printf("[TRACKING]\terror: %s (%d)\r\n", error_code_str(e.error.code), e.error.provider_error);
	}
	void react(const TrackingEventAuthorization& e) override {
		printf("[TRACKING]\tauthorization: %s\r\n", authorization_status_str(e.status));
	}
};

static void print_result(const char *label, const FixResult& result) {
	if (std::holds_alternative<LocationSample>(result)) {
		const LocationSample& sample = std::get<LocationSample>(result);
		printf("[%s]\tfix lat: %lf lon: %lf hAcc: %lf\r\n", label, sample.latitude, sample.longitude, sample.horizontal_accuracy);
	} else {
		const LocationError& error = std::get<LocationError>(result);
		printf("[%s]\t%s\r\n", label, error_code_str(error.code));
	}
}

static void run_for(Scheduler& scheduler, Timer& timer, unsigned int duration_ms) {
	uint64_t start = timer.get_counter();
	while (timer.get_counter() - start < duration_ms) {
		scheduler.run();
		std::this_thread::sleep_for(std::chrono::milliseconds(1));
	}
}

int main() {
	ConsoleLog console_log;
	console_log.set_log_level(LOG_LEVEL_INFO);
	DebugLogger::console_log = &console_log;

	LinuxTimer timer;
	LinuxRTC linux_rtc;
	RamConfigurationStore store;
	Scheduler scheduler(&timer);

	system_timer = &timer;
	system_scheduler = &scheduler;
	configuration_store = &store;
	rtc = &linux_rtc;

	try {
		store.init();
		linux_rtc.settime(std::time(nullptr));
		timer.start();

		SimulatedLocationProvider provider(DEMO_LATITUDE, DEMO_LONGITUDE);
		DeadlineManager deadline_manager(timer);
		TrackingBroadcaster broadcaster;
		LocationScheduler location_scheduler(provider, deadline_manager, &broadcaster, &console_log);

		broadcaster.set_demand_changed_callback([&location_scheduler]() {
			location_scheduler.notify_continuous_demand_changed();
		});

		// Only touched from scheduler.run()
		unsigned int outstanding = 0;
		auto submit = [&](const char *label, double accuracy, unsigned int timeout_ms) {
			outstanding++;
			RequestId id = location_scheduler.request_one_fix(accuracy, timeout_ms, [&outstanding, label](const FixResult& result) {
				print_result(label, result);
				outstanding--;
			});
			DEBUG_INFO("main: submitted %s as id=%u (accuracy=%f timeout=%u)", label, id, accuracy, timeout_ms);
		};

		submit("COARSE", 1000.0, 5000);
		submit("PRECISE", 20.0, 10000);
		submit("UNREACHABLE", 0.5, 2000);
		submit("DEFAULT", 100.0, 30000);

		while (outstanding)
			run_for(scheduler, timer, 10);

		DEBUG_INFO("main: one-shot requests complete, provider %s", provider_state_str(location_scheduler.get_provider_state()));

		// Continuous demand alone keeps the provider in the configured tracking mode
		ConsoleTrackingListener listener;
		broadcaster.start_tracking(listener);
		run_for(scheduler, timer, TRACKING_PERIOD_MS);
		broadcaster.stop_tracking(listener);
		run_for(scheduler, timer, 10);

		DEBUG_INFO("main: tracked %u samples, provider %s", listener.num_samples, provider_state_str(location_scheduler.get_provider_state()));

		// Anything still queued refers to location_scheduler
		scheduler.clear_all();
	} catch (ErrorCode e) {
		DEBUG_ERROR("main: unhandled error %s", error_code_str(e));
		scheduler.clear_all();
		timer.stop();
		return 1;
	}

	timer.stop();
	return 0;
}

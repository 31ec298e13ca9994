#ifndef __LOCATION_SCHEDULER_HPP_
#define __LOCATION_SCHEDULER_HPP_

#include <atomic>
#include <optional>
#include <vector>

#include "location_provider.hpp"
#include "location_request.hpp"
#include "request_registry.hpp"
#include "deadline_manager.hpp"
#include "tracking_sink.hpp"
#include "config_store.hpp"
#include "scheduler.hpp"
#include "logger.hpp"


class FixLogFormatter : public LogFormatter {
public:
	const std::string header() override {
		return "log_datetime,event,request_id,desired_accuracy,lat,lon,hAcc,onTime,provider_error\r\n";
	}
	const std::string log_entry(const LogEntry& e) override {
		static constexpr const char *event_name[] = { "FIX", "TIMED_OUT", "CANCELLED", "RESTRICTED", "PROVIDER_FAILURE" };
		char entry[256], d1[64];
		const FixLogEntry *fix = (const FixLogEntry *)&e;

		snprintf(d1, sizeof(d1), "%02u/%02u/%04u %02u:%02u:%02u",
				(unsigned int)fix->header.day, (unsigned int)fix->header.month, (unsigned int)fix->header.year,
				(unsigned int)fix->header.hours, (unsigned int)fix->header.minutes, (unsigned int)fix->header.seconds);

		snprintf(entry, sizeof(entry), "%s,%s,%u,%f,%f,%f,%f,%u,%d\r\n",
				d1,
				event_name[static_cast<unsigned int>(fix->event_type)],
				(unsigned int)fix->request_id,
				fix->desired_accuracy,
				fix->lat,
				fix->lon,
				fix->hAcc,
				(unsigned int)fix->onTime,
				(int)fix->provider_error);
		return std::string(entry);
	}
};

// Coordinates one-shot fix requests against the provider's sample stream and
// drives the provider's power state from the aggregate demand.
//
// Every input (public calls, provider events, deadline expiry) is posted to
// system_scheduler and handled in a task, so all state below is only touched
// from run().  Result callbacks are invoked from run() once the turn's state
// transition is complete.  A result callback that throws does not prevent the
// other results of the same turn from being delivered; the first exception is
// rethrown from run() afterwards.
//
// Deadline expiry, authorization changes and provider errors must not be
// lost when the task queue is full.  They are queued in m_inputs under
// InterruptLock and drained at the start of every turn; if no task could be
// posted to drain them, a retry is armed every INPUT_RETRY_MS until one is.
//
// Any tasks still queued on system_scheduler refer to this object, so the
// task queue must be cleared before destroying it.
class LocationScheduler : public LocationProviderEventListener {
public:
	LocationScheduler(LocationProvider& provider, DeadlineManager& deadline_manager,
			TrackingSink *tracking_sink = nullptr, Logger *logger = nullptr);
	~LocationScheduler();

	// Throws BAD_PARAMETER for a non-positive accuracy, a zero timeout or an
	// empty callback.  The callback is invoked exactly once.
	RequestId request_one_fix(double desired_accuracy, unsigned int timeout_ms, FixCallback callback);
	RequestId request_one_fix(double desired_accuracy, FixCallback callback);
	void cancel_all_pending();
	void notify_continuous_demand_changed();

	BaseProviderState get_provider_state();
	bool is_updating_location();
	unsigned int num_pending();
	std::optional<LocationSample> get_last_sample();

	static constexpr unsigned int INPUT_RETRY_MS = 10;

private:
	struct Resolution {
		FixCallback callback;
		FixResult result;
	};

	struct Input {
		enum class Type { DEADLINE, AUTHORIZATION, PROVIDER_ERROR } type;
		RequestId id;
		BaseAuthorizationStatus status;
		int error_code;
	};

	LocationProvider&   m_provider;
	DeadlineManager&    m_deadline_manager;
	TrackingSink       *m_tracking_sink;
	Logger             *m_logger;
	RequestRegistry     m_registry;

	std::atomic<BaseProviderState> m_provider_state;
	std::atomic<unsigned int> m_num_pending;
	std::atomic<RequestId> m_next_id;

	bool m_is_low_power_running;
	bool m_is_active_running;
	double m_active_accuracy_hint;
	std::optional<ProviderSettings> m_provider_settings;

	std::optional<LocationSample> m_last_sample;
	uint64_t m_last_sample_time;

	// Guarded by InterruptLock
	std::vector<Input> m_inputs;
	bool m_is_drain_posted;
	DeadlineManager::Handle m_retry_handle;

	void react(const LocationEventSample&) override;
	void react(const LocationEventError&) override;
	void react(const LocationEventAuthorization&) override;

	// Scheduler turns
	void submit(RequestId id, double desired_accuracy, unsigned int timeout_ms, FixCallback callback);
	void on_sample(const LocationSample& sample);
	void on_deadline(RequestId id);
	void on_authorization_changed(BaseAuthorizationStatus status);
	void on_provider_error(int error_code);
	void on_demand_changed();
	void cancel_all(const LocationError& reason);

	void drain_inputs();

	void post(Scheduler::TaskFunction const &func, const char *name);
	void push_input(const Input& input);
	void post_drain();
	void arm_deadline(LocationRequest& request, unsigned int timeout_ms);
	bool resolve_pending(RequestId id, RequestStatus status, const FixResult& result, std::vector<Resolution>& resolved);
	void resolve(LocationRequest& request, RequestStatus status, const FixResult& result, std::vector<Resolution>& resolved);
	void sweep_expired(std::vector<Resolution>& resolved);
	void deliver(std::vector<Resolution>& resolved);
	void update_provider_state();
	void apply_provider_state(BaseProviderState target, double accuracy, const LocationConfig& config);
	void log_fix(const LocationRequest& request, const FixResult& result);
	void log_provider_state(BaseProviderState state, double accuracy);
	void log_authorization(BaseAuthorizationStatus status);
};

#endif // __LOCATION_SCHEDULER_HPP_

#include <exception>

#include "location_scheduler.hpp"
#include "interrupt_lock.hpp"
#include "debug.hpp"

extern Timer *system_timer;
extern Scheduler *system_scheduler;
extern ConfigurationStore *configuration_store;


LocationScheduler::LocationScheduler(LocationProvider& provider, DeadlineManager& deadline_manager,
		TrackingSink *tracking_sink, Logger *logger) :
	m_provider(provider),
	m_deadline_manager(deadline_manager),
	m_tracking_sink(tracking_sink),
	m_logger(logger),
	m_provider_state(BaseProviderState::IDLE),
	m_num_pending(0),
	m_next_id(1),
	m_is_low_power_running(false),
	m_is_active_running(false),
	m_active_accuracy_hint(0),
	m_last_sample_time(0),
	m_is_drain_posted(false) {
	InterruptLock lock;
	m_provider.subscribe(*this);
}

LocationScheduler::~LocationScheduler() {
	{
		InterruptLock lock;
		m_provider.unsubscribe(*this);
		m_deadline_manager.cancel(m_retry_handle);
		m_inputs.clear();
	}

	std::vector<Resolution> resolved;
	for (auto& request : m_registry.take_all()) {
		m_deadline_manager.cancel(request.deadline_handle);
		resolve(request, RequestStatus::CANCELLED, LocationError { LOCATION_CANCELLED, 0 }, resolved);
	}
	m_num_pending = 0;

	if (m_is_active_running)
		m_provider.stop_active();
	if (m_is_low_power_running)
		m_provider.stop_low_power();

	deliver(resolved);
}

RequestId LocationScheduler::request_one_fix(double desired_accuracy, unsigned int timeout_ms, FixCallback callback) {
	if (!(desired_accuracy > 0) || timeout_ms == 0 || !callback) {
		DEBUG_ERROR("LocationScheduler::request_one_fix: bad parameter accuracy=%f timeout=%u", desired_accuracy, timeout_ms);
		throw BAD_PARAMETER;
	}

	RequestId id = m_next_id++;
	DEBUG_TRACE("LocationScheduler::request_one_fix: id=%u accuracy=%f timeout=%u", id, desired_accuracy, timeout_ms);
	post([this, id, desired_accuracy, timeout_ms, callback]() {
		submit(id, desired_accuracy, timeout_ms, callback);
	}, "LocationSubmit");

	return id;
}

RequestId LocationScheduler::request_one_fix(double desired_accuracy, FixCallback callback) {
	LocationConfig config;
	configuration_store->get_location_configuration(config);
	return request_one_fix(desired_accuracy, config.default_timeout_ms, callback);
}

void LocationScheduler::cancel_all_pending() {
	post([this]() {
		drain_inputs();
		cancel_all(LocationError { LOCATION_CANCELLED, 0 });
	}, "LocationCancelAll");
}

void LocationScheduler::notify_continuous_demand_changed() {
	post([this]() { on_demand_changed(); }, "LocationDemandChanged");
}

BaseProviderState LocationScheduler::get_provider_state() {
	return m_provider_state;
}

bool LocationScheduler::is_updating_location() {
	return m_provider_state != BaseProviderState::IDLE;
}

unsigned int LocationScheduler::num_pending() {
	return m_num_pending;
}

std::optional<LocationSample> LocationScheduler::get_last_sample() {
	InterruptLock lock;
	return m_last_sample;
}

void LocationScheduler::react(const LocationEventSample& e) {
	LocationSample sample = e.sample;
	try {
		post([this, sample]() { on_sample(sample); }, "LocationSample");
	} catch (ErrorCode err) {
		// A newer sample will follow, dropping this one loses nothing permanent
		DEBUG_WARN("LocationScheduler::react(LocationEventSample): sample dropped (%s)", error_code_str(err));
	}
}

void LocationScheduler::react(const LocationEventError& e) {
	Input input = {};
	input.type = Input::Type::PROVIDER_ERROR;
	input.error_code = e.error_code;
	push_input(input);
}

void LocationScheduler::react(const LocationEventAuthorization& e) {
	Input input = {};
	input.type = Input::Type::AUTHORIZATION;
	input.status = e.status;
	push_input(input);
}

void LocationScheduler::post(Scheduler::TaskFunction const &func, const char *name) {
	system_scheduler->post_task_prio(func, name, Scheduler::DEFAULT_PRIORITY);
}

// May be called from any context
void LocationScheduler::push_input(const Input& input) {
	{
		InterruptLock lock;
		m_inputs.push_back(input);
	}
	post_drain();
}

void LocationScheduler::post_drain() {
	InterruptLock lock;
	if (m_is_drain_posted)
		return;

	try {
		post([this]() { drain_inputs(); }, "LocationInputs");
		m_is_drain_posted = true;
	} catch (ErrorCode e) {
		if (!m_deadline_manager.is_armed(m_retry_handle)) {
			DEBUG_WARN("LocationScheduler: %u inputs not posted (%s), retry in %u ms",
					(unsigned int)m_inputs.size(), error_code_str(e), INPUT_RETRY_MS);
			m_retry_handle = m_deadline_manager.schedule(INPUT_RETRY_MS, [this]() { post_drain(); });
		}
	}
}

// Runs at the start of every turn.  Inputs are taken one at a time so that any
// left behind by a throwing result callback are still queued for a later turn.
void LocationScheduler::drain_inputs() {
	{
		InterruptLock lock;
		m_is_drain_posted = false;
	}

	try {
		while (true) {
			Input input;
			{
				InterruptLock lock;
				if (m_inputs.empty())
					return;
				input = m_inputs.front();
				m_inputs.erase(m_inputs.begin());
			}

			switch (input.type) {
			case Input::Type::DEADLINE:
				on_deadline(input.id);
				break;
			case Input::Type::AUTHORIZATION:
				on_authorization_changed(input.status);
				break;
			case Input::Type::PROVIDER_ERROR:
				on_provider_error(input.error_code);
				break;
			}
		}
	} catch (...) {
		post_drain();
		throw;
	}
}

void LocationScheduler::submit(RequestId id, double desired_accuracy, unsigned int timeout_ms, FixCallback callback) {
	std::vector<Resolution> resolved;
	uint64_t now = system_timer->get_counter();

	LocationRequest request;
	request.id = id;
	request.desired_accuracy = desired_accuracy;
	request.submitted_at = now;
	request.deadline = now + timeout_ms;
	request.status = RequestStatus::PENDING;
	request.callback = callback;

	drain_inputs();
	sweep_expired(resolved);

	BaseAuthorizationStatus status = m_provider.current_authorization();
	if (authorization_is_forbidden(status)) {
		DEBUG_WARN("LocationScheduler::submit: id=%u rejected, authorization %s", id, authorization_status_str(status));
		resolve(request, RequestStatus::CANCELLED, LocationError { LOCATION_RESTRICTED, 0 }, resolved);
		update_provider_state();
		deliver(resolved);
		return;
	}

	LocationConfig config;
	configuration_store->get_location_configuration(config);

	// A sample already on hand may satisfy the request without touching the provider
	if (m_last_sample.has_value() && sample_satisfies(*m_last_sample, desired_accuracy) &&
		(config.cached_sample_max_age_ms == 0 || (now - m_last_sample_time) <= config.cached_sample_max_age_ms)) {
		DEBUG_TRACE("LocationScheduler::submit: id=%u satisfied by cached sample", id);
		resolve(request, RequestStatus::COMPLETED, *m_last_sample, resolved);
		update_provider_state();
		deliver(resolved);
		return;
	}

	arm_deadline(request, timeout_ms);

	try {
		m_registry.add(request);
	} catch (ErrorCode e) {
		m_deadline_manager.cancel(request.deadline_handle);
		resolve(request, RequestStatus::CANCELLED, LocationError { e, 0 }, resolved);
	}

	m_num_pending = m_registry.size();
	update_provider_state();
	deliver(resolved);
}

void LocationScheduler::arm_deadline(LocationRequest& request, unsigned int timeout_ms) {
	RequestId id = request.id;
	request.deadline_handle = m_deadline_manager.schedule(timeout_ms, [this, id]() {
		// Runs in the timer context, hand over to the serialized turn
		Input input = {};
		input.type = Input::Type::DEADLINE;
		input.id = id;
		push_input(input);
	});
}

void LocationScheduler::on_sample(const LocationSample& sample) {
	std::vector<Resolution> resolved;

	drain_inputs();

	uint64_t now = system_timer->get_counter();
	{
		InterruptLock lock;
		m_last_sample = sample;
		m_last_sample_time = now;
	}

	if (!sample_is_fix(sample))
		DEBUG_TRACE("LocationScheduler::on_sample: no fix (hAcc=%f)", sample.horizontal_accuracy);

	// Anything already past its deadline times out before this sample is considered
	sweep_expired(resolved);

	// Iterate a snapshot, resolution removes entries from the registry
	for (auto const& request : m_registry.all_pending()) {
		if (sample_satisfies(sample, request.desired_accuracy))
			resolve_pending(request.id, RequestStatus::COMPLETED, sample, resolved);
	}

	if (m_tracking_sink && sample_is_fix(sample) && m_tracking_sink->has_continuous_demand())
		m_tracking_sink->notify_sample(sample);

	update_provider_state();
	deliver(resolved);
}

void LocationScheduler::on_deadline(RequestId id) {
	std::vector<Resolution> resolved;

	// Already resolved by a sample or a cancellation, the deadline is vestigial
	if (!resolve_pending(id, RequestStatus::EXPIRED, LocationError { LOCATION_TIMED_OUT, 0 }, resolved)) {
		DEBUG_TRACE("LocationScheduler::on_deadline: id=%u already resolved", id);
		return;
	}

	update_provider_state();
	deliver(resolved);
}

void LocationScheduler::on_authorization_changed(BaseAuthorizationStatus status) {
	DEBUG_INFO("LocationScheduler::on_authorization_changed: %s", authorization_status_str(status));
	log_authorization(status);

	if (authorization_is_forbidden(status))
		cancel_all(LocationError { LOCATION_RESTRICTED, 0 });
	else
		update_provider_state();

	if (m_tracking_sink)
		m_tracking_sink->notify_authorization(status);
}

void LocationScheduler::on_provider_error(int error_code) {
	DEBUG_ERROR("LocationScheduler::on_provider_error: provider error %d", error_code);

	LocationError error = { LOCATION_PROVIDER_FAILURE, error_code };
	cancel_all(error);

	if (m_tracking_sink)
		m_tracking_sink->notify_error(error);
}

void LocationScheduler::on_demand_changed() {
	std::vector<Resolution> resolved;
	drain_inputs();
	sweep_expired(resolved);
	update_provider_state();
	deliver(resolved);
}

void LocationScheduler::cancel_all(const LocationError& reason) {
	std::vector<Resolution> resolved;

	DEBUG_INFO("LocationScheduler::cancel_all: %u pending (%s)", m_registry.size(), error_code_str(reason.code));

	for (auto& request : m_registry.take_all()) {
		m_deadline_manager.cancel(request.deadline_handle);
		resolve(request, RequestStatus::CANCELLED, reason, resolved);
	}
	m_num_pending = 0;

	update_provider_state();
	deliver(resolved);
}

bool LocationScheduler::resolve_pending(RequestId id, RequestStatus status, const FixResult& result, std::vector<Resolution>& resolved) {
	auto request = m_registry.take(id);
	if (!request.has_value())
		return false;

	m_num_pending = m_registry.size();
	m_deadline_manager.cancel(request->deadline_handle);
	resolve(*request, status, result, resolved);
	return true;
}

void LocationScheduler::resolve(LocationRequest& request, RequestStatus status, const FixResult& result, std::vector<Resolution>& resolved) {
	request.status = status;
	log_fix(request, result);
	resolved.push_back({ std::move(request.callback), result });
}

// Catches requests whose deadline has passed but whose timer has not yet been
// delivered to a turn
void LocationScheduler::sweep_expired(std::vector<Resolution>& resolved) {
	uint64_t now = system_timer->get_counter();
	for (auto const& request : m_registry.all_pending()) {
		if (now >= request.deadline)
			resolve_pending(request.id, RequestStatus::EXPIRED, LocationError { LOCATION_TIMED_OUT, 0 }, resolved);
	}
}

void LocationScheduler::deliver(std::vector<Resolution>& resolved) {
	std::exception_ptr first_error;

	for (auto& r : resolved) {
		try {
			r.callback(r.result);
		} catch (...) {
			DEBUG_ERROR("LocationScheduler::deliver: result callback threw");
			if (!first_error)
				first_error = std::current_exception();
		}
	}
	resolved.clear();

	if (first_error)
		std::rethrow_exception(first_error);
}

void LocationScheduler::update_provider_state() {
	LocationConfig config;
	configuration_store->get_location_configuration(config);

	BaseProviderState target = BaseProviderState::IDLE;
	double accuracy = 0;

	if (authorization_is_forbidden(m_provider.current_authorization())) {
		target = BaseProviderState::IDLE;
	} else if (!m_registry.is_empty()) {
		target = BaseProviderState::ACTIVE;
		accuracy = *m_registry.strictest_accuracy();
	} else if (m_tracking_sink && m_tracking_sink->has_continuous_demand()) {
		if (config.tracking_mode == BaseTrackingMode::ACTIVE) {
			target = BaseProviderState::ACTIVE;
			accuracy = config.tracking_accuracy_active;
		} else {
			target = BaseProviderState::LOW_POWER;
			accuracy = config.tracking_accuracy_background;
		}
	}

	apply_provider_state(target, accuracy, config);
}

void LocationScheduler::apply_provider_state(BaseProviderState target, double accuracy, const LocationConfig& config) {
	bool need_low_power = target != BaseProviderState::IDLE;
	bool need_active = target == BaseProviderState::ACTIVE;

	if (need_low_power) {
		ProviderSettings settings = { accuracy, config.distance_filter };
		if (!m_provider_settings.has_value() ||
			m_provider_settings->desired_accuracy != settings.desired_accuracy ||
			m_provider_settings->distance_filter != settings.distance_filter) {
			m_provider.configure(settings);
			m_provider_settings = settings;
		}
	} else {
		m_provider_settings.reset();
	}

	if (need_low_power && !m_is_low_power_running) {
		m_provider.start_low_power();
		m_is_low_power_running = true;
	}

	if (need_active) {
		if (!m_is_active_running || m_active_accuracy_hint != accuracy) {
			m_provider.start_active(accuracy);
			m_is_active_running = true;
			m_active_accuracy_hint = accuracy;
		}
	} else if (m_is_active_running) {
		m_provider.stop_active();
		m_is_active_running = false;
	}

	if (!need_low_power && m_is_low_power_running) {
		m_provider.stop_low_power();
		m_is_low_power_running = false;
	}

	if (m_provider_state != target) {
		DEBUG_INFO("LocationScheduler: provider %s -> %s (accuracy=%f pending=%u)",
				provider_state_str(m_provider_state), provider_state_str(target), accuracy, m_registry.size());
		m_provider_state = target;
		log_provider_state(target, accuracy);
	}
}

void LocationScheduler::log_fix(const LocationRequest& request, const FixResult& result) {
	if (!m_logger)
		return;

	FixLogEntry entry;
	memset(&entry, 0, sizeof(entry));
	entry.header.log_type = LOG_FIX;
	Logger::sync_datetime(entry.header);

	entry.request_id = request.id;
	entry.desired_accuracy = request.desired_accuracy;
	entry.onTime = system_timer->get_counter() - request.submitted_at;

	if (std::holds_alternative<LocationSample>(result)) {
		const LocationSample& sample = std::get<LocationSample>(result);
		entry.event_type = FixEventType::FIX;
		entry.lat = sample.latitude;
		entry.lon = sample.longitude;
		entry.hAcc = sample.horizontal_accuracy;
	} else {
		const LocationError& error = std::get<LocationError>(result);
		switch (error.code) {
		case LOCATION_TIMED_OUT:
			entry.event_type = FixEventType::TIMED_OUT;
			break;
		case LOCATION_RESTRICTED:
			entry.event_type = FixEventType::RESTRICTED;
			break;
		case LOCATION_PROVIDER_FAILURE:
			entry.event_type = FixEventType::PROVIDER_FAILURE;
			entry.provider_error = error.provider_error;
			break;
		default:
			entry.event_type = FixEventType::CANCELLED;
			break;
		}
	}

	m_logger->write(&entry);
}

void LocationScheduler::log_provider_state(BaseProviderState state, double accuracy) {
	if (!m_logger)
		return;

	ProviderLogEntry entry;
	memset(&entry, 0, sizeof(entry));
	entry.header.log_type = LOG_PROVIDER;
	Logger::sync_datetime(entry.header);
	entry.state = state;
	entry.accuracy_hint = accuracy;
	entry.num_pending = m_registry.size();

	m_logger->write(&entry);
}

void LocationScheduler::log_authorization(BaseAuthorizationStatus status) {
	if (!m_logger)
		return;

	AuthorizationLogEntry entry;
	memset(&entry, 0, sizeof(entry));
	entry.header.log_type = LOG_AUTHORIZATION;
	Logger::sync_datetime(entry.header);
	entry.status = status;

	m_logger->write(&entry);
}

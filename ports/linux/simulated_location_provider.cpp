#include <chrono>
#include <ctime>
#include <algorithm>

#include "simulated_location_provider.hpp"
#include "haversine.hpp"
#include "interrupt_lock.hpp"
#include "debug.hpp"


SimulatedLocationProvider::SimulatedLocationProvider(double latitude, double longitude, unsigned int interval_ms,
		BaseAuthorizationStatus authorization) :
	m_is_running(false),
	m_rng(std::random_device()()),
	m_interval_ms(interval_ms),
	m_is_low_power(false),
	m_is_active(false),
	m_accuracy_hint(0),
	m_current_accuracy(INITIAL_ACCURACY),
	m_settings({ 0, 0 }),
	m_authorization(authorization),
	m_latitude(latitude),
	m_longitude(longitude),
	m_speed(1.0),
	m_course(45.0) {
}

SimulatedLocationProvider::~SimulatedLocationProvider() {
	m_is_running = false;
	if (m_thread.joinable())
		m_thread.join();
}

void SimulatedLocationProvider::start_low_power() {
	std::lock_guard<std::mutex> lock(m_mtx);
	if (m_is_low_power)
		return;
	DEBUG_TRACE("SimulatedLocationProvider::start_low_power");
	m_is_low_power = true;
	ensure_thread();
}

void SimulatedLocationProvider::stop_low_power() {
	std::lock_guard<std::mutex> lock(m_mtx);
	if (!m_is_low_power)
		return;
	DEBUG_TRACE("SimulatedLocationProvider::stop_low_power");
	m_is_low_power = false;
}

void SimulatedLocationProvider::start_active(double accuracy_hint) {
	std::lock_guard<std::mutex> lock(m_mtx);
	DEBUG_TRACE("SimulatedLocationProvider::start_active: hint=%f", accuracy_hint);
	// A restart with a new hint keeps the accuracy reached so far
	if (!m_is_active)
		m_current_accuracy = INITIAL_ACCURACY;
	m_is_active = true;
	m_accuracy_hint = accuracy_hint;
	ensure_thread();
}

void SimulatedLocationProvider::stop_active() {
	std::lock_guard<std::mutex> lock(m_mtx);
	if (!m_is_active)
		return;
	DEBUG_TRACE("SimulatedLocationProvider::stop_active");
	m_is_active = false;
}

void SimulatedLocationProvider::configure(const ProviderSettings& settings) {
	std::lock_guard<std::mutex> lock(m_mtx);
	DEBUG_TRACE("SimulatedLocationProvider::configure: accuracy=%f distance_filter=%f", settings.desired_accuracy, settings.distance_filter);
	m_settings = settings;
}

BaseAuthorizationStatus SimulatedLocationProvider::current_authorization() {
	std::lock_guard<std::mutex> lock(m_mtx);
	return m_authorization;
}

void SimulatedLocationProvider::set_authorization(BaseAuthorizationStatus status) {
	{
		std::lock_guard<std::mutex> lock(m_mtx);
		if (m_authorization == status)
			return;
		m_authorization = status;
	}
	InterruptLock lock;
	notify(LocationEventAuthorization(status));
}

void SimulatedLocationProvider::inject_error(int error_code) {
	InterruptLock lock;
	notify(LocationEventError(error_code));
}

void SimulatedLocationProvider::set_speed(double speed_mps) {
	std::lock_guard<std::mutex> lock(m_mtx);
	m_speed = speed_mps;
}

// Must be called with m_mtx held
void SimulatedLocationProvider::ensure_thread() {
	if (m_is_running)
		return;
	if (m_thread.joinable())
		m_thread.join();
	m_is_running = true;
	m_thread = std::thread(&SimulatedLocationProvider::thread_func, this);
}

void SimulatedLocationProvider::thread_func() {
	while (m_is_running) {
		std::this_thread::sleep_for(std::chrono::milliseconds(m_interval_ms));

		// Listeners subscribe and unsubscribe under the same lock
		LocationSample sample;
		if (next_sample(sample)) {
			InterruptLock lock;
			notify(LocationEventSample(sample));
		}
	}
}

bool SimulatedLocationProvider::next_sample(LocationSample& sample) {
	std::lock_guard<std::mutex> lock(m_mtx);

	if (!m_is_low_power && !m_is_active)
		return false;

	// Move along the current course
	double distance = m_speed * m_interval_ms / 1000.0;
	haversine_destination(m_latitude, m_longitude, m_course, distance, m_latitude, m_longitude);
	std::uniform_real_distribution<double> turn(-10.0, 10.0);
	m_course = std::fmod(m_course + turn(m_rng) + 360.0, 360.0);

	double accuracy;
	if (m_is_active) {
		double floor = std::max(1.0, m_accuracy_hint * CONVERGENCE);
		m_current_accuracy = std::max(floor, m_current_accuracy * CONVERGENCE);
		accuracy = m_current_accuracy;
	} else {
		accuracy = COARSE_ACCURACY;
	}

	// Report a position scattered within the stated accuracy
	std::uniform_real_distribution<double> bearing(0.0, 360.0);
	std::uniform_real_distribution<double> error(0.0, accuracy);
	double lat, lon;
	haversine_destination(m_latitude, m_longitude, bearing(m_rng), error(m_rng), lat, lon);

	sample.latitude = lat;
	sample.longitude = lon;
	sample.altitude = 0;
	sample.horizontal_accuracy = accuracy;
	sample.vertical_accuracy = -1;
	sample.speed = m_speed;
	sample.course = m_course;
	sample.timestamp = std::time(nullptr);

	if (m_settings.distance_filter > 0 && m_last_emitted.has_value() &&
		haversine_distance(m_last_emitted->latitude, m_last_emitted->longitude, lat, lon) < m_settings.distance_filter)
		return false;

	m_last_emitted = sample;
	return true;
}

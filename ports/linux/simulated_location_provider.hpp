#pragma once

#include <thread>
#include <mutex>
#include <atomic>
#include <random>
#include <optional>

#include "location_provider.hpp"

// Stand-in for a platform location service.  A worker thread emits one sample
// every interval_ms while at least low power updates are running.  Active
// updates converge geometrically towards the accuracy hint; low power updates
// only ever report a coarse position.  The simulated position drifts slowly.
class SimulatedLocationProvider : public LocationProvider {
public:
	static constexpr double COARSE_ACCURACY  = 3000.0;  // m
	static constexpr double INITIAL_ACCURACY = 500.0;   // m
	static constexpr double CONVERGENCE      = 0.5;

	SimulatedLocationProvider(double latitude, double longitude, unsigned int interval_ms = 250,
			BaseAuthorizationStatus authorization = BaseAuthorizationStatus::ALLOWED_WHILE_IN_USE);
	~SimulatedLocationProvider();

	void start_low_power() override;
	void stop_low_power() override;
	void start_active(double accuracy_hint) override;
	void stop_active() override;
	void configure(const ProviderSettings& settings) override;
	BaseAuthorizationStatus current_authorization() override;

	// Simulation controls
	void set_authorization(BaseAuthorizationStatus status);
	void inject_error(int error_code);
	void set_speed(double speed_mps);

private:
	std::mutex m_mtx;
	std::thread m_thread;
	std::atomic<bool> m_is_running;
	std::mt19937 m_rng;

	unsigned int m_interval_ms;
	bool m_is_low_power;
	bool m_is_active;
	double m_accuracy_hint;
	double m_current_accuracy;
	ProviderSettings m_settings;
	BaseAuthorizationStatus m_authorization;

	double m_latitude;
	double m_longitude;
	double m_speed;
	double m_course;
	std::optional<LocationSample> m_last_emitted;

	void ensure_thread();
	void thread_func();
	bool next_sample(LocationSample& sample);
};

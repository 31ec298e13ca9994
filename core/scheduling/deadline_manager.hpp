#pragma once

#include <map>
#include <optional>
#include <functional>

#include "timer.hpp"

// One-shot cancellable deadlines on top of a Timer.  on_fire is called at
// most once, from the timer's context, no earlier than duration_ms after
// schedule().  A deadline is disarmed exactly once, either by cancel() or by
// firing: if cancel() gets there first on_fire is never called, otherwise the
// cancel() is a no-op.
class DeadlineManager {
public:
	using Handle = std::optional<unsigned int>;

	DeadlineManager(Timer& timer) : m_timer(timer), m_unique_id(0) {}
	DeadlineManager(const DeadlineManager&) = delete;
	~DeadlineManager();

	Handle schedule(unsigned int duration_ms, std::function<void()> on_fire);
	void cancel(Handle& handle);
	void cancel_all();
	bool is_armed(const Handle& handle);
	unsigned int num_armed();

private:
	struct Deadline {
		Timer::TimerHandle timer_handle;
		std::function<void()> on_fire;
	};

	void fire(unsigned int id);

	Timer& m_timer;
	std::map<unsigned int, Deadline> m_armed;
	unsigned int m_unique_id;
};

#include "deadline_manager.hpp"
#include "interrupt_lock.hpp"
#include "error.hpp"
#include "debug.hpp"

DeadlineManager::~DeadlineManager() {
	cancel_all();
}

DeadlineManager::Handle DeadlineManager::schedule(unsigned int duration_ms, std::function<void()> on_fire) {
	if (duration_ms == 0 || !on_fire)
		throw BAD_PARAMETER;

	InterruptLock lock;

	unsigned int id = m_unique_id++;
	Deadline deadline;
	deadline.on_fire = on_fire;
	// Counter must move past "now" for the schedule to fire
	deadline.timer_handle = m_timer.add_schedule([this, id]() {
		this->fire(id);
	}, m_timer.get_counter() + duration_ms);
	m_armed.insert({id, deadline});

	DEBUG_TRACE("DeadlineManager::schedule: id=%u in %u ms", id, duration_ms);

	Handle handle;
	handle = id;
	return handle;
}

void DeadlineManager::cancel(Handle& handle) {
	if (!handle.has_value())
		return;

	{
		InterruptLock lock;
		auto it = m_armed.find(*handle);
		if (it != m_armed.end()) {
			m_timer.cancel_schedule(it->second.timer_handle);
			m_armed.erase(it);
			DEBUG_TRACE("DeadlineManager::cancel: id=%u", *handle);
		}
	}

	handle.reset();
}

void DeadlineManager::cancel_all() {
	InterruptLock lock;
	for (auto& p : m_armed)
		m_timer.cancel_schedule(p.second.timer_handle);
	m_armed.clear();
}

bool DeadlineManager::is_armed(const Handle& handle) {
	if (!handle.has_value())
		return false;
	InterruptLock lock;
	return m_armed.count(*handle) != 0;
}

unsigned int DeadlineManager::num_armed() {
	InterruptLock lock;
	return m_armed.size();
}

void DeadlineManager::fire(unsigned int id) {
	std::function<void()> on_fire;

	// Disarm under the lock so that a concurrent cancel() either wins outright
	// or finds nothing left to cancel
	{
		InterruptLock lock;
		auto it = m_armed.find(id);
		if (it == m_armed.end())
			return;
		on_fire = std::move(it->second.on_fire);
		m_armed.erase(it);
	}

	DEBUG_TRACE("DeadlineManager::fire: id=%u", id);
	on_fire();
}

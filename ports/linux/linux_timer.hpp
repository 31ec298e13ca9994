#pragma once

#include <thread>
#include <atomic>
#include <mutex>
#include <chrono>
#include <list>
#include <optional>
#include <ctime>
#include "timer.hpp"

// 1 ms tick timer driven by its own thread.  Schedules fire from that thread.
class LinuxTimer : public Timer {
public:
	LinuxTimer() : m_counter_value(0), m_is_running(false), m_unique_id(0) {}
	~LinuxTimer() {
		stop();
	}

	void start() override
	{
		if (!m_is_running)
		{
			m_is_running = true;
			m_counter_value = 0;
			m_counter_thread = std::thread(timer_thread_func, this);
		}
	}

	void stop() override
	{
		if (m_is_running)
		{
			m_is_running = false;
			m_counter_thread.join();
			std::lock_guard<std::mutex> lock(m_mtx_map);
			m_schedules.clear();
		}
	}

	uint64_t get_counter() override
	{
		return m_counter_value;
	}

	TimerHandle add_schedule(TimerFunction const &task_func, uint64_t target_count) override
	{
		Schedule schedule;

		std::lock_guard<std::mutex> lock(m_mtx_map);

		schedule.m_id = m_unique_id;
		schedule.m_func = task_func;
		schedule.m_target_counter_value = target_count;

		// Keep the list in time order
		auto iter = m_schedules.begin();
		while (iter != m_schedules.end())
		{
			if (iter->m_target_counter_value > target_count)
				break;
			iter++;
		}
		m_schedules.insert(iter, schedule);

		TimerHandle handle;
		handle = m_unique_id;
		m_unique_id++;

		return handle;
	}

	void cancel_schedule(TimerHandle &handle) override
	{
		if (!handle.has_value())
			return;

		std::lock_guard<std::mutex> lock(m_mtx_map);

		auto iter = m_schedules.begin();
		while (iter != m_schedules.end())
		{
			if (iter->m_id == *handle)
			{
				m_schedules.erase(iter);
				break;
			}
			else
				iter++;
		}

		// Already fired or never existed, either way the handle is spent
		handle.reset();
	}

private:
	static uint64_t time_now_ns() {
		struct timespec tp;
		clock_gettime(CLOCK_MONOTONIC, &tp);
		return (tp.tv_sec * NS_PER_SEC) + tp.tv_nsec;
	}

	static void timer_thread_func(LinuxTimer *parent) {
		uint64_t last_t = time_now_ns();

		while (parent->m_is_running) {
			uint64_t t = time_now_ns();
			unsigned int msec = ((t - last_t) / MSEC);

			// More than 1 ms may have elapsed since the last wake-up, so tick once
			// per elapsed millisecond
			for (unsigned int k = 0; k < msec; k++)
			{
				parent->m_counter_value++;

				while (true)
				{
					// Pop under the lock, call without it so that the function may
					// add or cancel schedules
					Schedule schedule;
					{
						std::lock_guard<std::mutex> lock(parent->m_mtx_map);

						if (parent->m_schedules.empty())
							break;

						// The list is sorted so only the front can be due
						if (parent->m_schedules.front().m_target_counter_value > parent->m_counter_value)
							break;

						schedule = parent->m_schedules.front();
						parent->m_schedules.pop_front();
					}

					if (schedule.m_func)
						schedule.m_func();
				}
			}

			if (msec)
				last_t += msec * MSEC;

			std::this_thread::sleep_for(std::chrono::milliseconds(1));
		}
	}

	static constexpr unsigned long NS_PER_SEC = 1000000000UL;
	static constexpr unsigned long MSEC       = (NS_PER_SEC/1000);

	std::thread m_counter_thread;
	std::atomic<uint64_t> m_counter_value;
	std::atomic<bool> m_is_running;

	struct Schedule
	{
		TimerFunction m_func;
		std::optional<unsigned int> m_id;
		uint64_t m_target_counter_value;
	};

	std::list<Schedule> m_schedules;
	std::mutex m_mtx_map;

	unsigned int m_unique_id;
};

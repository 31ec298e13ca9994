#pragma once

#include <optional>
#include <memory>

#include "interrupt_lock.hpp"
#include "timer.hpp"
#include "error.hpp"
#include "debug.hpp"
#include "inplace_function.hpp"
#include "etl/list.h"
#include "etl/vector.h"

#define MAX_NUM_TASKS 64

#ifndef INPLACE_FUNCTION_SIZE_SCHEDULER
#define INPLACE_FUNCTION_SIZE_SCHEDULER 96
#endif

// Cooperative task queue.  Tasks may be posted from any context; they are run
// one at a time, in priority order and FIFO within a priority, by whichever
// context calls run().  This makes run() the single serialization point for
// all state touched only from tasks.
class Scheduler {

public:
	static const unsigned int HIGHEST_PRIORITY = 0;
	static const unsigned int DEFAULT_PRIORITY = 7;

	using TaskFunction = stdext::inplace_function<void(), INPLACE_FUNCTION_SIZE_SCHEDULER>;

	Scheduler(Timer *timer) : m_timer(timer), m_unique_id(0) {}
	Scheduler(const Scheduler &) = delete;

	class Task
	{
		friend class Scheduler;

	private:
		const char *m_name;
		std::optional<unsigned int> m_id;
		unsigned int m_priority;
		TaskFunction m_func;
	};
	class TaskHandle
	{
		friend class Scheduler;

	public:
		TaskHandle() : m_name(nullptr), m_parent(nullptr) {}

	private:
		const char *m_name;
		Scheduler *m_parent;
		std::optional<unsigned int> m_id;
	};

	// Queue a task to run on a later call to run(), optionally deferred by delay_ms
	TaskHandle post_task_prio(TaskFunction const &task_func, const char *task_name = "Task", unsigned int priority = DEFAULT_PRIORITY, unsigned int delay_ms = 0) {

		Task task;
		task.m_priority = priority;
		task.m_func = task_func;
		task.m_name = task_name;

		{
			InterruptLock lock;
			if (m_tasks.full() || m_deferred.full()) {
				DEBUG_ERROR("Scheduler: post_task_prio: queue full, dropping %s", task_name);
				throw SCHEDULER_QUEUE_FULL;
			}

			task.m_id = m_unique_id++; // Incrementing this is non-atomic so we must do so within a lock

			if (!delay_ms)
				schedule_now(task);
			else
				schedule_deferred(task, delay_ms);
		}

		TaskHandle handle;
		handle.m_id = task.m_id;
		handle.m_parent = this;
		handle.m_name = task_name;

#ifdef SCHEDULER_DEBUG
		DEBUG_TRACE("Scheduler: post_task_prio: added %s", task_name);
#endif
		return handle;
	}

	void cancel_task(TaskHandle &task) {

		if (task.m_parent != this) {
			return; // This handle belongs to another scheduler
		}

		if (!task.m_id.has_value()) {
			return;
		}

		{
			InterruptLock lock;

			auto iter_task = m_tasks.begin();
			while (iter_task != m_tasks.end())
			{
				if (iter_task->m_id == task.m_id)
				{
					iter_task = m_tasks.erase(iter_task);
					break;
				}
				else
					iter_task++;
			}

			// A deferred task also owns a timer schedule which must be cancelled
			auto iter_deferred = m_deferred.begin();
			while (iter_deferred != m_deferred.end())
			{
				if (iter_deferred->task.m_id == task.m_id)
				{
					m_timer->cancel_schedule(iter_deferred->timer_handle);
					iter_deferred = m_deferred.erase(iter_deferred);
				}
				else
					iter_deferred++;
			}
		}

#ifdef SCHEDULER_DEBUG
		DEBUG_TRACE("Scheduler: cancel_task: %s", task.m_name);
#endif

		// Invalidate the task handle in all cases
		task.m_id.reset();
		task.m_parent = nullptr;
	}

	// Runs every task that is ready, including tasks posted by those tasks.
	// Returns true if at least one task ran.
	bool run() {

		bool tasks_ran = false;

		while (true)
		{
			// Retrieve the front task under the lock and then release it so that
			// the task function may post or cancel tasks
			Task task;
			{
				InterruptLock lock;
				if (!m_tasks.size())
					return tasks_ran;

				task = m_tasks.front();
				m_tasks.pop_front();
			}

			if (task.m_func) {
#ifdef SCHEDULER_DEBUG
				DEBUG_TRACE("Scheduler: run: %s", task.m_name);
#endif
				tasks_ran = true;
				task.m_func();
			}
		}
	}

	bool is_scheduled(TaskHandle task) {
		if (task.m_parent != this)
			return false; // This handle belongs to another scheduler

		if (!task.m_id.has_value())
			return false;

		InterruptLock lock;

		for (auto const& t : m_tasks)
			if (t.m_id == task.m_id)
				return true;

		for (auto const& d : m_deferred)
			if (d.task.m_id == task.m_id)
				return true;

		return false;
	}

	void clear_all()
	{
		InterruptLock lock;
		m_tasks.clear();

		auto iter = m_deferred.begin();
		while (iter != m_deferred.end())
		{
			m_timer->cancel_schedule(iter->timer_handle);
			iter = m_deferred.erase(iter);
		}
	}

	bool is_any_task_scheduled()
	{
		InterruptLock lock;
		return m_tasks.size() + m_deferred.size();
	}

	unsigned int num_ready_tasks()
	{
		InterruptLock lock;
		return m_tasks.size();
	}

private:
	struct DeferredTask {
		Task task;
		Timer::TimerHandle timer_handle;
	};

	void schedule_deferred(Task task, unsigned int delay_ms) {
		InterruptLock lock;
		uint64_t t_sched = m_timer->get_counter() + delay_ms;

		// The timer only carries the task id, the task itself waits in m_deferred
		unsigned int id = *task.m_id;
		DeferredTask deferred;
		deferred.task = task;
		deferred.timer_handle = m_timer->add_schedule([this, id]() {
			this->timer_callback_handler(id);
		}, t_sched);

		m_deferred.push_back(deferred);
	}

	void schedule_now(Task task) {
		InterruptLock lock;
		auto iter = m_tasks.begin();
		while (iter != m_tasks.end())
		{
			if (iter->m_priority > task.m_priority)
				break;
			iter++;
		}
		m_tasks.insert(iter, task);
	}

	void timer_callback_handler(unsigned int task_id) {
		InterruptLock lock;
		auto iter = m_deferred.begin();
		while (iter != m_deferred.end())
		{
			if (iter->task.m_id == task_id)
			{
				Task task = iter->task;
				m_deferred.erase(iter);
				schedule_now(task);
				return;
			}
			else
				iter++;
		}
	}

	etl::list<Task, MAX_NUM_TASKS> m_tasks;
	etl::vector<DeferredTask, MAX_NUM_TASKS> m_deferred;
	Timer *m_timer;
	unsigned int m_unique_id;
};

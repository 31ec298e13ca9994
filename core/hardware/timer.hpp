#pragma once

#include <cstdint>
#include <optional>
#include "inplace_function.hpp"

#ifndef INPLACE_FUNCTION_SIZE_TIMER
#define INPLACE_FUNCTION_SIZE_TIMER 48
#endif

// Monotonic millisecond counter with one-shot schedules.  A schedule fires
// from the timer's own context once get_counter() reaches target_count.
class Timer {
public:
	using TimerHandle = std::optional<unsigned int>;
	using TimerFunction = stdext::inplace_function<void(), INPLACE_FUNCTION_SIZE_TIMER>;

	virtual ~Timer() {}
	virtual uint64_t get_counter() = 0;
	virtual TimerHandle add_schedule(TimerFunction const &task_func, uint64_t target_count) = 0;
	virtual void cancel_schedule(TimerHandle &handle) = 0;
	virtual void start() = 0;
	virtual void stop() = 0;
};

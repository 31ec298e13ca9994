#include "deadline_manager.hpp"
#include "fake_timer.hpp"

#include "CppUTest/TestHarness.h"
#include "CppUTestExt/MockSupport.h"


TEST_GROUP(DeadlineManager)
{
	FakeTimer *fake_timer;
	DeadlineManager *deadline_manager;

	void setup() {
		fake_timer = new FakeTimer;
		fake_timer->start();
		deadline_manager = new DeadlineManager(*fake_timer);
	}

	void teardown() {
		delete deadline_manager;
		delete fake_timer;
	}
};


TEST(DeadlineManager, FiresNoEarlierThanDuration)
{
	unsigned int fired = 0;
	auto handle = deadline_manager->schedule(100, [&fired]() { fired++; });
	CHECK_TRUE(deadline_manager->is_armed(handle));

	fake_timer->increment_counter(99);
	CHECK_EQUAL(0U, fired);

	fake_timer->increment_counter(1);
	CHECK_EQUAL(1U, fired);
	CHECK_FALSE(deadline_manager->is_armed(handle));

	fake_timer->increment_counter(1000);
	CHECK_EQUAL(1U, fired);
}

TEST(DeadlineManager, CancelBeforeFirePreventsCallback)
{
	unsigned int fired = 0;
	auto handle = deadline_manager->schedule(100, [&fired]() { fired++; });

	fake_timer->increment_counter(50);
	deadline_manager->cancel(handle);
	CHECK_FALSE(handle.has_value());
	CHECK_EQUAL(0U, deadline_manager->num_armed());
	CHECK_EQUAL(0U, fake_timer->num_schedules());

	fake_timer->increment_counter(100);
	CHECK_EQUAL(0U, fired);
}

TEST(DeadlineManager, CancelIsIdempotent)
{
	unsigned int fired = 0;
	auto handle = deadline_manager->schedule(10, [&fired]() { fired++; });
	auto copy = handle;

	deadline_manager->cancel(handle);
	deadline_manager->cancel(handle);
	deadline_manager->cancel(copy);

	fake_timer->increment_counter(20);
	CHECK_EQUAL(0U, fired);
}

TEST(DeadlineManager, CancelAfterFireIsNoOp)
{
	unsigned int fired = 0;
	auto handle = deadline_manager->schedule(10, [&fired]() { fired++; });
	fake_timer->increment_counter(10);
	CHECK_EQUAL(1U, fired);

	deadline_manager->cancel(handle);
	CHECK_FALSE(handle.has_value());
	CHECK_EQUAL(1U, fired);
}

TEST(DeadlineManager, CancelWinsOverInFlightTimerCallback)
{
	unsigned int fired = 0;
	auto handle = deadline_manager->schedule(10, [&fired]() { fired++; });

	// The timer context has dequeued the schedule but not yet called it
	auto in_flight = fake_timer->take_schedule(*fake_timer->last_schedule_id());
	CHECK_TRUE((bool)in_flight);

	deadline_manager->cancel(handle);
	in_flight();

	CHECK_EQUAL(0U, fired);
}

TEST(DeadlineManager, FireWinsOverLateCancel)
{
	unsigned int fired = 0;
	auto handle = deadline_manager->schedule(10, [&fired]() { fired++; });

	auto in_flight = fake_timer->take_schedule(*fake_timer->last_schedule_id());
	in_flight();
	deadline_manager->cancel(handle);
	in_flight();

	CHECK_EQUAL(1U, fired);
}

TEST(DeadlineManager, IndependentDeadlines)
{
	unsigned int fired_a = 0, fired_b = 0;
	auto a = deadline_manager->schedule(10, [&fired_a]() { fired_a++; });
	auto b = deadline_manager->schedule(20, [&fired_b]() { fired_b++; });
	CHECK_EQUAL(2U, deadline_manager->num_armed());

	deadline_manager->cancel(a);
	fake_timer->increment_counter(20);

	CHECK_EQUAL(0U, fired_a);
	CHECK_EQUAL(1U, fired_b);
	CHECK_FALSE(deadline_manager->is_armed(b));
}

TEST(DeadlineManager, CancelAllDisarmsEverything)
{
	unsigned int fired = 0;
	deadline_manager->schedule(10, [&fired]() { fired++; });
	deadline_manager->schedule(20, [&fired]() { fired++; });

	deadline_manager->cancel_all();
	CHECK_EQUAL(0U, deadline_manager->num_armed());

	fake_timer->increment_counter(50);
	CHECK_EQUAL(0U, fired);
}

TEST(DeadlineManager, BadParametersThrow)
{
	CHECK_THROWS(ErrorCode, deadline_manager->schedule(0, []() {}));
	CHECK_THROWS(ErrorCode, deadline_manager->schedule(10, std::function<void()>()));
	CHECK_EQUAL(0U, deadline_manager->num_armed());
}

TEST(DeadlineManager, CallbackMayScheduleAnotherDeadline)
{
	unsigned int fired = 0;
	DeadlineManager *dm = deadline_manager;
	deadline_manager->schedule(10, [&fired, dm]() {
		fired++;
		dm->schedule(10, [&fired]() { fired++; });
	});

	fake_timer->increment_counter(10);
	CHECK_EQUAL(1U, fired);
	fake_timer->increment_counter(10);
	CHECK_EQUAL(2U, fired);
}

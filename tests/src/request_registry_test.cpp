#include "request_registry.hpp"

#include "CppUTest/TestHarness.h"
#include "CppUTestExt/MockSupport.h"


static LocationRequest make_request(RequestId id, double desired_accuracy) {
	LocationRequest request;
	request.id = id;
	request.desired_accuracy = desired_accuracy;
	request.submitted_at = 0;
	request.deadline = 1000;
	request.status = RequestStatus::PENDING;
	request.callback = [](const FixResult&) {};
	return request;
}


TEST_GROUP(RequestRegistry)
{
	RequestRegistry *registry;

	void setup() {
		registry = new RequestRegistry;
	}

	void teardown() {
		delete registry;
	}
};


TEST(RequestRegistry, EmptyRegistryHasNoStrictestAccuracy)
{
	CHECK_TRUE(registry->is_empty());
	CHECK_EQUAL(0U, registry->size());
	CHECK_FALSE(registry->strictest_accuracy().has_value());
	CHECK_TRUE(registry->all_pending().empty());
}

TEST(RequestRegistry, AddAndContains)
{
	registry->add(make_request(1, 50.0));
	registry->add(make_request(2, 10.0));
	CHECK_TRUE(registry->contains(1));
	CHECK_TRUE(registry->contains(2));
	CHECK_FALSE(registry->contains(3));
	CHECK_EQUAL(2U, registry->size());
}

TEST(RequestRegistry, DuplicateIdThrows)
{
	registry->add(make_request(7, 50.0));
	CHECK_THROWS(ErrorCode, registry->add(make_request(7, 10.0)));
	CHECK_EQUAL(1U, registry->size());
	DOUBLES_EQUAL(50.0, *registry->strictest_accuracy(), 0.0);
}

TEST(RequestRegistry, StrictestAccuracyIsMinimumThreshold)
{
	registry->add(make_request(1, 100.0));
	registry->add(make_request(2, 5.0));
	registry->add(make_request(3, 65.0));
	DOUBLES_EQUAL(5.0, *registry->strictest_accuracy(), 0.0);

	registry->remove(2);
	DOUBLES_EQUAL(65.0, *registry->strictest_accuracy(), 0.0);
}

TEST(RequestRegistry, TakeRemovesExactlyOnce)
{
	registry->add(make_request(1, 100.0));

	auto first = registry->take(1);
	CHECK_TRUE(first.has_value());
	CHECK_EQUAL(1U, first->id);
	CHECK_TRUE(first->callback != nullptr);

	auto second = registry->take(1);
	CHECK_FALSE(second.has_value());
	CHECK_TRUE(registry->is_empty());
}

TEST(RequestRegistry, RemoveUnknownIdIsNoOp)
{
	registry->add(make_request(1, 100.0));
	registry->remove(42);
	CHECK_EQUAL(1U, registry->size());
}

TEST(RequestRegistry, AllPendingIsSnapshot)
{
	registry->add(make_request(1, 100.0));
	registry->add(make_request(2, 10.0));

	auto pending = registry->all_pending();
	for (auto const& request : pending)
		registry->remove(request.id);

	CHECK_EQUAL(2U, pending.size());
	CHECK_TRUE(registry->is_empty());
}

TEST(RequestRegistry, TakeAllEmptiesRegistry)
{
	registry->add(make_request(1, 100.0));
	registry->add(make_request(2, 10.0));
	registry->add(make_request(3, 20.0));

	auto all = registry->take_all();
	CHECK_EQUAL(3U, all.size());
	CHECK_TRUE(registry->is_empty());
	CHECK_FALSE(registry->strictest_accuracy().has_value());
	for (auto const& request : all)
		CHECK_TRUE(request.callback != nullptr);
}

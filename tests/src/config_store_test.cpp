#include "config_store_ram.hpp"

#include <limits>

#include "CppUTest/TestHarness.h"
#include "CppUTestExt/MockSupport.h"


TEST_GROUP(ConfigStore)
{
	RamConfigurationStore *store;

	void setup() {
		store = new RamConfigurationStore;
	}

	void teardown() {
		delete store;
	}
};


TEST(ConfigStore, ReadBeforeInitThrows)
{
	LocationConfig config;
	CHECK_FALSE(store->is_valid());
	CHECK_THROWS(ErrorCode, store->get_location_configuration(config));
}

TEST(ConfigStore, CreateConfigStoreWithDefaultParams)
{
	LocationConfig config;
	store->init();
	CHECK_TRUE(store->is_valid());
	store->get_location_configuration(config);

	CHECK_EQUAL(30000U, config.default_timeout_ms);
	CHECK_TRUE(config.tracking_mode == BaseTrackingMode::LOW_POWER);
	DOUBLES_EQUAL(100.0, config.tracking_accuracy_active, 0.0);
	DOUBLES_EQUAL(1000.0, config.tracking_accuracy_background, 0.0);
	DOUBLES_EQUAL(0.0, config.distance_filter, 0.0);
	CHECK_EQUAL(0U, config.cached_sample_max_age_ms);
}

TEST(ConfigStore, WriteAndReadBack)
{
	LocationConfig config;
	store->init();
	store->get_location_configuration(config);
	config.default_timeout_ms = 5000;
	config.tracking_mode = BaseTrackingMode::ACTIVE;
	config.distance_filter = 25.0;
	store->set_location_configuration(config);

	LocationConfig readback;
	store->get_location_configuration(readback);
	CHECK_EQUAL(5000U, readback.default_timeout_ms);
	CHECK_TRUE(readback.tracking_mode == BaseTrackingMode::ACTIVE);
	DOUBLES_EQUAL(25.0, readback.distance_filter, 0.0);
}

TEST(ConfigStore, InvalidValuesRejectedAndPreviousKept)
{
	store->init();
	LocationConfig config = ConfigurationStore::default_location_config;

	config.default_timeout_ms = 0;
	CHECK_THROWS(ErrorCode, store->set_location_configuration(config));

	config = ConfigurationStore::default_location_config;
	config.tracking_accuracy_active = 0;
	CHECK_THROWS(ErrorCode, store->set_location_configuration(config));

	config = ConfigurationStore::default_location_config;
	config.tracking_accuracy_background = std::numeric_limits<double>::quiet_NaN();
	CHECK_THROWS(ErrorCode, store->set_location_configuration(config));

	config = ConfigurationStore::default_location_config;
	config.distance_filter = -1.0;
	CHECK_THROWS(ErrorCode, store->set_location_configuration(config));

	config = ConfigurationStore::default_location_config;
	config.distance_filter = std::numeric_limits<double>::infinity();
	CHECK_THROWS(ErrorCode, store->set_location_configuration(config));

	LocationConfig readback;
	store->get_location_configuration(readback);
	CHECK_EQUAL(ConfigurationStore::default_location_config.default_timeout_ms, readback.default_timeout_ms);
}

#pragma once

#include "config_store.hpp"
#include "interrupt_lock.hpp"

// Configuration held in memory, defaults applied on init()
class RamConfigurationStore : public ConfigurationStore {
public:
	RamConfigurationStore() : m_is_valid(false) {}

	void init() override {
		InterruptLock lock;
		m_location_config = default_location_config;
		m_is_valid = true;
	}

	bool is_valid() override {
		return m_is_valid;
	}

	void get_location_configuration(LocationConfig& config) override {
		InterruptLock lock;
		if (!m_is_valid)
			throw RESOURCE_NOT_AVAILABLE;
		config = m_location_config;
	}

	void set_location_configuration(const LocationConfig& config) override {
		validate(config);
		InterruptLock lock;
		m_location_config = config;
		m_is_valid = true;
	}

private:
	LocationConfig m_location_config;
	bool m_is_valid;
};

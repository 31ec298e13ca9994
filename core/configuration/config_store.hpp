#pragma once

#include <cmath>

#include "base_types.hpp"
#include "error.hpp"
#include "debug.hpp"

struct LocationConfig {
	unsigned int     default_timeout_ms;
	BaseTrackingMode tracking_mode;
	double           tracking_accuracy_active;       // m
	double           tracking_accuracy_background;   // m
	double           distance_filter;                // m
	unsigned int     cached_sample_max_age_ms;       // 0 disables the age check
};

class ConfigurationStore {
public:
	static inline const LocationConfig default_location_config = {
		30 * 1000,
		BaseTrackingMode::LOW_POWER,
		100.0,
		1000.0,
		0.0,
		0
	};

	virtual ~ConfigurationStore() {}
	virtual void init() = 0;
	virtual bool is_valid() = 0;
	virtual void get_location_configuration(LocationConfig& config) = 0;
	virtual void set_location_configuration(const LocationConfig& config) = 0;

	static void validate(const LocationConfig& config) {
		if (config.default_timeout_ms == 0) {
			DEBUG_ERROR("ConfigurationStore: default_timeout_ms must be non-zero");
			throw BAD_PARAMETER;
		}
		if (!(config.tracking_accuracy_active > 0) || !(config.tracking_accuracy_background > 0)) {
			DEBUG_ERROR("ConfigurationStore: tracking accuracy must be positive");
			throw BAD_PARAMETER;
		}
		if (!(config.distance_filter >= 0) || std::isinf(config.distance_filter)) {
			DEBUG_ERROR("ConfigurationStore: distance_filter must be finite and non-negative");
			throw BAD_PARAMETER;
		}
	}
};

#pragma once

#include <cstdint>
#include <functional>
#include <variant>
#include <optional>

#include "location_provider.hpp"
#include "error.hpp"

using RequestId = unsigned int;

enum class RequestStatus : uint8_t { PENDING, COMPLETED, EXPIRED, CANCELLED };

struct LocationError {
	ErrorCode code;
	int       provider_error;   // Only meaningful for LOCATION_PROVIDER_FAILURE
};

// A one-shot request resolves to either the qualifying sample or an error
using FixResult = std::variant<LocationSample, LocationError>;
using FixCallback = std::function<void(const FixResult&)>;

struct LocationRequest {
	RequestId     id;
	double        desired_accuracy;   // m, strictly positive
	uint64_t      submitted_at;       // Timer counter (ms)
	uint64_t      deadline;           // Timer counter (ms)
	RequestStatus status;
	std::optional<unsigned int> deadline_handle;
	FixCallback   callback;
};

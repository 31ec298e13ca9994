#pragma once

#include <map>
#include <vector>
#include <optional>

#include "location_request.hpp"

// Pending one-shot requests keyed by id.  Holds only PENDING requests: an
// entry is removed as soon as its request resolves.  Not thread safe, owned
// and accessed by LocationScheduler from its serialized tasks only.
class RequestRegistry {
public:
	void add(const LocationRequest& request);
	void remove(RequestId id);
	std::optional<LocationRequest> take(RequestId id);
	bool contains(RequestId id);
	std::vector<LocationRequest> all_pending();
	std::vector<LocationRequest> take_all();
	std::optional<double> strictest_accuracy();
	bool is_empty();
	unsigned int size();

private:
	std::map<RequestId, LocationRequest> m_requests;
};

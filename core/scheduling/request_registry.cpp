#include "request_registry.hpp"
#include "debug.hpp"

void RequestRegistry::add(const LocationRequest& request) {
	if (m_requests.count(request.id)) {
		DEBUG_ERROR("RequestRegistry::add: duplicate request id %u", request.id);
		throw DUPLICATE_REQUEST_ID;
	}
	m_requests.insert({request.id, request});
}

void RequestRegistry::remove(RequestId id) {
	m_requests.erase(id);
}

std::optional<LocationRequest> RequestRegistry::take(RequestId id) {
	auto it = m_requests.find(id);
	if (it == m_requests.end())
		return std::nullopt;

	LocationRequest request = std::move(it->second);
	m_requests.erase(it);
	return request;
}

bool RequestRegistry::contains(RequestId id) {
	return m_requests.count(id) != 0;
}

// Snapshot, later mutation of the registry does not affect the returned set
std::vector<LocationRequest> RequestRegistry::all_pending() {
	std::vector<LocationRequest> pending;
	pending.reserve(m_requests.size());
	for (auto const& p : m_requests)
		pending.push_back(p.second);
	return pending;
}

std::vector<LocationRequest> RequestRegistry::take_all() {
	std::vector<LocationRequest> pending;
	pending.reserve(m_requests.size());
	for (auto& p : m_requests)
		pending.push_back(std::move(p.second));
	m_requests.clear();
	return pending;
}

std::optional<double> RequestRegistry::strictest_accuracy() {
	std::optional<double> strictest;
	for (auto const& p : m_requests) {
		if (!strictest.has_value() || p.second.desired_accuracy < *strictest)
			strictest = p.second.desired_accuracy;
	}
	return strictest;
}

bool RequestRegistry::is_empty() {
	return m_requests.empty();
}

unsigned int RequestRegistry::size() {
	return m_requests.size();
}

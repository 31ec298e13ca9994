#include "haversine.hpp"
#include <cmath>

static constexpr double EARTHRADIUS = 6371000; // In m

static double deg2rad(double degrees)
{
	return degrees * (M_PI / 180.0);
}

static double rad2deg(double radians)
{
	return radians * (180.0 / M_PI);
}

double haversine_distance(double lat1, double lon1, double lat2, double lon2)
{
	double d_lat = deg2rad(lat2 - lat1);
	double d_lon = deg2rad(lon2 - lon1);
	double a = (std::sin(d_lat/2) * std::sin(d_lat/2)) +
               (std::cos(deg2rad(lat1)) * std::cos(deg2rad(lat2)) * std::sin(d_lon/2) * std::sin(d_lon/2));
	double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1-a));
	return EARTHRADIUS * c;
}

void haversine_destination(double lat, double lon, double bearing, double distance_m, double &lat_out, double &lon_out)
{
	double phi1 = deg2rad(lat);
	double lambda1 = deg2rad(lon);
	double theta = deg2rad(bearing);
	double delta = distance_m / EARTHRADIUS;

	double phi2 = std::asin(std::sin(phi1) * std::cos(delta) + std::cos(phi1) * std::sin(delta) * std::cos(theta));
	double lambda2 = lambda1 + std::atan2(std::sin(theta) * std::sin(delta) * std::cos(phi1),
	                                      std::cos(delta) - std::sin(phi1) * std::sin(phi2));

	lat_out = rad2deg(phi2);
	// Normalise to [-180, 180)
	lon_out = std::fmod(rad2deg(lambda2) + 540.0, 360.0) - 180.0;
}

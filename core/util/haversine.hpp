#ifndef __HAVERSINE_HPP_
#define __HAVERSINE_HPP_

// Great-circle distance in metres between two points given in degrees
double haversine_distance(double lat1, double lon1, double lat2, double lon2);

// Point reached from (lat, lon) after distance_m along an initial bearing (degrees from north)
void haversine_destination(double lat, double lon, double bearing, double distance_m, double &lat_out, double &lon_out);

#endif // __HAVERSINE_HPP_

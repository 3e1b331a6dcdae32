#pragma once
#include <cmath>
#include <numbers>
#include <vector>

namespace wfsim {

// Constant naming convention (kCamelCase)
inline constexpr double kPI  = std::numbers::pi_v<double>;
inline constexpr double kDegToRad = kPI / 180.0;

// Planar approximation: km per degree of latitude (longitude scaled by cos(lat)).
inline constexpr double kKmPerDegLat = 111.32;
// Mean Earth radius used for great-circle distances.
inline constexpr double kEarthRadiusKm = 6371.0088;

struct LatLon {
  double lat{};
  double lon{};
};

// Geographic vertex in GeoJSON axis order.
struct LonLat {
  double lon{};
  double lat{};
};

inline double deg_to_rad(double deg) { return deg * kDegToRad; }

// Offset an origin by (dx_km east, dy_km north) using the fixed-latitude
// planar approximation. Accuracy degrades with distance and latitude.
LonLat offset_km(const LatLon& origin, double dx_km, double dy_km);

// Haversine distance on a sphere of kEarthRadiusKm.
double great_circle_km(const LatLon& a, const LatLon& b);

// Distance in km of a vertex from the origin, inverted through the same planar
// approximation used by offset_km.
double planar_distance_km(const LatLon& origin, const LonLat& p);

bool is_finite(const LatLon& p);

} // namespace wfsim

#include <wfsim/geo.hpp>
#include <algorithm>
#include <cmath>

namespace wfsim {

LonLat offset_km(const LatLon& origin, double dx_km, double dy_km) {
  const double lon_scale = std::cos(deg_to_rad(origin.lat));
  return LonLat{
    origin.lon + dx_km / kKmPerDegLat / lon_scale,
    origin.lat + dy_km / kKmPerDegLat
  };
}

double great_circle_km(const LatLon& a, const LatLon& b) {
  const double p1 = deg_to_rad(a.lat);
  const double p2 = deg_to_rad(b.lat);
  const double dp = p2 - p1;
  const double dl = deg_to_rad(b.lon - a.lon);
  const double sp = std::sin(dp * 0.5);
  const double sl = std::sin(dl * 0.5);
  double h = sp*sp + std::cos(p1) * std::cos(p2) * sl*sl;
  h = std::clamp(h, 0.0, 1.0); // rounding can push antipodal points past 1
  return 2.0 * kEarthRadiusKm * std::asin(std::sqrt(h));
}

double planar_distance_km(const LatLon& origin, const LonLat& p) {
  const double lon_scale = std::cos(deg_to_rad(origin.lat));
  const double dx = (p.lon - origin.lon) * kKmPerDegLat * lon_scale;
  const double dy = (p.lat - origin.lat) * kKmPerDegLat;
  return std::sqrt(dx*dx + dy*dy);
}

bool is_finite(const LatLon& p) {
  return std::isfinite(p.lat) && std::isfinite(p.lon);
}

} // namespace wfsim

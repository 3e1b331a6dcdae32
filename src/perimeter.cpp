#include <wfsim/perimeter.hpp>
#include <wfsim/spread.hpp>
#include <cmath>

namespace wfsim {

PerimeterPolygon build_perimeter(const LatLon& origin,
                                 double radius_km,
                                 double wind_effect,
                                 double wind_direction_deg,
                                 AnisotropyMode mode) {
  std::vector<LonLat> pts;
  pts.reserve(kPerimeterVertices);
  for (int angle = 0; angle < 360; angle += kBearingStepDeg) {
    const double a = deg_to_rad(angle);
    const double f = anisotropy_factor(angle, wind_direction_deg, wind_effect, mode);
    const double dx = radius_km * f * std::cos(a);
    const double dy = radius_km * f * std::sin(a);
    pts.push_back(offset_km(origin, dx, dy));
  }
  // set_points() closes the ring by repeating the first vertex
  return PerimeterPolygon{std::move(pts)};
}

} // namespace wfsim

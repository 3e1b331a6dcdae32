#pragma once
#include <cstddef>
#include <utility>
#include <vector>
#include <wfsim/config.hpp>
#include <wfsim/geo.hpp>

namespace wfsim {

inline constexpr int kBearingStepDeg = 10;
inline constexpr std::size_t kPerimeterSamples = 360 / kBearingStepDeg;   // 36
inline constexpr std::size_t kPerimeterVertices = kPerimeterSamples + 1; // closed

// Closed ring of (lon, lat) vertices around an origin.
class PerimeterPolygon {
public:
  PerimeterPolygon() = default;
  explicit PerimeterPolygon(std::vector<LonLat> pts) { set_points(std::move(pts)); }

  void set_points(std::vector<LonLat> pts) {
    pts_ = std::move(pts);
    if (pts_.empty()) return;
    // Ensure closed (repeat first at end if not equal)
    if (pts_.front().lon != pts_.back().lon || pts_.front().lat != pts_.back().lat) {
      pts_.push_back(pts_.front());
    }
  }

  const std::vector<LonLat>& points() const { return pts_; }
  std::size_t size() const { return pts_.size(); }
  bool empty() const { return pts_.empty(); }
  bool closed() const {
    return pts_.size() >= 2 &&
           pts_.front().lon == pts_.back().lon && pts_.front().lat == pts_.back().lat;
  }

private:
  std::vector<LonLat> pts_;
};

// Sample bearings 0, 10, ..., 350 (degrees from east, counter-clockwise) and
// displace each by radius_km * anisotropy_factor. The fixed-latitude planar
// approximation converts km to degrees.
PerimeterPolygon build_perimeter(const LatLon& origin,
                                 double radius_km,
                                 double wind_effect,
                                 double wind_direction_deg,
                                 AnisotropyMode mode);

} // namespace wfsim

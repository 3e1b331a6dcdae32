#pragma once
#include <wfsim/config.hpp>

namespace wfsim {

struct RadiusProfile {
  double radius_km = 0.0;   // isotropic radius, clamped to the cap if any
  double wind_effect = 0.0; // downwind elongation, never clamped
};

// First-order linear spread. elapsed_hours == 0 is the ignition seed
// (kIgnitionRadiusKm, no wind effect), not the general formula at zero.
RadiusProfile compute_radius(double elapsed_hours, const SimulationConfig& cfg);

// Returns true if bearing angle_deg counts as downwind of wind_direction_deg.
bool is_downwind(double angle_deg, double wind_direction_deg, AnisotropyMode mode);

// 1 + wind_effect on downwind bearings, 1 elsewhere.
double anisotropy_factor(double angle_deg, double wind_direction_deg,
                         double wind_effect, AnisotropyMode mode);

// Radius of zone i out of n zones. Zone 0 is the innermost, most severe ring,
// so radius grows with the index; zones are emitted n-1 down to 0.
inline double zone_radius(double radius_km, int zone_index, int zone_count) {
  return radius_km * static_cast<double>(zone_index + 1) / static_cast<double>(zone_count);
}

} // namespace wfsim

#include <wfsim/spread.hpp>
#include <cmath>

namespace wfsim {

RadiusProfile compute_radius(double elapsed_hours, const SimulationConfig& cfg) {
  if (elapsed_hours == 0.0) {
    return RadiusProfile{kIgnitionRadiusKm, 0.0};
  }

  RadiusProfile p{};
  p.radius_km = elapsed_hours * cfg.base_spread_rate_km_per_hour;
  p.wind_effect = cfg.wind_factor() * elapsed_hours * 0.01;

  // Cap the base radius only; elongation keeps growing after saturation.
  if (cfg.max_radius_km && p.radius_km > *cfg.max_radius_km) {
    p.radius_km = *cfg.max_radius_km;
  }
  return p;
}

bool is_downwind(double angle_deg, double wind_direction_deg, AnisotropyMode mode) {
  const double d = std::fabs(angle_deg - wind_direction_deg);
  if (mode == AnisotropyMode::Legacy) {
    return d < 90.0 || d > 270.0;
  }
  double w = std::fmod(d, 360.0);
  if (w > 180.0) w = 360.0 - w;
  return w < 90.0;
}

double anisotropy_factor(double angle_deg, double wind_direction_deg,
                         double wind_effect, AnisotropyMode mode) {
  double factor = 1.0;
  if (is_downwind(angle_deg, wind_direction_deg, mode)) factor += wind_effect;
  return factor;
}

} // namespace wfsim

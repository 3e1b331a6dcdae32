#pragma once
#include <optional>
#include <string>
#include <vector>
#include <wfsim/geo.hpp>

namespace wfsim {

// Downwind test used by the anisotropy factor.
enum class AnisotropyMode : int {
  Legacy = 0,   // raw |angle - dir| < 90 || > 270 (no wrap near 0/360)
  Circular = 1, // wrapped angular distance < 90
};

inline constexpr double kDefaultSpreadRateKmPerHour = 0.2;
inline constexpr double kIgnitionRadiusKm = 0.05;
inline constexpr double kDefaultMaxRadiusKm = 3.0;

// Accepted ranges; keep (total_days + 1) * 24 well inside int.
inline constexpr int kMaxTotalDays = 365;
inline constexpr int kMaxHoursPerStep = 24;

inline constexpr LatLon kPalisadesOrigin{34.0556, -118.5334};
inline constexpr LatLon kPalisadesVillage{34.0453, -118.5265};

// Immutable simulation input; the UI layer's job ends at constructing this.
struct SimulationConfig {
  LatLon origin = kPalisadesOrigin;
  LatLon target = kPalisadesVillage;
  int total_days = 3;           // [1, kMaxTotalDays]
  int hours_per_step = 6;       // [1, kMaxHoursPerStep]
  double wind_direction_deg = 225.0;
  double wind_speed = 15.0;     // mph, >= 0
  double base_spread_rate_km_per_hour = kDefaultSpreadRateKmPerHour;
  std::optional<double> max_radius_km; // absent = unbounded growth
  int zone_count = 1;
  std::vector<std::string> zone_colors; // most severe first
  bool loop = false;
  AnisotropyMode anisotropy = AnisotropyMode::Legacy;

  double wind_factor() const { return wind_speed / 10.0; }
};

// Single perimeter, unbounded growth, playback stops at the end.
SimulationConfig unbounded_config();

// Growth capped at kDefaultMaxRadiusKm, three danger zones, looping playback.
SimulationConfig danger_zone_config();

const std::vector<std::string>& default_zone_colors();

// Throws ConfigError (see errors.hpp) on the first violated bound.
void validate_config(const SimulationConfig& cfg);

} // namespace wfsim

#include <wfsim/config.hpp>
#include <wfsim/errors.hpp>
#include <cmath>
#include <string>

namespace wfsim {

const char* kind_name(ConfigError::Kind k) {
  switch (k) {
    case ConfigError::Kind::InvalidConfiguration: return "InvalidConfiguration";
    case ConfigError::Kind::DegenerateGeometry:   return "DegenerateGeometry";
  }
  return "Unknown";
}

const std::vector<std::string>& default_zone_colors() {
  static const std::vector<std::string> colors{"#bd0026", "#fd8d3c", "#fed976"};
  return colors;
}

SimulationConfig unbounded_config() {
  return SimulationConfig{};
}

SimulationConfig danger_zone_config() {
  SimulationConfig cfg;
  cfg.max_radius_km = kDefaultMaxRadiusKm;
  cfg.zone_count = 3;
  cfg.zone_colors = default_zone_colors();
  cfg.loop = true;
  return cfg;
}

namespace {

[[noreturn]] void invalid(const std::string& what) {
  throw ConfigError(ConfigError::Kind::InvalidConfiguration, what);
}

void check_point(const LatLon& p, const char* name) {
  if (!is_finite(p)) invalid(std::string(name) + " has non-finite coordinates");
  if (p.lat < -90.0 || p.lat > 90.0) invalid(std::string(name) + " latitude out of range [-90, 90]");
  if (p.lon < -180.0 || p.lon > 180.0) invalid(std::string(name) + " longitude out of range [-180, 180]");
}

} // namespace

void validate_config(const SimulationConfig& cfg) {
  if (cfg.total_days < 1 || cfg.total_days > kMaxTotalDays) {
    invalid("total_days must be in [1, " + std::to_string(kMaxTotalDays) + "], got " +
            std::to_string(cfg.total_days));
  }
  if (cfg.hours_per_step < 1 || cfg.hours_per_step > kMaxHoursPerStep) {
    invalid("hours_per_step must be in [1, " + std::to_string(kMaxHoursPerStep) + "], got " +
            std::to_string(cfg.hours_per_step));
  }

  check_point(cfg.origin, "origin");
  check_point(cfg.target, "target");
  // Longitude scale is 1/cos(lat); undefined at the poles.
  if (std::fabs(cfg.origin.lat) >= 90.0) invalid("origin latitude must be strictly inside (-90, 90)");

  if (!std::isfinite(cfg.wind_direction_deg)) invalid("wind_direction_deg must be finite");
  if (!std::isfinite(cfg.wind_speed) || cfg.wind_speed < 0.0) invalid("wind_speed must be finite and >= 0");
  if (!std::isfinite(cfg.base_spread_rate_km_per_hour) || cfg.base_spread_rate_km_per_hour <= 0.0) {
    invalid("base_spread_rate_km_per_hour must be > 0");
  }
  if (cfg.max_radius_km && (!std::isfinite(*cfg.max_radius_km) || *cfg.max_radius_km <= 0.0)) {
    invalid("max_radius_km must be > 0 when set");
  }

  if (cfg.zone_count <= 0) {
    throw ConfigError(ConfigError::Kind::DegenerateGeometry,
                      "zone_count must be >= 1, got " + std::to_string(cfg.zone_count));
  }
  if (cfg.zone_count > 1 && cfg.zone_colors.size() < static_cast<std::size_t>(cfg.zone_count)) {
    throw ConfigError(ConfigError::Kind::DegenerateGeometry,
                      "zone_colors lists " + std::to_string(cfg.zone_colors.size()) +
                      " colors for " + std::to_string(cfg.zone_count) + " zones");
  }
}

} // namespace wfsim

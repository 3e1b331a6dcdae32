#include <wfsim/builder.hpp>
#include <wfsim/geo.hpp>
#include <wfsim/perimeter.hpp>
#include <wfsim/spread.hpp>
#include <wfsim/time_grid.hpp>
#include <cstdio>

namespace wfsim {

static std::string make_label(const TimeStep& st, int zone_index, int zone_count) {
  char buf[96];
  if (zone_count > 1) {
    std::snprintf(buf, sizeof(buf), "Day %d, Hour %d<br>Danger Zone %d", st.day, st.hour, zone_index + 1);
  } else {
    std::snprintf(buf, sizeof(buf), "Day %d, Hour %d<br>Fire Area", st.day, st.hour);
  }
  return std::string(buf);
}

static FireFeature make_feature(const SimulationConfig& cfg,
                                const TimeStep& st,
                                const std::string& timestamp,
                                const RadiusProfile& rp,
                                int zone_index,
                                const ColorStrategy& colors) {
  FireFeature f{};
  f.step = st;
  f.zone_index = zone_index;
  f.radius_km = zone_radius(rp.radius_km, zone_index, cfg.zone_count);
  f.timestamp = timestamp;
  // Wind effect is shared by every zone, not rescaled per ring.
  f.perimeter = build_perimeter(cfg.origin, f.radius_km, rp.wind_effect,
                                cfg.wind_direction_deg, cfg.anisotropy);

  const std::string color = colors.color_for(st, zone_index, cfg);
  f.style.color = color;
  f.style.fill_color = color;
  f.style.fill_opacity = cfg.zone_count > 1 ? 0.4 : 0.6;
  f.style.weight = 1;
  f.icon.fill_color = color;
  f.label = make_label(st, zone_index, cfg.zone_count);
  return f;
}

std::size_t expected_feature_count(const SimulationConfig& cfg) {
  if (cfg.total_days < 0 || cfg.hours_per_step <= 0 || cfg.zone_count <= 0) return 0;
  return (static_cast<std::size_t>(cfg.total_days) + 1) *
         static_cast<std::size_t>(steps_per_day(cfg.hours_per_step)) *
         static_cast<std::size_t>(cfg.zone_count);
}

FireSequence build_fire_sequence(const SimulationConfig& cfg, const ColorStrategy* colors) {
  validate_config(cfg);

  const DayRampColors day_colors;
  const ZonePaletteColors zone_colors{};
  if (colors == nullptr) {
    colors = cfg.zone_count > 1 ? static_cast<const ColorStrategy*>(&zone_colors)
                                : static_cast<const ColorStrategy*>(&day_colors);
  }

  FireSequence seq{};
  seq.features.reserve(expected_feature_count(cfg));

  for (const TimeStep& st : make_time_grid(cfg)) {
    const RadiusProfile rp = compute_radius(st.elapsed_hours(), cfg);
    const std::string ts = format_timestamp(st);
    // Outer ring first so inner, more severe rings paint on top.
    for (int i = cfg.zone_count - 1; i >= 0; --i) {
      seq.features.push_back(make_feature(cfg, st, ts, rp, i, *colors));
    }
  }

  seq.summary = compute_summary(cfg);

  seq.playback.period_hours = cfg.hours_per_step;
  seq.playback.duration_hours = 1;
  seq.playback.auto_play = true;
  seq.playback.loop = cfg.loop;
  return seq;
}

RiskLevel classify_risk(double wind_direction_deg, double wind_speed) {
  if (wind_direction_deg > 180.0 && wind_direction_deg < 270.0 && wind_speed > 10.0) {
    return RiskLevel::High;
  }
  if (wind_speed > 20.0) return RiskLevel::Moderate;
  return RiskLevel::Low;
}

const char* risk_label(RiskLevel r) {
  switch (r) {
    case RiskLevel::Low:      return "Low";
    case RiskLevel::Moderate: return "Moderate";
    case RiskLevel::High:     return "High";
  }
  return "Unknown";
}

DerivedSummary compute_summary(const SimulationConfig& cfg) {
  DerivedSummary s{};
  s.distance_km = great_circle_km(cfg.origin, cfg.target);
  // Current wind only; not time-varying.
  s.estimated_arrival_hours =
    s.distance_km / (cfg.base_spread_rate_km_per_hour * (1.0 + cfg.wind_factor()));
  s.risk = classify_risk(cfg.wind_direction_deg, cfg.wind_speed);
  return s;
}

std::string format_distance(double km) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2f", km);
  return std::string(buf);
}

std::string format_hours(double h) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f", h);
  return std::string(buf);
}

std::vector<std::string> summary_lines(const DerivedSummary& s, const std::string& target_label) {
  return {
    "Distance from fire origin to " + target_label + ": " + format_distance(s.distance_km) + " km",
    "Estimated time to reach " + target_label + ": " + format_hours(s.estimated_arrival_hours) +
      " hours at current conditions",
    std::string("Current Risk Assessment: ") + risk_label(s.risk),
  };
}

} // namespace wfsim

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <wfsim/config.hpp>
#include <wfsim/time_grid.hpp>

namespace wfsim {

struct Rgb {
  std::uint8_t r = 0;
  std::uint8_t g = 0;
  std::uint8_t b = 0;
};

// "#rrggbb" or "rrggbb" (case-insensitive). nullopt on malformed input.
std::optional<Rgb> parse_hex_color(const std::string& s);
std::string to_hex(const Rgb& c);

// Piecewise-linear ramp over equally spaced stops on [vmin, vmax].
class ColorRamp {
public:
  ColorRamp(std::vector<Rgb> stops, double vmin = 0.0, double vmax = 1.0);

  // Same stops over a new domain.
  ColorRamp scaled(double vmin, double vmax) const;

  // Values outside the domain clamp to the end stops.
  Rgb rgb_at(double v) const;
  std::string operator()(double v) const { return to_hex(rgb_at(v)); }

  double vmin() const { return vmin_; }
  double vmax() const { return vmax_; }

  // Sequential 9-class YlOrRd, pale yellow to dark red.
  static ColorRamp yl_or_rd();

private:
  std::vector<Rgb> stops_;
  double vmin_;
  double vmax_;
};

// Pluggable color mapping; geometry never depends on it.
class ColorStrategy {
public:
  virtual ~ColorStrategy() = default;
  virtual std::string color_for(const TimeStep& step, int zone_index,
                                const SimulationConfig& cfg) const = 0;
};

// Ramp scaled to [0, total_days] sampled at day/total_days. Every step of a
// day shares one color.
class DayRampColors : public ColorStrategy {
public:
  explicit DayRampColors(ColorRamp ramp = ColorRamp::yl_or_rd()) : ramp_(std::move(ramp)) {}
  std::string color_for(const TimeStep& step, int zone_index,
                        const SimulationConfig& cfg) const override;
private:
  ColorRamp ramp_;
};

// Continuous ramp over elapsed hours across the whole run.
class ElapsedRampColors : public ColorStrategy {
public:
  explicit ElapsedRampColors(ColorRamp ramp = ColorRamp::yl_or_rd()) : ramp_(std::move(ramp)) {}
  std::string color_for(const TimeStep& step, int zone_index,
                        const SimulationConfig& cfg) const override;
private:
  ColorRamp ramp_;
};

// cfg.zone_colors[zone_index]; fixed per zone.
class ZonePaletteColors : public ColorStrategy {
public:
  std::string color_for(const TimeStep& step, int zone_index,
                        const SimulationConfig& cfg) const override;
};

} // namespace wfsim

#include <wfsim/color.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>

namespace wfsim {

static int hex_digit(char c) {
  const unsigned char u = static_cast<unsigned char>(c);
  if (std::isdigit(u)) return c - '0';
  const char l = static_cast<char>(std::tolower(u));
  if (l >= 'a' && l <= 'f') return 10 + (l - 'a');
  return -1;
}

std::optional<Rgb> parse_hex_color(const std::string& s) {
  std::string h = (!s.empty() && s[0] == '#') ? s.substr(1) : s;
  if (h.size() != 6) return std::nullopt;
  std::uint8_t v[3]{};
  for (int i = 0; i < 3; ++i) {
    const int hi = hex_digit(h[2*i]);
    const int lo = hex_digit(h[2*i + 1]);
    if (hi < 0 || lo < 0) return std::nullopt;
    v[i] = static_cast<std::uint8_t>(hi * 16 + lo);
  }
  return Rgb{v[0], v[1], v[2]};
}

std::string to_hex(const Rgb& c) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", c.r, c.g, c.b);
  return std::string(buf);
}

ColorRamp::ColorRamp(std::vector<Rgb> stops, double vmin, double vmax)
  : stops_(std::move(stops)), vmin_(vmin), vmax_(vmax) {
  if (stops_.empty()) stops_.push_back(Rgb{});
}

ColorRamp ColorRamp::scaled(double vmin, double vmax) const {
  return ColorRamp{stops_, vmin, vmax};
}

Rgb ColorRamp::rgb_at(double v) const {
  const std::size_t n = stops_.size();
  if (n == 1 || !(vmax_ > vmin_)) return stops_.front();

  double u = (v - vmin_) / (vmax_ - vmin_);
  if (!std::isfinite(u)) u = 0.0;
  u = std::clamp(u, 0.0, 1.0);

  const double pos = u * static_cast<double>(n - 1);
  const std::size_t i0 = std::min(static_cast<std::size_t>(pos), n - 2);
  const double t = pos - static_cast<double>(i0);
  const Rgb& a = stops_[i0];
  const Rgb& b = stops_[i0 + 1];
  auto mix = [t](std::uint8_t x, std::uint8_t y) {
    return static_cast<std::uint8_t>(std::lround(x + (double(y) - double(x)) * t));
  };
  return Rgb{mix(a.r, b.r), mix(a.g, b.g), mix(a.b, b.b)};
}

ColorRamp ColorRamp::yl_or_rd() {
  return ColorRamp{{
    {0xff, 0xff, 0xcc}, {0xff, 0xed, 0xa0}, {0xfe, 0xd9, 0x76},
    {0xfe, 0xb2, 0x4c}, {0xfd, 0x8d, 0x3c}, {0xfc, 0x4e, 0x2a},
    {0xe3, 0x1a, 0x1c}, {0xbd, 0x00, 0x26}, {0x80, 0x00, 0x26},
  }};
}

std::string DayRampColors::color_for(const TimeStep& step, int /*zone_index*/,
                                      const SimulationConfig& cfg) const {
  const double days = static_cast<double>(cfg.total_days);
  const double intensity = cfg.total_days > 0 ? step.day / days : 0.0;
  return ramp_.scaled(0.0, days)(intensity);
}

std::string ElapsedRampColors::color_for(const TimeStep& step, int /*zone_index*/,
                                          const SimulationConfig& cfg) const {
  const TimeStep last{cfg.total_days, (steps_per_day(cfg.hours_per_step) - 1) * cfg.hours_per_step};
  const double span = static_cast<double>(last.elapsed_hours());
  return ramp_.scaled(0.0, span > 0.0 ? span : 1.0)(step.elapsed_hours());
}

std::string ZonePaletteColors::color_for(const TimeStep& /*step*/, int zone_index,
                                         const SimulationConfig& cfg) const {
  const auto i = static_cast<std::size_t>(zone_index < 0 ? 0 : zone_index);
  if (i < cfg.zone_colors.size()) return cfg.zone_colors[i];
  const auto& fallback = default_zone_colors();
  return fallback[std::min(i, fallback.size() - 1)];
}

} // namespace wfsim

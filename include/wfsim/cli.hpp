#pragma once
#include <optional>
#include <string>
#include <vector>
#include <wfsim/config.hpp>

namespace wfsim {

enum class ColorBy : int { Day = 0, Elapsed = 1 };

// Parsed wfsim_export command line. Overrides are applied on top of the
// chosen variant and scenario; unset fields keep the variant defaults.
struct ExportOptions {
  std::string scenario = "Palisades";
  std::optional<std::string> catalog_path;
  std::optional<std::string> out_path;   // nullopt = stdout
  std::optional<std::string> summary_json_path;
  bool zones = false;
  bool circular_wind = false;
  bool print_summary = false;
  bool help = false;
  ColorBy color_by = ColorBy::Day;
  std::optional<int> days;
  std::optional<int> hours_per_step;
  std::optional<double> wind_direction_deg;
  std::optional<double> wind_speed;
  std::optional<double> max_radius_km;
};

// Returns nullopt on an unknown flag, a missing value or a malformed number;
// error receives a one-line reason.
std::optional<ExportOptions> parse_export_args(const std::vector<std::string>& args,
                                               std::string& error);

// Variant defaults plus overrides (origin/target are set separately).
SimulationConfig config_from_options(const ExportOptions& opt);

const char* export_usage();

} // namespace wfsim

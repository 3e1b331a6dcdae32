#include <wfsim/cli.hpp>
#include <wfsim/text.hpp>
#include <cstddef>
#include <type_traits>

namespace wfsim {

const char* export_usage() {
  return
    "Usage: wfsim_export [options]\n"
    "  --scenario KEY       scenario key (default Palisades)\n"
    "  --catalog FILE.csv   load scenarios from CSV instead of the built-in catalog\n"
    "  --days N             simulation days (1..365)\n"
    "  --step H             hours per step (1..24)\n"
    "  --wind-dir DEG       wind direction in degrees\n"
    "  --wind-speed V       wind speed (mph)\n"
    "  --zones              capped growth with three danger zones (looping playback)\n"
    "  --max-radius KM      cap for the base radius\n"
    "  --circular-wind      wrapped downwind test instead of the legacy raw difference\n"
    "  --color-by day|elapsed\n"
    "  --out FILE           write GeoJSON to FILE (default stdout)\n"
    "  --summary            print distance / arrival / risk lines to stderr\n"
    "  --summary-json FILE  write distance / arrival / risk as JSON to FILE\n"
    "  --help\n";
}

std::optional<ExportOptions> parse_export_args(const std::vector<std::string>& args,
                                               std::string& error) {
  ExportOptions opt;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& a = args[i];
    auto value = [&](std::string& out) {
      if (i + 1 >= args.size()) { error = "missing value for " + a; return false; }
      out = args[++i];
      return true;
    };
    auto number = [&](auto& slot) {
      std::string v;
      if (!value(v)) return false;
      using T = typename std::remove_reference_t<decltype(slot)>::value_type;
      std::optional<T> parsed;
      if constexpr (std::is_same_v<T, int>) parsed = parse_int(v);
      else parsed = parse_double(v);
      if (!parsed) { error = "malformed number for " + a + ": '" + v + "'"; return false; }
      slot = parsed;
      return true;
    };

    if (a == "--help" || a == "-h")     { opt.help = true; }
    else if (a == "--zones")            { opt.zones = true; }
    else if (a == "--circular-wind")    { opt.circular_wind = true; }
    else if (a == "--summary")          { opt.print_summary = true; }
    else if (a == "--scenario")         { if (!value(opt.scenario)) return std::nullopt; }
    else if (a == "--catalog")          { std::string v; if (!value(v)) return std::nullopt; opt.catalog_path = v; }
    else if (a == "--out")              { std::string v; if (!value(v)) return std::nullopt; opt.out_path = v; }
    else if (a == "--summary-json")     { std::string v; if (!value(v)) return std::nullopt; opt.summary_json_path = v; }
    else if (a == "--days")             { if (!number(opt.days)) return std::nullopt; }
    else if (a == "--step")             { if (!number(opt.hours_per_step)) return std::nullopt; }
    else if (a == "--wind-dir")         { if (!number(opt.wind_direction_deg)) return std::nullopt; }
    else if (a == "--wind-speed")       { if (!number(opt.wind_speed)) return std::nullopt; }
    else if (a == "--max-radius")       { if (!number(opt.max_radius_km)) return std::nullopt; }
    else if (a == "--color-by") {
      std::string v;
      if (!value(v)) return std::nullopt;
      if (v == "day") opt.color_by = ColorBy::Day;
      else if (v == "elapsed") opt.color_by = ColorBy::Elapsed;
      else { error = "unknown --color-by mode '" + v + "'"; return std::nullopt; }
    }
    else { error = "unknown option '" + a + "'"; return std::nullopt; }
  }
  return opt;
}

SimulationConfig config_from_options(const ExportOptions& opt) {
  SimulationConfig cfg = opt.zones ? danger_zone_config() : unbounded_config();
  if (opt.days)               cfg.total_days = *opt.days;
  if (opt.hours_per_step)     cfg.hours_per_step = *opt.hours_per_step;
  if (opt.wind_direction_deg) cfg.wind_direction_deg = *opt.wind_direction_deg;
  if (opt.wind_speed)         cfg.wind_speed = *opt.wind_speed;
  if (opt.max_radius_km)      cfg.max_radius_km = *opt.max_radius_km;
  if (opt.circular_wind)      cfg.anisotropy = AnisotropyMode::Circular;
  return cfg;
}

} // namespace wfsim

#pragma once
#include <optional>
#include <string>
#include <vector>
#include <istream>
#include <wfsim/config.hpp>

namespace wfsim {

struct Scenario {
  std::string key;            // e.g., "Palisades"
  LatLon origin;              // fire origin
  LatLon target;              // protected location
  std::string target_label;   // e.g., "Palisades Village"
  double protected_radius_m;  // buffer drawn around the target
};

// Built-in tiny catalog (default/fallback).
const std::vector<Scenario>& scenario_catalog();

// Lookup helpers
std::optional<Scenario> scenario_by_key(const std::string& key);

// Lookup within a specific catalog (e.g., CSV-loaded)
std::optional<Scenario> scenario_by_key_in(const std::vector<Scenario>& cat, const std::string& key);

// Stream-based CSV loader (test-friendly; no filesystem required).
// Columns: key,origin_lat,origin_lon,target_lat,target_lon,target_label,protected_radius_m
// Accepts an optional header row; ignores lines starting with '#' and blank lines.
// Whitespace around fields is trimmed. Invalid rows are skipped.
std::vector<Scenario> scenario_catalog_from_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<std::vector<Scenario>> load_scenario_catalog_csv(const std::string& path);

// Convenience: copy of cfg with origin/target taken from a Scenario.
inline SimulationConfig apply_scenario(SimulationConfig cfg, const Scenario& s) {
  cfg.origin = s.origin;
  cfg.target = s.target;
  return cfg;
}

} // namespace wfsim

#include <wfsim/scenario.hpp>
#include <wfsim/text.hpp>
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <fstream>

namespace wfsim {

static constexpr std::size_t kScenarioColumns = 7;

// First column named "key" marks the optional header row.
static bool is_header_row(const std::vector<std::string>& cols) {
  if (cols.size() < kScenarioColumns || cols[0].size() != 3) return false;
  std::string k = cols[0];
  for (char& c : k) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return k == "key";
}

static bool in_range(const LatLon& p) {
  return p.lat > -90.0 && p.lat < 90.0 && p.lon >= -180.0 && p.lon <= 180.0;
}

static std::optional<Scenario> parse_scenario_row(const std::vector<std::string>& cols) {
  if (cols.size() < kScenarioColumns || cols[0].empty()) return std::nullopt;
  const auto olat = parse_double(cols[1]);
  const auto olon = parse_double(cols[2]);
  const auto tlat = parse_double(cols[3]);
  const auto tlon = parse_double(cols[4]);
  const auto radius = parse_double(cols[6]);
  if (!olat || !olon || !tlat || !tlon || !radius) return std::nullopt;

  const LatLon origin{*olat, *olon};
  const LatLon target{*tlat, *tlon};
  if (!in_range(origin) || !in_range(target)) return std::nullopt;

  Scenario s{cols[0], origin, target, cols[5].empty() ? cols[0] : cols[5], std::max(0.0, *radius)};
  return s;
}

static std::vector<Scenario> make_catalog_builtin() {
  return {
    {"Palisades", kPalisadesOrigin, kPalisadesVillage, "Palisades Village", 300.0},
  };
}

const std::vector<Scenario>& scenario_catalog() {
  static const std::vector<Scenario> cat = make_catalog_builtin();
  return cat;
}

std::optional<Scenario> scenario_by_key(const std::string& key) {
  return scenario_by_key_in(scenario_catalog(), key);
}

std::optional<Scenario> scenario_by_key_in(const std::vector<Scenario>& cat, const std::string& key) {
  auto it = std::find_if(cat.begin(), cat.end(), [&](const Scenario& s){ return s.key == key; });
  if (it == cat.end()) return std::nullopt;
  return *it;
}

std::vector<Scenario> scenario_catalog_from_csv_stream(std::istream& in) {
  std::vector<Scenario> out;
  std::string line;
  bool header_consumed = false;

  while (std::getline(in, line)) {
    const std::string raw = trim(line);
    if (raw.empty() || raw[0] == '#') continue;

    const auto cols = split_fields(raw);

    if (!header_consumed && is_header_row(cols)) {
      header_consumed = true;
      continue;
    }

    if (auto row = parse_scenario_row(cols); row.has_value()) {
      out.push_back(*row);
    }
  }
  return out;
}

std::optional<std::vector<Scenario>> load_scenario_catalog_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return scenario_catalog_from_csv_stream(f);
}

} // namespace wfsim

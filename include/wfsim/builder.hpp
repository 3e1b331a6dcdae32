#pragma once
#include <string>
#include <vector>
#include <wfsim/color.hpp>
#include <wfsim/config.hpp>
#include <wfsim/feature.hpp>

namespace wfsim {

// Full rebuild for one configuration: validates, walks the time grid and
// emits features outer-ring-first within each step, then computes the
// summary once. Throws ConfigError before producing anything.
// colors == nullptr selects DayRampColors for one zone, ZonePaletteColors otherwise.
FireSequence build_fire_sequence(const SimulationConfig& cfg,
                                 const ColorStrategy* colors = nullptr);

// Expected feature count for a valid config.
std::size_t expected_feature_count(const SimulationConfig& cfg);

// Rule order matters: High short-circuits Moderate.
RiskLevel classify_risk(double wind_direction_deg, double wind_speed);
const char* risk_label(RiskLevel r);

DerivedSummary compute_summary(const SimulationConfig& cfg);

// Display formatting: 2 decimals for km, 1 decimal for hours.
std::string format_distance(double km);
std::string format_hours(double h);

// Status lines for a text display collaborator.
std::vector<std::string> summary_lines(const DerivedSummary& s, const std::string& target_label);

} // namespace wfsim

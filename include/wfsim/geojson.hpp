#pragma once
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <wfsim/feature.hpp>

namespace wfsim {

// ISO-8601 duration for whole hours, e.g. "PT6H".
std::string iso_duration_hours(int hours);

// Escape for embedding inside a JSON string literal (no surrounding quotes).
std::string json_escape(const std::string& s);

// FeatureCollection with a sibling "playback" object holding PlaybackOptions.
// Features are written in sequence order.
void write_feature_collection(std::ostream& out, const FireSequence& seq);

// {"distance_km":..,"estimated_arrival_hours":..,"risk":".."}
void write_summary_json(std::ostream& out, const DerivedSummary& s);

// Filesystem wrapper around write_summary_json; false if the file cannot be written.
bool save_summary_json(const std::string& path, const DerivedSummary& s);

// Filesystem wrapper; returns nullopt if the file cannot be written,
// otherwise the number of features written.
std::optional<std::size_t> save_feature_collection(const std::string& path, const FireSequence& seq);

} // namespace wfsim

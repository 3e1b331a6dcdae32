#pragma once
#include <string>
#include <vector>
#include <wfsim/perimeter.hpp>
#include <wfsim/time_grid.hpp>

namespace wfsim {

// Polygon style consumed by the map renderer.
struct FeatureStyle {
  std::string color;        // stroke
  std::string fill_color;
  double fill_opacity = 0.6;
  int weight = 1;           // stroke weight (px)
};

// Marker style used by temporal renderers for point-like playback.
struct IconStyle {
  std::string icon = "circle";
  std::string fill_color;
  double fill_opacity = 0.6;
  bool stroke = true;
  int radius = 5;
  int weight = 2;
  double opacity = 0.8;
  std::string color = "red";
};

// One rendering unit. Immutable once built.
struct FireFeature {
  TimeStep step{};
  int zone_index = 0;     // 0 = most severe (innermost)
  double radius_km = 0.0; // ring radius before anisotropy
  std::string timestamp;  // "YYYY-MM-DD HH:MM:SS"
  PerimeterPolygon perimeter;
  FeatureStyle style;
  IconStyle icon;
  std::string label;
};

enum class RiskLevel : int { Low = 0, Moderate = 1, High = 2 };

struct DerivedSummary {
  double distance_km = 0.0;
  double estimated_arrival_hours = 0.0;
  RiskLevel risk = RiskLevel::Low;
};

// Options for a TimestampedGeoJson-style player.
struct PlaybackOptions {
  int period_hours = 1;    // step interval
  int duration_hours = 1;  // how long each feature stays visible
  bool auto_play = true;
  bool loop = false;
  bool add_last_point = true;
  int max_speed = 5;
  bool loop_button = true;
  std::string date_options = "YYYY-MM-DD HH:mm:ss";
  bool time_slider_drag_update = true;
};

// Ordered by (day, hour, zone index descending).
struct FireSequence {
  std::vector<FireFeature> features;
  DerivedSummary summary;
  PlaybackOptions playback;
};

} // namespace wfsim

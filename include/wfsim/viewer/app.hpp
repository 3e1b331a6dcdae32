#pragma once
#include <string>
#include <wfsim/config.hpp>
#include <wfsim/feature.hpp>
#include <wfsim/playback.hpp>
#include <wfsim/scenario.hpp>

namespace wfsim {

// RAII application that plays a fire sequence back over a local map frame.
// Every parameter change triggers a full synchronous rebuild.
class ViewerApp {
public:
  ViewerApp(Scenario scenario, SimulationConfig cfg);
  int run(); // returns 0 on normal exit

private:
  // Input & data flow
  void process_input_();
  void rebuild_();
  // Rendering
  void render_frame_();
  void draw_grid_();
  void draw_markers_();
  void draw_frame_features_();
  void draw_hud_();

  // Helpers
  struct Vec2f { float x; float y; };
  Vec2f geoToScreen_(double lat, double lon) const;

  // Model
  Scenario scenario_;
  SimulationConfig cfg_;
  FireSequence seq_{};
  Playback playback_{};
  std::string error_;       // last ConfigError message, shown in the HUD
  std::string saved_path_;

  // UI state
  float  scale_px_per_km_{90.0f};
  double hours_per_second_{6.0}; // playback speed
  // Camera pan (km)
  float pan_x_km_{0.0f};
  float pan_y_km_{0.0f};
};

} // namespace wfsim

#include <raylib.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <string>
#include <utility>
#include <vector>

#include <wfsim/viewer/app.hpp>
#include <wfsim/builder.hpp>
#include <wfsim/color.hpp>
#include <wfsim/errors.hpp>
#include <wfsim/geo.hpp>
#include <wfsim/geojson.hpp>

namespace wfsim {

namespace {

// UI bounds for the parameter controls (the engine itself only checks >= 1).
static constexpr int kMinDays = 1, kMaxDays = 7;
static constexpr int kMinStepH = 1, kMaxStepH = 12;
static constexpr double kMaxWindSpeed = 30.0;

static const char* speedLabel(double hps) {
  if (hps == 1.0)  return "1 h/s";
  if (hps == 3.0)  return "3 h/s";
  if (hps == 6.0)  return "6 h/s";
  if (hps == 12.0) return "12 h/s";
  if (hps == 24.0) return "24 h/s";
  return "custom";
}

static Color toColor(const std::string& hex, double opacity) {
  const auto rgb = parse_hex_color(hex).value_or(Rgb{255, 0, 0});
  const double a = std::clamp(opacity, 0.0, 1.0) * 255.0;
  return Color{rgb.r, rgb.g, rgb.b, static_cast<unsigned char>(std::lround(a))};
}

static Color riskColor(RiskLevel r) {
  switch (r) {
    case RiskLevel::High:     return Color{235, 80, 60, 255};
    case RiskLevel::Moderate: return Color{240, 180, 40, 255};
    case RiskLevel::Low:      return Color{110, 210, 120, 255};
  }
  return RAYWHITE;
}

static std::string timestamp_yyyyMMdd_HHmmss_() {
  std::time_t t = std::time(nullptr);
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
  return std::string(buf);
}

// --- HUD layout (keep in sync with draw_hud_) ---
static constexpr int kHUD_X = 20;
static constexpr int kHUD_LINE_H = 22;

} // namespace

// ---- ViewerApp ----

ViewerApp::ViewerApp(Scenario scenario, SimulationConfig cfg)
  : scenario_(std::move(scenario)), cfg_(std::move(cfg)) {
  cfg_ = apply_scenario(cfg_, scenario_);
  rebuild_();
}

ViewerApp::Vec2f ViewerApp::geoToScreen_(double lat, double lon) const {
  // Map centered between origin and target, planar km frame.
  const double clat = (scenario_.origin.lat + scenario_.target.lat) * 0.5;
  const double clon = (scenario_.origin.lon + scenario_.target.lon) * 0.5;
  const double x_km = (lon - clon) * kKmPerDegLat * std::cos(deg_to_rad(clat));
  const double y_km = (lat - clat) * kKmPerDegLat;
  const float cx = GetScreenWidth()  * 0.5f + pan_x_km_ * scale_px_per_km_;
  const float cy = GetScreenHeight() * 0.5f - pan_y_km_ * scale_px_per_km_;
  return { cx + float(x_km * scale_px_per_km_), cy - float(y_km * scale_px_per_km_) };
}

void ViewerApp::rebuild_() {
  try {
    seq_ = build_fire_sequence(cfg_);
    const bool was_playing = playback_.playing;
    const std::size_t frame = playback_.frame();
    playback_.reset(seq_);
    if (frame > 0) {
      playback_.seek_frame(frame);
      playback_.playing = was_playing;
    }
    error_.clear();
  } catch (const ConfigError& e) {
    // Keep the last good sequence on screen; report the rejected change.
    error_ = std::string(kind_name(e.kind())) + ": " + e.what();
  }
}

int ViewerApp::run() {
  const int W = 1280, H = 800;
  InitWindow(W, H, "wfsim - Fire Spread Viewer");
  SetTargetFPS(60);

  while (!WindowShouldClose()) {
    process_input_();
    playback_.advance(GetFrameTime() * hours_per_second_);
    render_frame_();
  }

  CloseWindow();
  return 0;
}

void ViewerApp::process_input_() {
  // Playback controls
  if (IsKeyPressed(KEY_SPACE)) {
    if (!playback_.playing && playback_.at_end() && !playback_.loop()) playback_.seek_frame(0);
    playback_.playing = !playback_.playing;
  }
  if (IsKeyPressed(KEY_RIGHT) && IsKeyDown(KEY_LEFT_SHIFT)) { playback_.playing = false; playback_.step_forward(); }
  if (IsKeyPressed(KEY_LEFT)  && IsKeyDown(KEY_LEFT_SHIFT)) { playback_.playing = false; playback_.step_back(); }
  if (IsKeyPressed(KEY_HOME)) playback_.seek_frame(0);
  if (IsKeyPressed(KEY_L))    { cfg_.loop = !cfg_.loop; playback_.set_loop(cfg_.loop); }

  if (IsKeyPressed(KEY_ONE))   hours_per_second_ = 1.0;
  if (IsKeyPressed(KEY_TWO))   hours_per_second_ = 3.0;
  if (IsKeyPressed(KEY_THREE)) hours_per_second_ = 6.0;
  if (IsKeyPressed(KEY_FOUR))  hours_per_second_ = 12.0;
  if (IsKeyPressed(KEY_FIVE))  hours_per_second_ = 24.0;

  // Zoom
  if (IsKeyDown(KEY_KP_ADD) || IsKeyDown(KEY_PAGE_UP))        scale_px_per_km_ *= 1.01f;
  if (IsKeyDown(KEY_KP_SUBTRACT) || IsKeyDown(KEY_PAGE_DOWN)) scale_px_per_km_ *= 0.99f;

  // Camera pan
  if (!IsKeyDown(KEY_LEFT_SHIFT)) {
    const float pan_step = 0.02f; // km per frame while key held
    if (IsKeyDown(KEY_LEFT))  pan_x_km_ += pan_step;
    if (IsKeyDown(KEY_RIGHT)) pan_x_km_ -= pan_step;
    if (IsKeyDown(KEY_UP))    pan_y_km_ -= pan_step;
    if (IsKeyDown(KEY_DOWN))  pan_y_km_ += pan_step;
  }
  if (IsKeyPressed(KEY_C)) { pan_x_km_ = 0.0f; pan_y_km_ = 0.0f; }

  // Simulation parameters (sidebar equivalents); each change rebuilds.
  bool dirty = false;
  if (IsKeyPressed(KEY_A)) { cfg_.wind_direction_deg = std::fmod(cfg_.wind_direction_deg + 345.0, 360.0); dirty = true; }
  if (IsKeyPressed(KEY_D)) { cfg_.wind_direction_deg = std::fmod(cfg_.wind_direction_deg + 15.0, 360.0);  dirty = true; }
  if (IsKeyPressed(KEY_W)) { cfg_.wind_speed = std::min(kMaxWindSpeed, cfg_.wind_speed + 1.0); dirty = true; }
  if (IsKeyPressed(KEY_S)) { cfg_.wind_speed = std::max(0.0, cfg_.wind_speed - 1.0); dirty = true; }
  if (IsKeyPressed(KEY_LEFT_BRACKET))  { cfg_.total_days = std::max(kMinDays, cfg_.total_days - 1); dirty = true; }
  if (IsKeyPressed(KEY_RIGHT_BRACKET)) { cfg_.total_days = std::min(kMaxDays, cfg_.total_days + 1); dirty = true; }
  if (IsKeyPressed(KEY_MINUS)) { cfg_.hours_per_step = std::max(kMinStepH, cfg_.hours_per_step - 1); dirty = true; }
  if (IsKeyPressed(KEY_EQUAL)) { cfg_.hours_per_step = std::min(kMaxStepH, cfg_.hours_per_step + 1); dirty = true; }
  if (IsKeyPressed(KEY_G)) {
    cfg_.anisotropy = (cfg_.anisotropy == AnisotropyMode::Legacy) ? AnisotropyMode::Circular
                                                                   : AnisotropyMode::Legacy;
    dirty = true;
  }

  // Toggle variant, keeping the shared parameters
  if (IsKeyPressed(KEY_Z)) {
    SimulationConfig next = (cfg_.zone_count > 1) ? unbounded_config() : danger_zone_config();
    next.origin = cfg_.origin;
    next.target = cfg_.target;
    next.total_days = cfg_.total_days;
    next.hours_per_step = cfg_.hours_per_step;
    next.wind_direction_deg = cfg_.wind_direction_deg;
    next.wind_speed = cfg_.wind_speed;
    next.anisotropy = cfg_.anisotropy;
    cfg_ = next;
    dirty = true;
  }

  if (dirty) rebuild_();

  // Export current sequence
  if (IsKeyPressed(KEY_E)) {
    const std::string path = "fire_sequence_" + timestamp_yyyyMMdd_HHmmss_() + ".geojson";
    if (save_feature_collection(path, seq_)) saved_path_ = path;
    else saved_path_ = "(failed to write " + path + ")";
  }
}

void ViewerApp::render_frame_() {
  BeginDrawing();
  ClearBackground(Color{34, 40, 36, 255});

  draw_grid_();
  draw_frame_features_();
  draw_markers_();
  draw_hud_();
  EndDrawing();
}

void ViewerApp::draw_grid_() {
  // 1 km grid around the map center
  const Color line{52, 60, 54, 255};
  const int W = GetScreenWidth(), H = GetScreenHeight();
  const float cx = W * 0.5f + pan_x_km_ * scale_px_per_km_;
  const float cy = H * 0.5f - pan_y_km_ * scale_px_per_km_;
  if (scale_px_per_km_ < 4.0f) return;
  for (float x = std::fmod(cx, scale_px_per_km_); x < W; x += scale_px_per_km_) DrawLine(int(x), 0, int(x), H, line);
  for (float y = std::fmod(cy, scale_px_per_km_); y < H; y += scale_px_per_km_) DrawLine(0, int(y), W, int(y), line);
}

void ViewerApp::draw_frame_features_() {
  if (seq_.features.empty()) return;
  const auto o = geoToScreen_(cfg_.origin.lat, cfg_.origin.lon);
  const Vector2 center{o.x, o.y};

  // Emission order is paint order: outer ring first, severe rings on top.
  const auto [b, e] = playback_.frame_range(playback_.frame());
  for (std::size_t i = b; i < e; ++i) {
    const FireFeature& f = seq_.features[i];
    const auto& pts = f.perimeter.points();
    if (pts.size() < 2) continue;
    const Color fill = toColor(f.style.fill_color, f.style.fill_opacity);
    const Color edge = toColor(f.style.color, 1.0);

    std::vector<Vector2> sp;
    sp.reserve(pts.size());
    for (const auto& p : pts) {
      const auto s = geoToScreen_(p.lat, p.lon);
      sp.push_back({s.x, s.y});
    }
    // Fan around the origin; the ring is star-shaped about it. Screen y is
    // flipped, so reverse the pair to keep raylib's counter-clockwise winding.
    for (std::size_t k = 1; k < sp.size(); ++k) {
      DrawTriangle(center, sp[k], sp[k-1], fill);
    }
    for (std::size_t k = 1; k < sp.size(); ++k) {
      DrawLineEx(sp[k-1], sp[k], float(std::max(1, f.style.weight)), edge);
    }
  }
}

void ViewerApp::draw_markers_() {
  // Protected zone around the target
  const auto t = geoToScreen_(scenario_.target.lat, scenario_.target.lon);
  const float zone_px = float(scenario_.protected_radius_m / 1000.0) * scale_px_per_km_;
  DrawCircleV({t.x, t.y}, zone_px, Color{60, 120, 255, 26});
  DrawCircleLines(int(t.x), int(t.y), zone_px, Color{60, 120, 255, 200});
  DrawCircleV({t.x, t.y}, 6.0f, Color{60, 120, 255, 255});
  DrawText(scenario_.target_label.c_str(), int(t.x) + 10, int(t.y) - 8, 16, Color{200, 215, 255, 255});

  // Fire origin
  const auto o = geoToScreen_(cfg_.origin.lat, cfg_.origin.lon);
  DrawCircleV({o.x, o.y}, 6.0f, Color{230, 40, 30, 255});
  DrawText("Fire Origin", int(o.x) + 10, int(o.y) - 8, 16, Color{255, 200, 190, 255});

  // Wind arrow in the same frame as the perimeter bearings (0 = east, CCW)
  const double w = deg_to_rad(cfg_.wind_direction_deg);
  const Vector2 base{GetScreenWidth() - 80.0f, 90.0f};
  const Vector2 tip{base.x + float(std::cos(w)) * 40.0f, base.y - float(std::sin(w)) * 40.0f};
  DrawCircleLines(int(base.x), int(base.y), 44.0f, Color{120, 130, 125, 255});
  DrawLineEx(base, tip, 3.0f, Color{220, 235, 220, 255});
  DrawCircleV(tip, 4.0f, Color{220, 235, 220, 255});
}

void ViewerApp::draw_hud_() {
  int y = 20;
  const Color txt{220, 235, 220, 255};
  const Color dim{190, 205, 190, 255};

  const auto [b, e] = playback_.frame_range(playback_.frame());
  const char* stamp = (b < e) ? seq_.features[b].timestamp.c_str() : "--";
  const int day  = (b < e) ? seq_.features[b].step.day : 0;
  const int hour = (b < e) ? seq_.features[b].step.hour : 0;

  DrawText(TextFormat("%s  Day %d, Hour %d  frame %d/%d  %s%s  speed=%s",
                      stamp, day, hour,
                      (int)playback_.frame() + 1, (int)playback_.frame_count(),
                      playback_.playing ? "Playing" : "Paused",
                      playback_.loop() ? " (loop)" : "",
                      speedLabel(hours_per_second_)),
           kHUD_X, y, 20, txt);
  y += kHUD_LINE_H + 4;

  DrawText(TextFormat("%s  days=%d  step=%dh  wind=%d deg @ %d mph  zones=%d%s  wind test=%s",
                      cfg_.zone_count > 1 ? "Danger zones" : "Unbounded",
                      cfg_.total_days, cfg_.hours_per_step,
                      (int)cfg_.wind_direction_deg, (int)cfg_.wind_speed,
                      cfg_.zone_count,
                      cfg_.max_radius_km ? TextFormat("  cap=%.1f km", *cfg_.max_radius_km) : "",
                      cfg_.anisotropy == AnisotropyMode::Legacy ? "legacy" : "circular"),
           kHUD_X, y, 18, txt);
  y += kHUD_LINE_H;

  const auto lines = summary_lines(seq_.summary, scenario_.target_label);
  for (std::size_t i = 0; i < lines.size(); ++i) {
    const Color c = (i + 1 == lines.size()) ? riskColor(seq_.summary.risk) : dim;
    DrawText(lines[i].c_str(), kHUD_X, y, 16, c);
    y += kHUD_LINE_H - 2;
  }

  if (!error_.empty()) {
    DrawText(error_.c_str(), kHUD_X, y, 16, Color{255, 110, 90, 255});
    y += kHUD_LINE_H - 2;
  }
  if (!saved_path_.empty()) {
    DrawText(TextFormat("saved: %s", saved_path_.c_str()), kHUD_X, y, 14, dim);
  }

  DrawText("Space: Play/Pause | Shift+Left/Right: Step | Home: Start | L: Loop | 1..5: Speed | "
           "A/D: Wind dir | W/S: Wind speed | [ ]: Days | -/=: Step h | Z: Variant | G: Wind test | "
           "PgUp/PgDn: Zoom | Arrows: Pan | C: Center | E: Export",
           kHUD_X, GetScreenHeight() - 28, 14, dim);
}

} // namespace wfsim

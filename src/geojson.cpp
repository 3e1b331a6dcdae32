#include <wfsim/geojson.hpp>
#include <wfsim/builder.hpp>
#include <cstdio>
#include <fstream>
#include <ios>

namespace wfsim {

static const char* js_bool(bool b) { return b ? "true" : "false"; }

// 10 significant digits keeps coordinates below a metre.
static std::string num(double v) {
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%.10g", v);
  return std::string(buf);
}

static std::string str(const std::string& s) {
  return "\"" + json_escape(s) + "\"";
}

std::string iso_duration_hours(int hours) {
  return "PT" + std::to_string(hours) + "H";
}

std::string json_escape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (char c : s) {
    switch (c) {
      case '"':  out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n";  break;
      case '\r': out += "\\r";  break;
      case '\t': out += "\\t";  break;
      case '\b': out += "\\b";  break;
      case '\f': out += "\\f";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          out += buf;
        } else {
          out.push_back(c);
        }
    }
  }
  return out;
}

static void write_feature(std::ostream& out, const FireFeature& f) {
  out << "{\"type\":\"Feature\",\"geometry\":{\"type\":\"Polygon\",\"coordinates\":[[";
  const auto& pts = f.perimeter.points();
  for (std::size_t i = 0; i < pts.size(); ++i) {
    out << "[" << num(pts[i].lon) << "," << num(pts[i].lat) << "]" << (i + 1 < pts.size() ? "," : "");
  }
  out << "]]},\"properties\":{";
  out << "\"time\":" << str(f.timestamp) << ",";
  out << "\"icon\":" << str(f.icon.icon) << ",";
  out << "\"iconstyle\":{"
      << "\"fillColor\":" << str(f.icon.fill_color)
      << ",\"fillOpacity\":" << num(f.icon.fill_opacity)
      << ",\"stroke\":" << js_bool(f.icon.stroke)
      << ",\"radius\":" << f.icon.radius
      << ",\"weight\":" << f.icon.weight
      << ",\"opacity\":" << num(f.icon.opacity)
      << ",\"color\":" << str(f.icon.color)
      << "},";
  out << "\"style\":{"
      << "\"color\":" << str(f.style.color)
      << ",\"fillColor\":" << str(f.style.fill_color)
      << ",\"fillOpacity\":" << num(f.style.fill_opacity)
      << ",\"weight\":" << f.style.weight
      << "},";
  out << "\"popup\":" << str(f.label) << ",";
  out << "\"day\":" << f.step.day
      << ",\"hour\":" << f.step.hour
      << ",\"zone\":" << f.zone_index
      << ",\"radius_km\":" << num(f.radius_km);
  out << "}}";
}

void write_feature_collection(std::ostream& out, const FireSequence& seq) {
  out << "{\n";
  out << "  \"type\": \"FeatureCollection\",\n";
  out << "  \"features\": [\n";
  for (std::size_t i = 0; i < seq.features.size(); ++i) {
    out << "    ";
    write_feature(out, seq.features[i]);
    out << (i + 1 < seq.features.size() ? "," : "") << "\n";
  }
  out << "  ],\n";

  const PlaybackOptions& p = seq.playback;
  out << "  \"playback\": {"
      << "\"period\":" << str(iso_duration_hours(p.period_hours))
      << ",\"duration\":" << str(iso_duration_hours(p.duration_hours))
      << ",\"add_last_point\":" << js_bool(p.add_last_point)
      << ",\"auto_play\":" << js_bool(p.auto_play)
      << ",\"loop\":" << js_bool(p.loop)
      << ",\"max_speed\":" << p.max_speed
      << ",\"loop_button\":" << js_bool(p.loop_button)
      << ",\"date_options\":" << str(p.date_options)
      << ",\"time_slider_drag_update\":" << js_bool(p.time_slider_drag_update)
      << "}\n";
  out << "}\n";
}

void write_summary_json(std::ostream& out, const DerivedSummary& s) {
  out << "{\"distance_km\":" << num(s.distance_km)
      << ",\"estimated_arrival_hours\":" << num(s.estimated_arrival_hours)
      << ",\"risk\":" << str(risk_label(s.risk))
      << "}\n";
}

bool save_summary_json(const std::string& path, const DerivedSummary& s) {
  std::ofstream f(path, std::ios::binary);
  if (!f) return false;
  write_summary_json(f, s);
  f.flush();
  return static_cast<bool>(f);
}

std::optional<std::size_t> save_feature_collection(const std::string& path, const FireSequence& seq) {
  std::ofstream f(path, std::ios::binary);
  if (!f) return std::nullopt;
  write_feature_collection(f, seq);
  f.flush();
  if (!f) return std::nullopt;
  return seq.features.size();
}

} // namespace wfsim

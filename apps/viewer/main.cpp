#include <iostream>
#include <string>
#include <wfsim/config.hpp>
#include <wfsim/scenario.hpp>
#include <wfsim/viewer/app.hpp>

using namespace wfsim;

// Usage: wfsim_viewer [scenario-key] [--zones]
int main(int argc, char** argv) {
  std::string key = "Palisades";
  bool zones = false;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--zones") zones = true;
    else key = a;
  }

  const auto scenario = scenario_by_key(key);
  if (!scenario) {
    std::cerr << "wfsim_viewer: unknown scenario '" << key << "'\n";
    return 2;
  }

  ViewerApp app(*scenario, zones ? danger_zone_config() : unbounded_config());
  return app.run();
}

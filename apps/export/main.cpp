#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <wfsim/builder.hpp>
#include <wfsim/cli.hpp>
#include <wfsim/color.hpp>
#include <wfsim/errors.hpp>
#include <wfsim/geojson.hpp>
#include <wfsim/scenario.hpp>

using namespace wfsim;

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  std::string err;
  const auto opt = parse_export_args(args, err);
  if (!opt) {
    std::cerr << "wfsim_export: " << err << "\n" << export_usage();
    return 2;
  }
  if (opt->help) {
    std::cout << export_usage();
    return 0;
  }

  std::optional<Scenario> scenario;
  if (opt->catalog_path) {
    const auto cat = load_scenario_catalog_csv(*opt->catalog_path);
    if (!cat) {
      std::cerr << "wfsim_export: cannot open catalog '" << *opt->catalog_path << "'\n";
      return 2;
    }
    scenario = scenario_by_key_in(*cat, opt->scenario);
  } else {
    scenario = scenario_by_key(opt->scenario);
  }
  if (!scenario) {
    std::cerr << "wfsim_export: unknown scenario '" << opt->scenario << "'\n";
    return 2;
  }

  const SimulationConfig cfg = apply_scenario(config_from_options(*opt), *scenario);

  std::unique_ptr<ColorStrategy> colors;
  if (opt->color_by == ColorBy::Elapsed && cfg.zone_count == 1) {
    colors = std::make_unique<ElapsedRampColors>();
  }

  FireSequence seq;
  try {
    seq = build_fire_sequence(cfg, colors.get());
  } catch (const ConfigError& e) {
    std::cerr << "wfsim_export: " << kind_name(e.kind()) << ": " << e.what() << "\n";
    return 1;
  }

  if (opt->out_path) {
    const auto written = save_feature_collection(*opt->out_path, seq);
    if (!written) {
      std::cerr << "wfsim_export: cannot write '" << *opt->out_path << "'\n";
      return 1;
    }
    std::cerr << "wfsim_export: wrote " << *written << " features to " << *opt->out_path << "\n";
  } else {
    write_feature_collection(std::cout, seq);
  }

  if (opt->summary_json_path && !save_summary_json(*opt->summary_json_path, seq.summary)) {
    std::cerr << "wfsim_export: cannot write '" << *opt->summary_json_path << "'\n";
    return 1;
  }

  if (opt->print_summary) {
    for (const auto& line : summary_lines(seq.summary, scenario->target_label)) {
      std::cerr << line << "\n";
    }
  }
  return 0;
}

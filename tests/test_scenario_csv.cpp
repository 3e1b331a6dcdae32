#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sstream>
#include <string>

#include <wfsim/config.hpp>
#include <wfsim/scenario.hpp>

using Catch::Approx;
using namespace wfsim;

static std::string csv_minimal = R"(key,origin_lat,origin_lon,target_lat,target_lon,target_label,protected_radius_m
Palisades,34.0556,-118.5334,34.0453,-118.5265,Palisades Village,300
Eaton,34.2020,-118.0750,34.1897,-118.1312,Altadena,500
)";

static std::string csv_with_noise = R"( key , origin_lat , origin_lon , target_lat , target_lon , target_label , protected_radius_m
# comment lines are ignored
Palisades , 34.0556 , -118.5334 , 34.0453 , -118.5265 , Palisades Village , 300

Pole,90.0,0.0,34.0,-118.0,Nowhere,100
Broken,abc,-118.0,34.0,-118.0,X,100
Short,34.0,-118.0
Bare,34.0,-118.0,34.01,-118.01,,-50
)";

TEST_CASE("scenario_catalog_from_csv_stream parses valid rows") {
  std::istringstream ss(csv_minimal);
  auto cat = scenario_catalog_from_csv_stream(ss);
  REQUIRE(cat.size() == 2);

  auto pal = scenario_by_key_in(cat, "Palisades");
  REQUIRE(pal.has_value());
  REQUIRE(pal->origin.lat == Approx(34.0556));
  REQUIRE(pal->origin.lon == Approx(-118.5334));
  REQUIRE(pal->target_label == "Palisades Village");
  REQUIRE(pal->protected_radius_m == Approx(300.0));

  auto eat = scenario_by_key_in(cat, "Eaton");
  REQUIRE(eat.has_value());
  REQUIRE(eat->target.lon == Approx(-118.1312));
}

TEST_CASE("scenario_catalog_from_csv_stream handles spaces, comments and bad rows") {
  std::istringstream ss(csv_with_noise);
  auto cat = scenario_catalog_from_csv_stream(ss);
  REQUIRE(cat.size() == 2);
  REQUIRE(scenario_by_key_in(cat, "Palisades").has_value());
  REQUIRE_FALSE(scenario_by_key_in(cat, "Pole").has_value());
  REQUIRE_FALSE(scenario_by_key_in(cat, "Broken").has_value());
  REQUIRE_FALSE(scenario_by_key_in(cat, "Short").has_value());

  auto bare = scenario_by_key_in(cat, "Bare");
  REQUIRE(bare.has_value());
  REQUIRE(bare->target_label == "Bare");
  REQUIRE(bare->protected_radius_m == Approx(0.0));
}

TEST_CASE("load_scenario_catalog_csv returns nullopt on missing file") {
  auto none = load_scenario_catalog_csv("this_file_does_not_exist.csv");
  REQUIRE_FALSE(none.has_value());
}

TEST_CASE("built-in catalog holds Palisades") {
  auto s = scenario_by_key("Palisades");
  REQUIRE(s.has_value());
  REQUIRE(s->target_label == "Palisades Village");
  REQUIRE(s->origin.lat == Approx(kPalisadesOrigin.lat));
  REQUIRE_FALSE(scenario_by_key("Nowhere").has_value());
}

TEST_CASE("apply_scenario replaces only the locations") {
  Scenario s{"Test", LatLon{10.0, 20.0}, LatLon{10.1, 20.1}, "Town", 100.0};
  auto cfg = apply_scenario(danger_zone_config(), s);
  REQUIRE(cfg.origin.lat == Approx(10.0));
  REQUIRE(cfg.target.lon == Approx(20.1));
  REQUIRE(cfg.zone_count == 3);
  REQUIRE(cfg.loop);
}

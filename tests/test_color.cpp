#include <catch2/catch_test_macros.hpp>

#include <wfsim/color.hpp>
#include <wfsim/config.hpp>

using namespace wfsim;

TEST_CASE("parse_hex_color accepts both forms and rejects garbage") {
  auto c = parse_hex_color("#BD0026");
  REQUIRE(c.has_value());
  REQUIRE(c->r == 0xbd);
  REQUIRE(c->g == 0x00);
  REQUIRE(c->b == 0x26);
  REQUIRE(parse_hex_color("fd8d3c").has_value());

  REQUIRE_FALSE(parse_hex_color("").has_value());
  REQUIRE_FALSE(parse_hex_color("#12345").has_value());
  REQUIRE_FALSE(parse_hex_color("#12345g").has_value());
}

TEST_CASE("to_hex writes lowercase") {
  REQUIRE(to_hex(Rgb{0xAB, 0x01, 0xFF}) == "#ab01ff");
}

TEST_CASE("yl_or_rd ramp endpoints, midpoint and clamping") {
  auto ramp = ColorRamp::yl_or_rd();
  REQUIRE(ramp(0.0) == "#ffffcc");
  REQUIRE(ramp(1.0) == "#800026");
  REQUIRE(ramp(0.5) == "#fd8d3c");
  REQUIRE(ramp(-3.0) == "#ffffcc");
  REQUIRE(ramp(7.0) == "#800026");
}

TEST_CASE("ColorRamp::scaled keeps stops over a new domain") {
  auto ramp = ColorRamp::yl_or_rd().scaled(0.0, 10.0);
  REQUIRE(ramp.vmin() == 0.0);
  REQUIRE(ramp.vmax() == 10.0);
  REQUIRE(ramp(10.0) == "#800026");
  REQUIRE(ramp(5.0) == "#fd8d3c");
}

TEST_CASE("DayRampColors shares one color per day") {
  auto cfg = unbounded_config();
  DayRampColors colors;
  REQUIRE(colors.color_for(TimeStep{0, 0}, 0, cfg) == "#ffffcc");
  REQUIRE(colors.color_for(TimeStep{1, 0}, 0, cfg) == colors.color_for(TimeStep{1, 18}, 0, cfg));
  REQUIRE(colors.color_for(TimeStep{1, 0}, 0, cfg) != colors.color_for(TimeStep{0, 0}, 0, cfg));
  // day/total_days on a ramp scaled to [0, total_days] never reaches the dark end
  REQUIRE(colors.color_for(TimeStep{3, 0}, 0, cfg) != "#800026");
}

TEST_CASE("ElapsedRampColors spans the whole run") {
  auto cfg = unbounded_config();
  ElapsedRampColors colors;
  REQUIRE(colors.color_for(TimeStep{0, 0}, 0, cfg) == "#ffffcc");
  REQUIRE(colors.color_for(TimeStep{3, 18}, 0, cfg) == "#800026");
}

TEST_CASE("ZonePaletteColors picks per-zone colors with fallback") {
  auto cfg = danger_zone_config();
  ZonePaletteColors colors;
  REQUIRE(colors.color_for(TimeStep{0, 0}, 0, cfg) == "#bd0026");
  REQUIRE(colors.color_for(TimeStep{2, 6}, 2, cfg) == "#fed976");

  cfg.zone_colors = {"#000000"};
  REQUIRE(colors.color_for(TimeStep{0, 0}, 0, cfg) == "#000000");
  REQUIRE(colors.color_for(TimeStep{0, 0}, 1, cfg) == "#fd8d3c");
}

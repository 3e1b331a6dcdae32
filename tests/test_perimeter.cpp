#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <wfsim/geo.hpp>
#include <wfsim/perimeter.hpp>

using Catch::Approx;
using namespace wfsim;

TEST_CASE("build_perimeter returns a closed ring of 37 vertices") {
  auto poly = build_perimeter(kPalisadesOrigin, 1.0, 0.2, 225.0, AnisotropyMode::Legacy);
  REQUIRE(poly.size() == kPerimeterVertices);
  REQUIRE(poly.closed());
  REQUIRE(poly.points().front().lon == poly.points().back().lon);
  REQUIRE(poly.points().front().lat == poly.points().back().lat);
}

TEST_CASE("build_perimeter without wind is a regular polygon") {
  const double r = 2.0;
  auto poly = build_perimeter(kPalisadesOrigin, r, 0.0, 225.0, AnisotropyMode::Legacy);
  for (const auto& p : poly.points()) {
    REQUIRE(planar_distance_km(kPalisadesOrigin, p) == Approx(r).epsilon(1e-9));
  }
}

TEST_CASE("build_perimeter first vertex points east") {
  auto poly = build_perimeter(kPalisadesOrigin, 1.0, 0.0, 0.0, AnisotropyMode::Legacy);
  const auto& p0 = poly.points().front();
  REQUIRE(p0.lat == Approx(kPalisadesOrigin.lat));
  REQUIRE(p0.lon > kPalisadesOrigin.lon);
}

TEST_CASE("build_perimeter elongates downwind vertices") {
  // Wind toward east (0 deg), effect 0.5
  auto poly = build_perimeter(kPalisadesOrigin, 1.0, 0.5, 0.0, AnisotropyMode::Legacy);
  const auto& pts = poly.points();
  REQUIRE(planar_distance_km(kPalisadesOrigin, pts[0]) == Approx(1.5));   // 0 deg
  REQUIRE(planar_distance_km(kPalisadesOrigin, pts[8]) == Approx(1.5));   // 80 deg
  REQUIRE(planar_distance_km(kPalisadesOrigin, pts[9]) == Approx(1.0));   // 90 deg
  REQUIRE(planar_distance_km(kPalisadesOrigin, pts[18]) == Approx(1.0));  // 180 deg
  REQUIRE(planar_distance_km(kPalisadesOrigin, pts[28]) == Approx(1.5));  // 280 deg
}

TEST_CASE("PerimeterPolygon closes an open ring once") {
  PerimeterPolygon poly({{0.0, 0.0}, {1.0, 0.0}, {1.0, 1.0}});
  REQUIRE(poly.size() == 4);
  REQUIRE(poly.closed());

  poly.set_points({{0.0, 0.0}, {1.0, 0.0}, {0.0, 0.0}});
  REQUIRE(poly.size() == 3);

  poly.set_points({});
  REQUIRE(poly.empty());
  REQUIRE_FALSE(poly.closed());
}

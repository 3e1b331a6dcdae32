#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <limits>

#include <wfsim/config.hpp>
#include <wfsim/geo.hpp>

using Catch::Approx;
using namespace wfsim;

TEST_CASE("great_circle_km between Palisades origin and village") {
  REQUIRE(great_circle_km(kPalisadesOrigin, kPalisadesVillage) == Approx(1.31).margin(0.01));
  REQUIRE(great_circle_km(kPalisadesOrigin, kPalisadesOrigin) == Approx(0.0));
}

TEST_CASE("great_circle_km one degree of latitude") {
  REQUIRE(great_circle_km(LatLon{0.0, 0.0}, LatLon{1.0, 0.0}) == Approx(111.195).margin(0.01));
}

TEST_CASE("offset_km and planar_distance_km are inverses") {
  const LatLon o{34.0, -118.0};
  auto p = offset_km(o, 3.0, 4.0);
  REQUIRE(planar_distance_km(o, p) == Approx(5.0));
  REQUIRE(p.lat == Approx(34.0 + 4.0 / kKmPerDegLat));
  // Longitude degrees widen with latitude
  REQUIRE(p.lon - o.lon > 3.0 / kKmPerDegLat);
}

TEST_CASE("is_finite rejects NaN and infinity") {
  REQUIRE(is_finite(LatLon{1.0, 2.0}));
  REQUIRE_FALSE(is_finite(LatLon{std::nan(""), 2.0}));
  REQUIRE_FALSE(is_finite(LatLon{1.0, std::numeric_limits<double>::infinity()}));
}

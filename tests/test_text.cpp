#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <string>
#include <vector>

#include <wfsim/text.hpp>

using Catch::Approx;
using namespace wfsim;

TEST_CASE("trim strips surrounding whitespace only") {
  REQUIRE(trim("  a b \t") == "a b");
  REQUIRE(trim("") == "");
  REQUIRE(trim(" \n ") == "");
}

TEST_CASE("split_fields keeps empty fields and trims each one") {
  const std::vector<std::string> want{"a", "", "c d", ""};
  REQUIRE(split_fields(" a ,, c d ,") == want);
  REQUIRE(split_fields("x;y", ';') == std::vector<std::string>{"x", "y"});
  REQUIRE(split_fields("").size() == 1);
}

TEST_CASE("parse_double requires the whole string") {
  REQUIRE(parse_double("34.0556").has_value());
  REQUIRE(*parse_double("-118.5") == Approx(-118.5));
  REQUIRE_FALSE(parse_double("").has_value());
  REQUIRE_FALSE(parse_double("1.5km").has_value());
  REQUIRE_FALSE(parse_double("inf").has_value());
  REQUIRE_FALSE(parse_double("1e999").has_value());
}

TEST_CASE("parse_int rejects fractions and overflow") {
  REQUIRE(*parse_int("12") == 12);
  REQUIRE_FALSE(parse_int("2.5").has_value());
  REQUIRE_FALSE(parse_int("99999999999").has_value());
  REQUIRE_FALSE(parse_int("abc").has_value());
}

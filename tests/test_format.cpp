#include <catch2/catch_test_macros.hpp>
#include <limits>

#include <rtm/format.hpp>

using namespace rtm;

TEST_CASE("format_pace renders minutes and zero-padded seconds") {
  REQUIRE(format_pace(411.0) == "6:51");
  REQUIRE(format_pace(540.0) == "9:00");
  REQUIRE(format_pace(59.6) == "1:00");
  REQUIRE(format_pace(0.0) == "0:00");
  REQUIRE(format_pace(-1.0) == "--");
  REQUIRE(format_pace(std::numeric_limits<double>::quiet_NaN()) == "--");
}

TEST_CASE("format_clock switches to hours at one hour") {
  REQUIRE(format_clock(1197.0) == "19:57");
  REQUIRE(format_clock(3599.4) == "59:59");
  REQUIRE(format_clock(3600.0) == "1:00:00");
  REQUIRE(format_clock(3 * 3600.0 + 5 * 60.0 + 7.0) == "3:05:07");
  REQUIRE(format_clock(std::numeric_limits<double>::infinity()) == "--");
}

#include <catch2/catch.hpp>

#include <limits>
#include <random>

#include <geosphere/angle.hpp>

using namespace geosphere;

TEST_CASE("normalize_longitude", "Longitude wrapping into (-180, 180]") {
  SECTION("in range values are unchanged") {
    REQUIRE(normalize_longitude(0.0) == 0.0);
    REQUIRE(normalize_longitude(45.5) == 45.5);
    REQUIRE(normalize_longitude(-179.5) == -179.5);
    REQUIRE(normalize_longitude(180.0) == 180.0);
  }

  SECTION("both boundaries fold to +180") {
    REQUIRE(normalize_longitude(-180.0) == 180.0);
    REQUIRE(normalize_longitude(540.0) == 180.0);
    REQUIRE(normalize_longitude(-540.0) == 180.0);
  }

  SECTION("overflow continues from the opposite boundary") {
    REQUIRE(normalize_longitude(181.0) == Approx(-179.0));
    REQUIRE(normalize_longitude(-181.0) == Approx(179.0));
    REQUIRE(normalize_longitude(360.0) == Approx(0.0).margin(1e-12));
    REQUIRE(normalize_longitude(725.0) == Approx(5.0));
    REQUIRE(normalize_longitude(-725.0) == Approx(-5.0));
  }

  SECTION("idempotent and always in range") {
    std::mt19937_64 engine(42);
    std::uniform_real_distribution<double> dist(-1e5, 1e5);
    for (int i = 0; i < 10000; ++i) {
      const double once = normalize_longitude(dist(engine));
      REQUIRE(once > -180.0);
      REQUIRE(once <= 180.0);
      REQUIRE(normalize_longitude(once) == once);
    }
  }
}

TEST_CASE("normalize_radians", "Full turn wrapping into [0, 2pi)") {
  REQUIRE(normalize_radians(kPi) == kPi);
  REQUIRE(normalize_radians(kTwoPi) == 0.0);
  REQUIRE(normalize_radians(-kPi / 2.0) == Approx(kTwoPi - kPi / 2.0));
  REQUIRE(normalize_radians(kTwoPi + kPi / 2.0) == Approx(kPi / 2.0));

  const double tiny = -std::numeric_limits<double>::denorm_min();
  const double wrapped = normalize_radians(tiny);
  REQUIRE(wrapped >= 0.0);
  REQUIRE(wrapped < kTwoPi);
}

TEST_CASE("unit conversions", "Degrees and radians") {
  REQUIRE(deg2rad(180.0) == Approx(kPi));
  REQUIRE(rad2deg(kPi / 2.0) == Approx(90.0));
  REQUIRE(rad2deg(deg2rad(37.25)) == Approx(37.25));
}

TEST_CASE("is_valid_latitude", "Latitude domain") {
  REQUIRE(is_valid_latitude(90.0));
  REQUIRE(is_valid_latitude(-90.0));
  REQUIRE(is_valid_latitude(0.0));
  REQUIRE_FALSE(is_valid_latitude(90.0001));
  REQUIRE_FALSE(is_valid_latitude(-90.0001));
  REQUIRE_FALSE(is_valid_latitude(std::numeric_limits<double>::quiet_NaN()));
  REQUIRE_FALSE(is_valid_latitude(std::numeric_limits<double>::infinity()));
}

TEST_CASE("sin_cos_deg", "Exact values at quadrant angles") {
  double s, c;

  sin_cos_deg(0.0, s, c);
  REQUIRE(s == 0.0);
  REQUIRE(c == 1.0);

  sin_cos_deg(90.0, s, c);
  REQUIRE(s == 1.0);
  REQUIRE(c == 0.0);

  sin_cos_deg(-90.0, s, c);
  REQUIRE(s == -1.0);
  REQUIRE(c == 0.0);

  sin_cos_deg(180.0, s, c);
  REQUIRE(s == 0.0);
  REQUIRE(c == -1.0);

  sin_cos_deg(30.0, s, c);
  REQUIRE(s == Approx(0.5));
  REQUIRE(c == Approx(std::sqrt(3.0) / 2.0));
}

#include <catch2/catch.hpp>

#include <string>
#include <spdlog/spdlog.h>

#include <geosphere/angle.hpp>
#include <geosphere/cartesian.hpp>
#include <geosphere/errors.hpp>
#include <geosphere/geographic.hpp>
#include <geosphere/util/config.hpp>
#include <geosphere/util/convert_to_string.hpp>
#include <geosphere/util/logging.hpp>

using namespace geosphere;

TEST_CASE("Config", "JSON parameters") {
  SECTION("shipped config file") {
    const Config config(GEOSPHERE_TEST_CONFIG);
    REQUIRE(config.source() == GEOSPHERE_TEST_CONFIG);
    REQUIRE(config.param<double>("converter", "radius", 0.0) == kMeanEarthRadius);
    REQUIRE(config.param<double>("tolerance", "angle", 0.0) == 1e-9);
    REQUIRE(config.param<std::string>("logging", "level", "") == "info");
    REQUIRE(config.has("converter", "radius"));
  }

  SECTION("missing keys fall back to defaults") {
    const Config config = Config::from_string(R"({"converter": {}})");
    REQUIRE(config.param<double>("converter", "radius", 2.5) == 2.5);
    REQUIRE(config.param<int>("missing", "key", 7) == 7);
    REQUIRE_FALSE(config.has("converter", "radius"));
  }

  SECTION("values that cannot be converted are errors") {
    const Config config = Config::from_string(R"({"converter": {"radius": "far"}})");
    REQUIRE_THROWS_AS(config.param<double>("converter", "radius", 1.0), Error);
  }

  SECTION("unreadable documents are errors") {
    REQUIRE_THROWS_AS(Config::from_string("{ not json"), Error);
    REQUIRE_THROWS_AS(Config("/nonexistent/geosphere.json"), Error);
  }
}

TEST_CASE("logging", "Module loggers and levels") {
  const auto logger = create_module_logger("converter_test");
  REQUIRE(logger);
  REQUIRE(logger == create_module_logger("converter_test"));
  REQUIRE(spdlog::get("converter_test") == logger);

  set_log_level("debug");
  REQUIRE(logger->level() == spdlog::level::debug);

  configure_logging(Config::from_string(R"({"logging": {"level": "warn"}})"));
  REQUIRE(logger->level() == spdlog::level::warn);

  REQUIRE_THROWS_AS(set_log_level("verbose"), Error);

  set_log_level("off");
  REQUIRE(logger->level() == spdlog::level::off);
}

TEST_CASE("convert_to_string", "Text form of coordinates") {
  REQUIRE(convert_to_string(GeographicCoordinate(-33.5, 151.25, 58.0)) == "lat=-33.500000000 lon=151.250000000 alt=58.000");
  REQUIRE(convert_to_string(CartesianCoordinate(0.5, -1.0, 2.0)) == "(0.500000, -1.000000, 2.000000)");
  REQUIRE(convert_to_string(Eigen::Vector3d(1.0, 2.0, 3.0)) == "(1.000000, 2.000000, 3.000000)");
}

TEST_CASE("ValidationError", "Error carries the field and value") {
  const ValidationError error("latitude", 91.0, "must be within [-90, 90] degrees");
  REQUIRE(error.field() == "latitude");
  REQUIRE(error.value() == 91.0);
  REQUIRE(std::string(error.what()) == "invalid latitude (91): must be within [-90, 90] degrees");

  const Error& base = error;
  REQUIRE(std::string(base.what()).find("latitude") != std::string::npos);
}

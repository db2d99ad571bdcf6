// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include <memory>
#include <cstdlib>
#include <sstream>
#include <catch2/catch.hpp>

#include <boost/property_tree/json_parser.hpp>

#include "mock_backend.h"
#include "geocoder/config.h"
#include "geocoder/geocoder.h"

using namespace geodist::geocoder;

namespace
{
  auto in_a_while()
  { return std::chrono::steady_clock::now() + std::chrono::seconds(5); }

  json_t parse_json(std::string const& text)
  {
    json_t output;
    std::stringstream ss(text);
    boost::property_tree::read_json(ss, output);
    return output;
  }
}

TEST_CASE("Geocoder config defaults and overrides", "[geocoder]")
{
  config defaults;
  REQUIRE(defaults.endpoint == "https://maps.googleapis.com/maps/api/geocode/json");
  REQUIRE(defaults.api_key.empty());
  REQUIRE(defaults.timeout == std::chrono::seconds(10));

  config custom(parse_json(R"({
    "endpoint": "http://localhost:8080/geocode",
    "api_key": "secret",
    "timeout_ms": 2500
  })"));
  REQUIRE(custom.endpoint == "http://localhost:8080/geocode");
  REQUIRE(custom.api_key == "secret");
  REQUIRE(custom.timeout == std::chrono::milliseconds(2500));
  REQUIRE(custom.user_agent == defaults.user_agent);

  REQUIRE_THROWS_AS(config(parse_json(R"({"timeout_ms": 0})")), 
    std::invalid_argument);
}

TEST_CASE("Geocoder request composition", "[geocoder]")
{
  SECTION("unauthenticated") {
    geocoder engine(config(), std::make_unique<scripted_backend>(
      scripted_backend::replies_t{}));
    REQUIRE(engine.request_target("New York") == 
      "/maps/api/geocode/json?sensor=false&address=New+York");
  }

  SECTION("with api key") {
    config cfg;
    cfg.api_key = "AIza/key";
    geocoder engine(cfg, std::make_unique<scripted_backend>(
      scripted_backend::replies_t{}));
    REQUIRE(engine.request_target("Paris, France") == 
      "/maps/api/geocode/json?sensor=false&address=Paris%2C+France&key=AIza%2Fkey");
  }

  SECTION("custom endpoint path") {
    config cfg;
    cfg.endpoint = "http://localhost:8080/geocode";
    geocoder engine(cfg, std::make_unique<scripted_backend>(
      scripted_backend::replies_t{}));
    REQUIRE(engine.request_target("Oslo") == 
      "/geocode?sensor=false&address=Oslo");
  }

  SECTION("bad endpoint") {
    config cfg;
    cfg.endpoint = "gopher://example.com";
    REQUIRE_THROWS_AS(geocoder(cfg, std::make_unique<scripted_backend>(
      scripted_backend::replies_t{})), std::invalid_argument);
  }
}

TEST_CASE("Geocoder resolve outcomes", "[geocoder]")
{
  auto backend = std::make_unique<scripted_backend>(scripted_backend::replies_t{
    { "Warsaw", reply_with(location_body(52.2297, 21.0122, "Warsaw, Poland")) },
    { "Atlantis", reply_with(zero_results_body()) },
    { "Broken", reply_with(R"({"results":[{"geometry":)") },
    { "Offline", fail_with_transport_error() },
  });
  auto const& script = *backend;
  geocoder engine(config(), std::move(backend));

  auto warsaw = engine.resolve("Warsaw", in_a_while());
  REQUIRE(warsaw.has_value());
  REQUIRE(warsaw->formatted_address() == "Warsaw, Poland");
  REQUIRE(warsaw->coords().latitude() == Approx(52.2297));
  REQUIRE(warsaw->coords().longitude() == Approx(21.0122));

  REQUIRE_FALSE(engine.resolve("Atlantis", in_a_while()).has_value());
  REQUIRE_THROWS_AS(engine.resolve("Broken", in_a_while()), decode_error);
  REQUIRE_THROWS_AS(engine.resolve("Offline", in_a_while()), transport_error);
  REQUIRE_THROWS_AS(engine.resolve("", in_a_while()), std::invalid_argument);

  // one request per lookup, nothing for the rejected empty query
  REQUIRE(script.targets().size() == 4);
}

TEST_CASE("Geocoder resolve honours stop requests", "[geocoder]")
{
  geocoder engine(config(), std::make_unique<scripted_backend>(
    scripted_backend::replies_t{ { "Slow", hang_until_stopped() } }));

  std::stop_source stop;
  stop.request_stop();
  REQUIRE_THROWS_AS(engine.resolve("Slow", in_a_while(), stop.get_token()),
    cancelled_error);

  auto soon = std::chrono::steady_clock::now() + std::chrono::milliseconds(50);
  REQUIRE_THROWS_AS(engine.resolve("Slow", soon), timeout_error);
}

TEST_CASE("Geocoder api key from the environment", "[geocoder]")
{
  config cfg;
  cfg.api_key = "from-config";

  ::setenv("GOOGLE_API_KEY", "from-env", 1);
  REQUIRE(with_environment(cfg).api_key == "from-env");

  ::setenv("GOOGLE_API_KEY", "", 1);
  REQUIRE(with_environment(cfg).api_key == "from-config");

  ::unsetenv("GOOGLE_API_KEY");
  REQUIRE(with_environment(cfg).api_key == "from-config");
}

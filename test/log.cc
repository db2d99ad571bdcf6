// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include <string>
#include <sstream>
#include <catch2/catch.hpp>

#include <boost/property_tree/json_parser.hpp>

#include "utils/log.h"

TEST_CASE("Log level names", "[log]")
{
  using geodist::logging::parse_level;
  using boost::log::trivial::severity_level;

  REQUIRE(parse_level("trace") == severity_level::trace);
  REQUIRE(parse_level("DEBUG") == severity_level::debug);
  REQUIRE(parse_level("Info") == severity_level::info);
  REQUIRE(parse_level("warning") == severity_level::warning);
  REQUIRE(parse_level("error") == severity_level::error);
  REQUIRE(parse_level("fatal") == severity_level::fatal);

  REQUIRE_THROWS_AS(parse_level("warn"), std::invalid_argument);
  REQUIRE_THROWS_AS(parse_level(""), std::invalid_argument);
}

namespace
{
  // outlives every test, the sink keeps pointing at it until reset
  std::ostringstream captured;

  json_t parse_json(std::string const& text)
  {
    json_t output;
    std::stringstream ss(text);
    boost::property_tree::read_json(ss, output);
    return output;
  }

  size_t occurrences(std::string const& haystack, std::string const& needle)
  {
    size_t count = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
      ++count;
    }
    return count;
  }
}

TEST_CASE("Log sink output", "[log]")
{
  using namespace geodist;

  SECTION("plain lines unless colour is asked for") {
    captured.str(std::string());
    logging::init(parse_json(R"({"logging": {"level": "error"}})"), captured);

    errlog << "fatal: geocoding failed";
    warnlog << "filtered out";

    auto text = captured.str();
    REQUIRE(occurrences(text, "fatal: geocoding failed") == 1);
    REQUIRE(text.find("filtered out") == std::string::npos);
    REQUIRE(text.find('\033') == std::string::npos);
  }

  SECTION("coloured lines on request") {
    captured.str(std::string());
    logging::init(parse_json(
      R"({"logging": {"level": "error", "color": true}})"), captured);

    errlog << "fatal: geocoding failed";
    REQUIRE(captured.str().find("\033[31m") != std::string::npos);
  }

  SECTION("init replaces the earlier sink") {
    captured.str(std::string());
    logging::init(json_t(), captured);
    logging::init(json_t(), captured);

    errlog << "only once";
    REQUIRE(occurrences(captured.str(), "only once") == 1);
  }

  logging::init(json_t());
}

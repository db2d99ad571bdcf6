// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include <vector>
#include <sstream>
#include <catch2/catch.hpp>

#include "cli/options.h"

using geodist::cli::invalid_usage;
using geodist::spacial::distance_unit;

namespace
{
  geodist::cli::options parse(std::vector<const char*> args)
  {
    args.insert(args.begin(), "geodist");
    return geodist::cli::parse_options(
      static_cast<int>(args.size()), args.data());
  }
}

TEST_CASE("Command line - defaults", "[cli]")
{
  auto opts = parse({"London", "Paris"});
  REQUIRE_FALSE(opts.help);
  REQUIRE_FALSE(opts.verbose);
  REQUIRE(opts.unit == distance_unit::kilometers);
  REQUIRE(opts.from == "London");
  REQUIRE(opts.to == "Paris");
  REQUIRE_FALSE(opts.config_path.has_value());
  REQUIRE_FALSE(opts.timeout.has_value());
}

TEST_CASE("Command line - unit flag spellings", "[cli]")
{
  REQUIRE(parse({"--unit", "miles", "London", "Paris"}).unit == distance_unit::miles);
  REQUIRE(parse({"--unit=miles", "London", "Paris"}).unit == distance_unit::miles);
  REQUIRE(parse({"-unit", "km", "London", "Paris"}).unit == distance_unit::kilometers);
  REQUIRE(parse({"London", "Paris", "--unit", "miles"}).unit == distance_unit::miles);

  REQUIRE_THROWS_AS(parse({"--unit", "furlongs", "London", "Paris"}), invalid_usage);
  REQUIRE_THROWS_AS(parse({"--unit=Miles", "London", "Paris"}), invalid_usage);
  REQUIRE_THROWS_AS(parse({"London", "Paris", "--unit"}), invalid_usage);
}

TEST_CASE("Command line - help is checked first", "[cli]")
{
  REQUIRE(parse({"--help"}).help);
  REQUIRE(parse({"-h"}).help);
  REQUIRE(parse({"--unit", "furlongs", "--help"}).help);
  REQUIRE(parse({"--help", "--bogus", "only-one-place"}).help);
}

TEST_CASE("Command line - place names", "[cli]")
{
  REQUIRE_THROWS_AS(parse({}), invalid_usage);
  REQUIRE_THROWS_AS(parse({"London"}), invalid_usage);
  REQUIRE_THROWS_AS(parse({"London", "Paris", "Rome"}), invalid_usage);
  REQUIRE_THROWS_AS(parse({"London", ""}), invalid_usage);

  auto opts = parse({"--", "-Weird Place-", "New York"});
  REQUIRE(opts.from == "-Weird Place-");
  REQUIRE(opts.to == "New York");
}

TEST_CASE("Command line - ambient flags", "[cli]")
{
  auto opts = parse({"-v", "--config", "geodist.json", "--timeout=2500", "A", "B"});
  REQUIRE(opts.verbose);
  REQUIRE(opts.config_path == std::string("geodist.json"));
  REQUIRE(opts.timeout == std::chrono::milliseconds(2500));

  REQUIRE_THROWS_AS(parse({"--timeout", "soon", "A", "B"}), invalid_usage);
  REQUIRE_THROWS_AS(parse({"--timeout", "-5", "A", "B"}), invalid_usage);
  REQUIRE_THROWS_AS(parse({"--bogus", "A", "B"}), invalid_usage);
}

TEST_CASE("Command line - usage text", "[cli]")
{
  std::stringstream ss;
  geodist::cli::print_usage(ss, "geodist");
  REQUIRE(ss.str().find("Usage: geodist [OPTIONS] PLACE-A PLACE-B") == 0);
  REQUIRE(ss.str().find("--unit km|miles") != std::string::npos);
}

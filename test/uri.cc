// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include <catch2/catch.hpp>

#include "net/uri.h"

TEST_CASE("Endpoint uri parsing", "[uri]")
{
  using geodist::net::uri;

  uri google("https://maps.googleapis.com/maps/api/geocode/json");
  REQUIRE(google.proto() == uri::protocol::https);
  REQUIRE(google.host() == "maps.googleapis.com");
  REQUIRE(google.port() == 443);
  REQUIRE(google.path() == "/maps/api/geocode/json");

  uri local("http://localhost:8080/geocode");
  REQUIRE(local.proto() == uri::protocol::http);
  REQUIRE(local.host() == "localhost");
  REQUIRE(local.port() == 8080);
  REQUIRE(local.path() == "/geocode");

  uri bare("http://example.com");
  REQUIRE(bare.port() == 80);
  REQUIRE(bare.path() == "/");

  REQUIRE_THROWS_AS(uri("ftp://example.com/file"), std::invalid_argument);
  REQUIRE_THROWS_AS(uri("s3://bucket/key"), std::invalid_argument);
  REQUIRE_THROWS_AS(uri("maps.googleapis.com"), std::invalid_argument);
  REQUIRE_THROWS_AS(uri("https://example.com:99999/"), std::invalid_argument);
}

TEST_CASE("Uri schemes are case-insensitive", "[uri]")
{
  using geodist::net::uri;

  uri upper("HTTPS://maps.googleapis.com/maps/api/geocode/json");
  REQUIRE(upper.proto() == uri::protocol::https);
  REQUIRE(upper.port() == 443);
  REQUIRE(upper.path() == "/maps/api/geocode/json");

  uri mixed("Http://localhost:8080/geocode");
  REQUIRE(mixed.proto() == uri::protocol::http);
  REQUIRE(mixed.port() == 8080);

  REQUIRE_THROWS_AS(uri("FTP://example.com/file"), std::invalid_argument);
}

TEST_CASE("Query escaping", "[uri]")
{
  using geodist::net::query_escape;

  REQUIRE(query_escape("London") == "London");
  REQUIRE(query_escape("New York") == "New+York");
  REQUIRE(query_escape("a-b_c.d~e") == "a-b_c.d~e");
  REQUIRE(query_escape("&=?/+#") == "%26%3D%3F%2F%2B%23");
  REQUIRE(query_escape("S\xC3\xA3o Paulo, Brasil") == "S%C3%A3o+Paulo%2C+Brasil");
  REQUIRE(query_escape("") == "");
}

// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include <string>
#include <string_view>
#include <cstdint>

namespace geodist::net
{
/**
 * This type imlements a limited URI parser.
 *
 * It is by no means a complete URI parser implementation,
 * rather its implements the minimum subset of the parsing
 * functionality that is needed to address the geocoding 
 * provider endpoint.
 */
class uri
{
public:
  enum class protocol { http, https };

public:
  /**
   * Constructs an instance or the URI type.
   *
   * This constructor will attempt too parse the string
   * parameter passed to it, and throws std::invalid_argument 
   * if the value is not a valid http or https uri.
   */
  uri(std::string value);

public:
  uint16_t port() const { return port_; }
  protocol proto() const { return protocol_; }
  std::string const& host() const { return host_; }
  std::string const& path() const { return path_; }

public:
  std::string const& str() const { return full_; }
  operator std::string() const { return str(); }

private:
  uint16_t port_;
  std::string host_;
  std::string path_;
  std::string full_;
  protocol protocol_;
};

/**
 * Escapes a string so it can be placed safely inside a URL query.
 * Letters, digits and "-_.~" are kept, space becomes '+' and every
 * other byte is written as %XX.
 */
std::string query_escape(std::string_view value);

}  // namespace geodist::net

// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include <string>
#include <stdexcept>

namespace geodist::geocoder
{
/**
 * Thrown when the geocoding provider could not be reached or the
 * exchange with it failed at the network level: name resolution,
 * connection, TLS handshake, read or write errors, and non-2xx 
 * HTTP responses.
 */
class transport_error : public std::runtime_error
{
public:
  transport_error();
  transport_error(const char* msg);
  transport_error(std::string const& msg);
};

/**
 * Thrown when a lookup did not complete before its deadline.
 */
class timeout_error : public transport_error
{
public:
  timeout_error();
  timeout_error(const char* msg);
  timeout_error(std::string const& msg);
};

/**
 * Thrown when a lookup is abandoned through its stop token, typically
 * because the lookup running next to it has already failed.
 */
class cancelled_error : public transport_error
{
public:
  cancelled_error();
  cancelled_error(const char* msg);
  cancelled_error(std::string const& msg);
};

/**
 * Thrown when the provider responded, but the body is not JSON
 * or does not have the shape of a geocoding response.
 */
class decode_error : public std::runtime_error
{
public:
  decode_error();
  decode_error(const char* msg);
  decode_error(std::string const& msg);
};

}  // namespace geodist::geocoder

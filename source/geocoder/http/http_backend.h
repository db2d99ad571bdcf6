// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include "geocoder/geocoder.h"
#include "resolver.h"

namespace geodist::geocoder
{

/**
 * Talks to the geocoding provider over HTTP or HTTPS, depending on the
 * scheme of the configured endpoint.
 *
 * Every fetch runs on its own io_context and connection, so concurrent
 * lookups share nothing. TLS peers are verified against the system's
 * default certificate store and the endpoint host name.
 *
 * Host names go through the given resolve function on a thread of
 * their own, so a stalled resolver cannot hold a fetch past its
 * deadline or past a stop request.
 */
class http_backend final
  : public geocoder::impl
{
public:
  http_backend(config const& cfg, resolve_fn resolve = system_resolve);

public:
  std::string fetch(
    std::string const& target,
    deadline_t deadline,
    std::stop_token stop) const override;

private:
  net::uri endpoint_;
  std::string user_agent_;
  resolve_fn resolve_;
};

}

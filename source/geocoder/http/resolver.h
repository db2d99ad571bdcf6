// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include <string>
#include <functional>
#include <stop_token>

#include <boost/asio/ip/tcp.hpp>

#include "geocoder/config.h"

namespace geodist::geocoder
{

using endpoints_t = boost::asio::ip::tcp::resolver::results_type;

/**
 * A blocking name lookup. It may take as long as the
 * resolver behind it wants and throws on failure.
 */
using resolve_fn = std::function<
  endpoints_t(std::string const& host, std::string const& service)>;

/**
 * Resolves through the operating system (getaddrinfo).
 */
endpoints_t system_resolve(
  std::string const& host,
  std::string const& service);

/**
 * Runs the lookup on a detached thread and waits for it until the
 * deadline passes or a stop is requested, whichever comes first.
 *
 * getaddrinfo cannot be interrupted, so an abandoned lookup keeps
 * running in the background and its result is dropped when it ends.
 * The caller never waits for it.
 *
 * @throws timeout_error, cancelled_error when the wait is abandoned.
 * @throws transport_error when the lookup itself fails.
 */
endpoints_t resolve_until(
  resolve_fn const& lookup,
  std::string const& host,
  std::string const& service,
  deadline_t deadline,
  std::stop_token const& stop);

}

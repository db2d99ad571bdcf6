// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include <memory>
#include <string>
#include <optional>
#include <stop_token>

#include "config.h"
#include "net/uri.h"
#include "model/location.h"

namespace geodist::geocoder
{

/**
 * The outcome of a single successful lookup. An empty optional means
 * that the provider understood the query but had no candidates for it.
 */
using lookup_result = std::optional<model::resolved_location>;

/**
 * This class translates free-text place names into coordinates using an
 * external geocoding provider. The provider's ranking is trusted, the
 * first candidate it returns is the answer.
 *
 * Instances are safe to use from multiple threads at once, every lookup
 * goes out on its own connection.
 */
class geocoder
{
public:
  /**
   * All concrete transports to the geocoding provider must adhere to
   * this interface. The production one speaks HTTP(S) through beast,
   * tests replace it with canned responses.
   */
  class impl {
  public:
    /**
     * Performs one GET request for the given target (path and query)
     * and returns the response body.
     *
     * Called concurrently from the lookup tasks. Implementations throw
     * transport_error on network failures, timeout_error once the
     * deadline passes and cancelled_error when the stop token fires.
     */
    virtual std::string fetch(
      std::string const& target,
      deadline_t deadline,
      std::stop_token stop) const = 0;

    virtual ~impl() {}
  };

public:
  geocoder(
    config cfg,
    std::unique_ptr<impl> implementation);

public:
  /**
   * Resolves one free-text query to its best match.
   *
   * @param query a non-empty place name, escaped before transmission.
   * @param deadline the point in time after which the lookup is abandoned.
   * @param stop lets a sibling lookup abandon this one early.
   *
   * @throws std::invalid_argument on an empty query.
   * @throws transport_error when the provider could not be reached.
   * @throws decode_error when the response is not a geocoding response.
   */
  lookup_result resolve(
    std::string const& query,
    deadline_t deadline,
    std::stop_token stop = {}) const;

  /**
   * Builds the request target (endpoint path plus query string) for
   * a place name, with the api key appended when one is configured.
   */
  std::string request_target(std::string const& query) const;

public:
  template <typename BackendType>
  static geocoder create(config const& cfg)
  {
    return geocoder(cfg,
      std::make_unique<BackendType>(cfg));
  }

private:
  config config_;
  net::uri endpoint_;
  std::unique_ptr<impl> impl_;
};

}  // namespace geodist::geocoder

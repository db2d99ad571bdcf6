// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include <chrono>
#include <string>

#include "utils/json.h"

namespace geodist::geocoder
{

using deadline_t = std::chrono::steady_clock::time_point;

class config {
public:
  /**
   * Full url of the provider's geocoding endpoint, including
   * the scheme and path, without any query parameters.
   */
  std::string endpoint;

  /**
   * Appended as the "key" query parameter when not empty,
   * otherwise requests go out unauthenticated.
   */
  std::string api_key;

  std::string user_agent;

  /**
   * How long a single distance query may wait for both 
   * of its lookups.
   */
  std::chrono::milliseconds timeout;

  config();

  /**
   * Reads the "geocoder" section of the config file. Every
   * field is optional and falls back to its default.
   */
  config(json_t const& json);
};

/**
 * Returns a copy of the config with the api key taken from the
 * GOOGLE_API_KEY environment variable, if that variable is set 
 * and not empty.
 */
config with_environment(config cfg);

}

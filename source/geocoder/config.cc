// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include <cstdlib>
#include <stdexcept>

#include "config.h"

namespace geodist::geocoder
{

config::config()
  : endpoint("https://maps.googleapis.com/maps/api/geocode/json")
  , api_key()
  , user_agent("geodist/1.0")
  , timeout(std::chrono::seconds(10))
{
}

config::config(json_t const& json)
  : config()
{
  endpoint = json.get<std::string>("endpoint", endpoint);
  api_key = json.get<std::string>("api_key", api_key);
  user_agent = json.get<std::string>("user_agent", user_agent);

  auto timeout_ms = json.get<int64_t>("timeout_ms",
    static_cast<int64_t>(timeout.count()));
  if (timeout_ms <= 0) {
    throw std::invalid_argument("geocoder timeout must be positive");
  }
  timeout = std::chrono::milliseconds(timeout_ms);
}

config with_environment(config cfg)
{
  if (const char* key = std::getenv("GOOGLE_API_KEY"); 
      key != nullptr && *key != '\0') {
    cfg.api_key = key;
  }
  return cfg;
}

}

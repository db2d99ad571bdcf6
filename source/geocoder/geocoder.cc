// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include <string>
#include <chrono>
#include <optional>

#include "utils/log.h"
#include "utils/meta.h"

#include "error.h"
#include "geocoder.h"
#include "response.h"

namespace geodist::geocoder
{

geocoder::geocoder(
    config cfg,
    std::unique_ptr<impl> implementation)
  : config_(std::move(cfg))
  , endpoint_(config_.endpoint)
  , impl_(std::move(implementation))
{
  verify_argument(impl_ != nullptr);
}

std::string geocoder::request_target(std::string const& query) const
{
  std::string target = endpoint_.path();
  target += "?sensor=false&address=";
  target += net::query_escape(query);

  if (!config_.api_key.empty()) {
    target += "&key=";
    target += net::query_escape(config_.api_key);
  }
  return target;
}

lookup_result geocoder::resolve(
  std::string const& query,
  deadline_t deadline,
  std::stop_token stop) const
{
  verify_argument(!query.empty());

  // the target carries the api key, so only the query is logged.
  dbglog << "geocoding '" << query << "' via " << endpoint_.host()
         << (config_.api_key.empty() ? " (unauthenticated)" : "");

  auto started = std::chrono::steady_clock::now();
  std::string body = impl_->fetch(
    request_target(query), deadline, std::move(stop));

  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - started);
  dbglog << "geocoding '" << query << "' took " << elapsed.count()
         << "ms, " << body.size() << " bytes";

  lookup_result result = parse_response(body);
  if (result.has_value()) {
    infolog << "'" << query << "' resolved to " << *result;
  } else {
    infolog << "'" << query << "' did not match any place";
  }
  return result;
}

}  // namespace geodist::geocoder

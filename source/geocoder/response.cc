// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include <sstream>
#include <algorithm>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>

#include "error.h"
#include "response.h"
#include "utils/log.h"
#include "utils/meta.h"

namespace geodist::geocoder
{

namespace // detail
{
  /**
   * PropertyTree has no notion of json arrays, their elements become
   * children with empty keys. An empty array and an empty string are
   * indistinguishable, both are a node with no children and no data.
   */
  bool is_list(json_t const& node)
  {
    if (node.empty()) {
      return node.data().empty();
    }
    return std::all_of(node.begin(), node.end(),
      [](auto const& child) { return child.first.empty(); });
  }

  void log_provider_status(std::string const& status, json_t const& json)
  {
    dbglog << "geocoding provider status: " << status;
    if (status != "OK" && status != "ZERO_RESULTS") {
      auto message = to_std(json.get_optional<std::string>("error_message"));
      warnlog << "geocoding provider responded with " << status
              << (message.has_value() ? ": " + *message : std::string());
    }
  }
}

lookup_result parse_response(std::string const& body)
{
  json_t json;

  try {
    std::stringstream ss(body);
    boost::property_tree::read_json(ss, json);
  } catch (boost::property_tree::json_parser_error const& e) {
    throw decode_error("response is not valid json: " + e.message());
  }

  // the envelope is an object with a string status, anything else
  // (arrays, scalars, objects without status) is not a geocoding response.
  auto status = json.get_child_optional("status");
  if (!status.has_value() || !status->empty()) {
    throw decode_error("response has no status field");
  }
  log_provider_status(status->data(), json);

  auto results = json.get_child_optional("results");
  if (!results.has_value()) {
    return {};
  }

  if (!is_list(*results)) {
    throw decode_error("response results field is not a list");
  }

  if (results->empty()) {
    return {};
  }

  // the provider ranks candidates, the first one is trusted as is.
  json_t const& first = results->front().second;

  auto lat = first.get_optional<double>("geometry.location.lat");
  auto lng = first.get_optional<double>("geometry.location.lng");

  if (!lat.has_value() || !lng.has_value()) {
    throw decode_error("first result has no numeric geometry.location");
  }

  model::resolved_location location(
    spacial::coordinates(*lat, *lng),
    first.get<std::string>("formatted_address", std::string()));

  if (!location.coords().valid()) {
    warnlog << "provider returned out of range coordinates for "
            << location;
  }

  return location;
}

}  // namespace geodist::geocoder

// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include <chrono>
#include <string>
#include <variant>
#include <utility>
#include <exception>

#include "spacial/distance.h"
#include "model/location.h"
#include "geocoder/geocoder.h"

namespace geodist::services
{

/**
 * What a single lookup task reports back to the join.
 */
struct found { model::resolved_location location; };
struct not_found { std::string query; };
struct failed { std::exception_ptr error; };

using lookup_outcome = std::variant<found, not_found, failed>;

/**
 * Computes the surface distance between two place names.
 *
 * Both names are geocoded concurrently, each on its own task, and the
 * tasks share one deadline and one stop source. The first lookup that
 * fails stops its sibling. Whatever happens, both tasks have finished
 * before any of the public methods return.
 */
class distance_service final
{
public:
  distance_service(
    geocoder::geocoder const& engine,
    std::chrono::milliseconds timeout);

public:
  /**
   * Returns the great-circle distance between the best matches of
   * both queries, in the requested unit.
   *
   * @throws location_not_found when either query matches nothing.
   * @throws geocoder::timeout_error when the lookups outlive the timeout.
   * @throws geocoder::transport_error, geocoder::decode_error as raised
   *         by the failing lookup.
   */
  double invoke(
    std::string const& from,
    std::string const& to,
    spacial::distance_unit unit) const;

  /**
   * The fan-out/fan-in step on its own, resolves both queries
   * and returns their locations in argument order.
   */
  std::pair<model::resolved_location, model::resolved_location>
  resolve_pair(
    std::string const& from,
    std::string const& to) const;

private:
  geocoder::geocoder const& geocoder_;
  std::chrono::milliseconds timeout_;
};

}

// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include <array>
#include <future>
#include <optional>
#include <stop_token>

#include "distance.h"
#include "error.h"
#include "geocoder/error.h"
#include "utils/log.h"
#include "utils/future.h"
#include "utils/rendezvous.h"

namespace geodist::services
{

namespace // detail
{
  /**
   * Runs one lookup and turns every way it can end into an outcome
   * value, the exception itself travels to the join inside it.
   */
  lookup_outcome run_lookup(
    geocoder::geocoder const& engine,
    std::string const& query,
    geocoder::deadline_t deadline,
    std::stop_token stop)
  {
    try {
      if (auto result = engine.resolve(query, deadline, std::move(stop));
          result.has_value()) {
        return found{std::move(*result)};
      }
      return not_found{query};
    } catch (...) {
      return failed{std::current_exception()};
    }
  }

  bool is_cancellation(std::exception_ptr const& error)
  {
    try {
      std::rethrow_exception(error);
    } catch (geocoder::cancelled_error const&) {
      return true;
    } catch (...) {
      return false;
    }
  }
}

distance_service::distance_service(
  geocoder::geocoder const& engine,
  std::chrono::milliseconds timeout)
  : geocoder_(engine)
  , timeout_(timeout) { }

std::pair<model::resolved_location, model::resolved_location>
distance_service::resolve_pair(
  std::string const& from,
  std::string const& to) const
{
  const auto deadline = std::chrono::steady_clock::now() + timeout_;

  std::stop_source stop;
  utils::rendezvous<lookup_outcome> join;

  auto lookup = [this, &join, &stop, deadline](
    size_t slot, std::string const& query) {
    join.deliver(slot, run_lookup(
      geocoder_, query, deadline, stop.get_token()));
  };

  // the futures are declared last, so even when unwinding they block
  // until both tasks are done with the join and the stop source.
  auto from_task = std::async(std::launch::async, lookup, 0, std::cref(from));
  auto to_task = std::async(std::launch::async, lookup, 1, std::cref(to));

  std::array<std::optional<model::resolved_location>, 2> resolved;
  std::optional<std::string> missing;
  std::exception_ptr error;

  for (size_t received = 0; received < 2; ++received) {
    auto next = join.receive_until(deadline);
    if (!next.has_value()) {
      warnlog << "geocoding did not finish within "
              << timeout_.count() << "ms, cancelling";
      stop.request_stop();
      utils::wait_for_all(from_task, to_task);
      throw geocoder::timeout_error("geocoding did not finish within " +
        std::to_string(timeout_.count()) + "ms");
    }

    auto& [slot, outcome] = *next;

    if (auto* f = std::get_if<found>(&outcome); f != nullptr) {
      resolved[slot].emplace(std::move(f->location));
    } else if (auto* nf = std::get_if<not_found>(&outcome); nf != nullptr) {
      if (!missing.has_value()) {
        missing = std::move(nf->query);
      }
      stop.request_stop();
    } else if (auto* fl = std::get_if<failed>(&outcome); fl != nullptr) {
      // a cancelled sibling only echoes the failure that stopped it.
      if (!error && !is_cancellation(fl->error)) {
        error = fl->error;
      }
      stop.request_stop();
    }
  }

  utils::wait_for_all(from_task, to_task);

  // a real failure takes precedence over a place that was not found,
  // when both lookups ended badly the caller sees the more severe one.
  if (error) {
    std::rethrow_exception(error);
  }

  if (missing.has_value()) {
    throw location_not_found(std::move(*missing));
  }

  if (!resolved[0].has_value() || !resolved[1].has_value()) {
    // only reachable if a lookup was cancelled without anything
    // having requested a stop, which would be a bug in the join.
    throw geocoder::cancelled_error("lookup ended without an outcome");
  }

  return { std::move(*resolved[0]), std::move(*resolved[1]) };
}

double distance_service::invoke(
  std::string const& from,
  std::string const& to,
  spacial::distance_unit unit) const
{
  auto [a, b] = resolve_pair(from, to);

  double distance = spacial::haversine_distance(
    a.coords(), b.coords(), unit);

  infolog << "distance between " << a << " and " << b
          << " is " << distance << " " << unit;
  return distance;
}

}

// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include <mutex>
#include <memory>
#include <thread>
#include <exception>
#include <condition_variable>

#include <boost/asio/io_context.hpp>
#include <boost/system/system_error.hpp>

#include "resolver.h"
#include "geocoder/error.h"
#include "utils/log.h"

namespace geodist::geocoder
{

namespace // detail
{
  /**
   * Shared between the waiting fetch and the lookup thread,
   * whichever of them lets go of it last frees it.
   */
  struct pending_lookup
  {
    std::mutex mutex;
    std::condition_variable_any ready;
    bool done = false;
    endpoints_t endpoints;
    std::exception_ptr error;
  };
}

endpoints_t system_resolve(
  std::string const& host,
  std::string const& service)
{
  // synchronous resolves run on the calling thread, the io_context
  // never starts the resolver's private worker thread for them.
  boost::asio::io_context ioctx;
  boost::asio::ip::tcp::resolver resolver(ioctx);
  return resolver.resolve(host, service);
}

endpoints_t resolve_until(
  resolve_fn const& lookup,
  std::string const& host,
  std::string const& service,
  deadline_t deadline,
  std::stop_token const& stop)
{
  if (stop.stop_requested()) {
    throw cancelled_error("name lookup for " + host + " cancelled");
  }

  auto state = std::make_shared<pending_lookup>();
  std::thread([state, lookup, host, service] {
    endpoints_t endpoints;
    std::exception_ptr error;
    try {
      endpoints = lookup(host, service);
    } catch (...) {
      error = std::current_exception();
    }

    {
      std::lock_guard<std::mutex> lock(state->mutex);
      state->endpoints = std::move(endpoints);
      state->error = error;
      state->done = true;
    }
    state->ready.notify_all();
  }).detach();

  std::unique_lock<std::mutex> lock(state->mutex);
  bool finished = state->ready.wait_until(lock, stop, deadline,
    [&state] { return state->done; });

  if (!finished) {
    if (stop.stop_requested()) {
      throw cancelled_error("name lookup for " + host + " cancelled");
    }
    warnlog << "name lookup for " << host << " still pending at the deadline";
    throw timeout_error("name lookup for " + host + " timed out");
  }

  if (state->error) {
    try {
      std::rethrow_exception(state->error);
    } catch (boost::system::system_error const& e) {
      throw transport_error("resolve failed for " + host + ": " + 
                            e.code().message());
    } catch (std::exception const& e) {
      throw transport_error("resolve failed for " + host + ": " + e.what());
    }
  }

  dbglog << "resolved " << host << " to "
         << state->endpoints.size() << " endpoint(s)";
  return state->endpoints;
}

}

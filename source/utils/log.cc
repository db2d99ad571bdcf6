// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include "log.h"
#include "json.h"

#include <atomic>
#include <iomanip>
#include <iostream>
#include <stdexcept>

#include <unistd.h>

#include <boost/algorithm/string.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>
#include <boost/smart_ptr/make_shared_object.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/core/null_deleter.hpp>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/attributes.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>

namespace geodist::logging
{

namespace logging = boost::log;
namespace attrs = boost::log::attributes;
namespace sinks = boost::log::sinks;
namespace expr = boost::log::expressions;


static std::atomic<size_t> thread_counter;

size_t assign_thread_id() {
    thread_local size_t tid = ++thread_counter;
    return tid;
}

void plain_formatter(
  boost::log::record_view const& rec, 
  boost::log::formatting_ostream& strm)
{
  strm << logging::extract<boost::posix_time::ptime>("ts", rec) << " | "
       << std::setw(7) << rec[logging::trivial::severity] << " | "
       << std::setw(2) << logging::extract<size_t>("tid", rec) << " | "
       << rec[expr::smessage];
}

void coloring_formatter(
  boost::log::record_view const& rec, 
  boost::log::formatting_ostream& strm)
{
  auto severity = rec[boost::log::trivial::severity];
  if (severity)
  {
      switch (severity.get())
      {
      case boost::log::trivial::severity_level::trace:
          strm << "\033[38;5;242m"; break;
      case boost::log::trivial::severity_level::debug:
          strm << "\033[38;5;246m"; break;
      case boost::log::trivial::severity_level::info:
          strm << "\033[32m"; break;
      case boost::log::trivial::severity_level::warning:
          strm << "\033[33m"; break;
      case boost::log::trivial::severity_level::error:
      case boost::log::trivial::severity_level::fatal:
          strm << "\033[31m"; break;
      default:
          break;
      }
  }
  plain_formatter(rec, strm);
  if (severity) {
      strm << "\033[0m";
  }
}

boost::log::trivial::severity_level parse_level(std::string const& name)
{
  using boost::log::trivial::severity_level;
  if (boost::iequals(name, "trace")) {
    return severity_level::trace;
  } else if (boost::iequals(name, "debug")) {
    return severity_level::debug;
  } else if (boost::iequals(name, "info")) {
    return severity_level::info;
  } else if (boost::iequals(name, "warning")) {
    return severity_level::warning;
  } else if (boost::iequals(name, "error")) {
    return severity_level::error;
  } else if (boost::iequals(name, "fatal")) {
    return severity_level::fatal;
  } else {
    throw std::invalid_argument("unrecognized log level: " + name);
  }
}

void set_level(boost::log::trivial::severity_level level)
{
  logging::core::get()->set_filter(logging::trivial::severity >= level);
}

void init(json_t const& config, std::ostream& output)
{
  typedef sinks::text_ostream_backend backend_t;
  typedef sinks::synchronous_sink<backend_t> sink_t;

  auto level = parse_level(
    config.get<std::string>("logging.level", std::string("warning")));

  // escape codes only make sense on a terminal
  bool colored = config.get<bool>("logging.color",
    &output == &std::clog && ::isatty(STDERR_FILENO) == 1);

  boost::shared_ptr<std::ostream> strm(
    &output, boost::null_deleter());

  auto backend = boost::make_shared<backend_t>();
  backend->add_stream(strm);
  backend->auto_flush(true);

  auto sink = boost::make_shared<sink_t>(backend);
  if (colored) {
    sink->set_formatter(&coloring_formatter);
  } else {
    sink->set_formatter(&plain_formatter);
  }

  // Add it to the core, in place of whatever was there
  logging::core::get()->remove_all_sinks();
  logging::core::get()->add_sink(sink);
  set_level(level);
  
  // Add some attributes too
  logging::core::get()->add_global_attribute("ts", attrs::local_clock());
  logging::core::get()->add_global_attribute("tid", 
    attrs::make_function(&assign_thread_id));
}

}

// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include <string>
#include <ostream>
#include <iostream>

#include "json.h"
#include <boost/log/trivial.hpp>

#define tracelog BOOST_LOG_TRIVIAL(trace)
#define dbglog BOOST_LOG_TRIVIAL(debug)
#define infolog BOOST_LOG_TRIVIAL(info)
#define warnlog BOOST_LOG_TRIVIAL(warning)
#define errlog BOOST_LOG_TRIVIAL(error)
#define fatallog BOOST_LOG_TRIVIAL(fatal)


namespace geodist::logging
{
  /**
   * Installs the one log sink, replacing any earlier one, and applies
   * the severity filter from the "logging.level" entry of the config.
   * Stdout is left untouched, it carries only the computed distance.
   *
   * Lines are coloured when "logging.color" says so, or by default
   * when the output is stderr and stderr is a terminal.
   */
  void init(json_t const& config, std::ostream& output = std::clog);

  /**
   * Overrides the severity filter installed by init().
   */
  void set_level(boost::log::trivial::severity_level level);

  /**
   * Maps trace|debug|info|warning|error|fatal (any case) to a 
   * severity level. Throws std::invalid_argument otherwise.
   */
  boost::log::trivial::severity_level parse_level(std::string const& name);
}

// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include <chrono>
#include <string>
#include <iosfwd>
#include <optional>
#include <stdexcept>

#include "spacial/distance.h"

namespace geodist::cli
{
/**
 * Thrown when the command line cannot be turned into a distance
 * query: unknown flags, missing flag values, a unit other than km 
 * or miles, or a wrong number of place names.
 */
class invalid_usage : public std::runtime_error
{
public:
  invalid_usage();
  invalid_usage(const char* msg);
  invalid_usage(std::string const& msg);
};

/**
 * Everything the command line says about one invocation.
 */
struct options
{
  bool help = false;
  bool verbose = false;
  spacial::distance_unit unit = spacial::distance_unit::kilometers;
  std::optional<std::string> config_path;
  std::optional<std::chrono::milliseconds> timeout;
  std::string from;
  std::string to;
};

/**
 * Parses [--unit km|miles] [--config FILE] [--timeout MS] [--verbose] 
 * [--help] PLACE-A PLACE-B.
 *
 * Flags take either one or two leading dashes, and their values either 
 * as the next argument or after '='. A lone "--" ends the flags. When 
 * --help is present nothing else is validated and the returned options
 * only have help set.
 *
 * @throws invalid_usage
 */
options parse_options(int argc, const char** argv);

void print_usage(std::ostream& os, std::string const& program);

}  // namespace geodist::cli

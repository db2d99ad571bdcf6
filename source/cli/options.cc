// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include "options.h"

#include <vector>
#include <ostream>
#include <string_view>

#include <boost/lexical_cast.hpp>

namespace geodist::cli
{

invalid_usage::invalid_usage()
    : invalid_usage("invalid usage")
{
}
invalid_usage::invalid_usage(const char *msg)
    : runtime_error(msg)
{
}
invalid_usage::invalid_usage(std::string const& msg)
    : runtime_error(msg)
{
}

namespace // detail
{
  /**
   * The command line as written, before any of it is validated.
   */
  struct raw_arguments
  {
    bool help = false;
    bool verbose = false;
    std::optional<std::string> unit;
    std::optional<std::string> config_path;
    std::optional<std::string> timeout;
    std::vector<std::string> positional;
    std::optional<std::string> syntax_error;
  };

  bool is_flag(std::string_view arg)
  { return arg.size() > 1 && arg[0] == '-'; }

  raw_arguments collect(int argc, const char** argv)
  {
    raw_arguments raw;

    auto fail = [&raw](std::string message) {
      if (!raw.syntax_error.has_value()) {
        raw.syntax_error = std::move(message);
      }
    };

    bool flags_ended = false;
    for (int i = 1; i < argc; ++i) {
      std::string_view arg(argv[i]);

      if (flags_ended || !is_flag(arg)) {
        raw.positional.emplace_back(arg);
        continue;
      }

      if (arg == "--") {
        flags_ended = true;
        continue;
      }

      // strip one or two leading dashes and split off "=value"
      arg.remove_prefix(arg.rfind("--", 0) == 0 ? 2 : 1);
      std::optional<std::string> inline_value;
      if (auto eq = arg.find('='); eq != std::string_view::npos) {
        inline_value = std::string(arg.substr(eq + 1));
        arg = arg.substr(0, eq);
      }

      auto take_value = [&](std::optional<std::string>& into) {
        if (inline_value.has_value()) {
          into = std::move(inline_value);
        } else if (i + 1 < argc) {
          into = std::string(argv[++i]);
        } else {
          fail("flag --" + std::string(arg) + " requires a value");
        }
      };

      if (arg == "help" || arg == "h") {
        raw.help = true;
      } else if (arg == "verbose" || arg == "v") {
        raw.verbose = true;
      } else if (arg == "unit") {
        take_value(raw.unit);
      } else if (arg == "config") {
        take_value(raw.config_path);
      } else if (arg == "timeout") {
        take_value(raw.timeout);
      } else {
        fail("unknown flag -" + std::string(arg));
      }
    }
    return raw;
  }
}

options parse_options(int argc, const char** argv)
{
  raw_arguments raw = collect(argc, argv);
  options output;

  // help wins over everything else on the command line,
  // none of the other arguments are validated in that case.
  if (raw.help) {
    output.help = true;
    return output;
  }

  if (raw.syntax_error.has_value()) {
    throw invalid_usage(*raw.syntax_error);
  }

  if (raw.unit.has_value()) {
    try {
      output.unit = spacial::parse_unit(*raw.unit);
    } catch (std::invalid_argument const& e) {
      throw invalid_usage(e.what());
    }
  }

  if (raw.timeout.has_value()) {
    int64_t ms = 0;
    try {
      ms = boost::lexical_cast<int64_t>(*raw.timeout);
    } catch (boost::bad_lexical_cast const&) {
      throw invalid_usage("timeout must be a number of milliseconds");
    }
    if (ms <= 0) {
      throw invalid_usage("timeout must be positive");
    }
    output.timeout = std::chrono::milliseconds(ms);
  }

  if (raw.positional.size() < 2) {
    throw invalid_usage("two place names are required");
  }
  if (raw.positional.size() > 2) {
    throw invalid_usage("only two place names are supported");
  }
  if (raw.positional[0].empty() || raw.positional[1].empty()) {
    throw invalid_usage("place names must not be empty");
  }

  output.verbose = raw.verbose;
  output.config_path = std::move(raw.config_path);
  output.from = std::move(raw.positional[0]);
  output.to = std::move(raw.positional[1]);
  return output;
}

void print_usage(std::ostream& os, std::string const& program)
{
  os << "Usage: " << program << " [OPTIONS] PLACE-A PLACE-B\n"
     << "       " << program << " [ --help ]\n\n"
     << "Find the distance between two places.\n\n"
     << "Options:\n"
     << "  --unit km|miles   unit to display the distance in (default km)\n"
     << "  --config FILE     json config file\n"
     << "  --timeout MS      give up on geocoding after MS milliseconds\n"
     << "  --verbose, -v     log debug information to stderr\n"
     << "  --help, -h        print this message\n\n"
     << "The GOOGLE_API_KEY environment variable, when set, is sent\n"
     << "along with every geocoding request.\n";
}

}  // namespace geodist::cli

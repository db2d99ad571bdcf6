// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include <string>
#include <iomanip>
#include <optional>
#include <iostream>
#include <filesystem>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>

#include "cli/options.h"

#include "geocoder/error.h"
#include "geocoder/geocoder.h"
#include "geocoder/http/http_backend.h"

#include "services/error.h"
#include "services/distance.h"

#include "utils/log.h"

enum exit_status {
  success           = 0,
  invalid_usage     = 1,
  location_missing  = 2,
  transport_failure = 3,
  decode_failure    = 4,
  internal_failure  = 5,
};

json_t read_config(std::optional<std::string> const& path)
{
  json_t systemconfig;
  if (path.has_value()) {
    boost::property_tree::read_json(*path, systemconfig);
  }
  return systemconfig;
}

double measure(geodist::cli::options const& opts, json_t const& systemconfig)
{
  using namespace geodist;

  const json_t no_section;
  geocoder::config geocoderconfig = geocoder::with_environment(
    geocoder::config(systemconfig.get_child("geocoder", no_section)));

  if (opts.timeout.has_value()) {
    geocoderconfig.timeout = *opts.timeout;
  }

  auto engine = geocoder::geocoder::create<
    geocoder::http_backend>(geocoderconfig);

  services::distance_service service(engine, geocoderconfig.timeout);
  return service.invoke(opts.from, opts.to, opts.unit);
}

int main(int argc, const char** argv)
{
  using namespace geodist;

  const std::string program = argc > 0
    ? std::filesystem::path(argv[0]).filename().string()
    : "geodist";

  cli::options opts;
  try {
    opts = cli::parse_options(argc, argv);
  } catch (cli::invalid_usage const& e) {
    std::cerr << program << ": " << e.what() << std::endl;
    cli::print_usage(std::cout, program);
    return exit_status::invalid_usage;
  }

  if (opts.help) {
    cli::print_usage(std::cout, program);
    return exit_status::success;
  }

  // this holds the geocoder and logging sections, every
  // value in there has a default, so the file is optional.
  json_t systemconfig;
  try {
    systemconfig = read_config(opts.config_path);
    logging::init(systemconfig);
  } catch (std::exception const& e) {
    logging::init(json_t());
    errlog << "fatal: invalid config: " << e.what();
    return exit_status::internal_failure;
  }

  if (opts.verbose) {
    logging::set_level(boost::log::trivial::debug);
  }

  try {
    double distance = measure(opts, systemconfig);
    std::cout << std::fixed << std::setprecision(6)
              << distance << std::endl;
    return exit_status::success;

  } catch (services::location_not_found const& e) {
    errlog << "fatal: " << e.what();
    return exit_status::location_missing;
  } catch (geocoder::transport_error const& e) {
    errlog << "fatal: " << e.what();
    return exit_status::transport_failure;
  } catch (geocoder::decode_error const& e) {
    errlog << "fatal: " << e.what();
    return exit_status::decode_failure;
  } catch (std::exception const& e) {
    errlog << "fatal: " << e.what();
    return exit_status::internal_failure;
  }
}

// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include "distance.h"

#include <cmath>
#include <ostream>
#include <algorithm>
#include <stdexcept>

#include <boost/math/constants/constants.hpp>

namespace geodist::spacial
{

namespace // detail
{
  inline double radians(double degrees)
  { return degrees * boost::math::double_constants::degree; }

  inline double squared(double value)
  { return value * value; }
}

distance_unit parse_unit(std::string const& text)
{
  if (text == "km") {
    return distance_unit::kilometers;
  } else if (text == "miles") {
    return distance_unit::miles;
  } else {
    throw std::invalid_argument(
      "unrecognized distance unit (expected km or miles)");
  }
}

std::ostream& operator<<(std::ostream& os, distance_unit unit)
{
  switch (unit) {
    case distance_unit::kilometers: return os << "km";
    case distance_unit::miles: return os << "miles";
  }
  return os;
}

double haversine_distance(
  coordinates const& from,
  coordinates const& to,
  distance_unit unit)
{
  const double phi1 = radians(from.latitude());
  const double phi2 = radians(to.latitude());

  const double delta_phi = radians(from.latitude() - to.latitude());
  const double delta_lambda = radians(from.longitude() - to.longitude());

  double a = squared(std::sin(delta_phi / 2)) +
    std::cos(phi1) * std::cos(phi2) * 
    squared(std::sin(delta_lambda / 2));
  a = std::clamp(a, 0.0, 1.0);

  const double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));
  const double km = earth_radius_km * c;

  if (unit == distance_unit::miles) {
    return km * miles_per_km;
  }
  return km;
}

}

// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include <iosfwd>
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/register/point.hpp>

namespace geodist::spacial
{
  
/**
 * Represents a single GPS coordinate (lat, lng) in decimal degrees.
 */
class coordinates
{
public:
  coordinates();
  coordinates(double lat, double lng);

public:  // r/o
  double longitude() const;
  double latitude() const;

public:  // r/w
  double& longitude();
  double& latitude();

public:
  /**
   * True when latitude is within [-90, 90] and longitude within 
   * [-180, 180]. The provider does not promise this, so callers 
   * that care have to check.
   */
  bool valid() const;

public:
  bool operator==(coordinates const& other) const;
  bool operator!=(coordinates const& other) const;

private:
  double lat_, lng_;
};

std::ostream& operator<<(std::ostream& os, coordinates const& c);

}

/**
 * This registers the custom class `coordinates` type
 * as a point type with boost::geometry so it can be fed
 * to the library's spherical distance strategies without
 * converting to point2d first.
 */
BOOST_GEOMETRY_REGISTER_POINT_2D(
  geodist::spacial::coordinates, double,
  boost::geometry::cs::spherical_equatorial<boost::geometry::degree>, 
  longitude(), latitude())

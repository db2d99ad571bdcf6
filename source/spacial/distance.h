// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include <string>
#include <iosfwd>

#include "coords.h"

namespace geodist::spacial
{

/**
 * Mean radius of the spherical earth model used for 
 * all surface distance calculations.
 */
constexpr double earth_radius_km = 6371.0;

/**
 * Statute miles in one kilometer.
 */
constexpr double miles_per_km = 0.621371192;

enum class distance_unit { kilometers, miles };

/**
 * Accepts exactly "km" or "miles", throws std::invalid_argument
 * for anything else.
 */
distance_unit parse_unit(std::string const& text);

std::ostream& operator<<(std::ostream& os, distance_unit unit);

/**
 * Great-circle distance between two points on a sphere of radius
 * earth_radius_km, using the haversine formula.
 * 
 * The intermediate haversine term is clamped to [0, 1] before taking
 * square roots. Rounding can push it microscopically outside that range
 * for identical or antipodal points, and an unclamped sqrt(1 - a) would
 * then turn the whole result into NaN.
 */
double haversine_distance(
  coordinates const& from,
  coordinates const& to,
  distance_unit unit = distance_unit::kilometers);

}

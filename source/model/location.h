// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include <string>
#include <iosfwd>

#include "spacial/coords.h"

namespace geodist::model
{
/**
 * A place name resolved by the geocoding provider: the coordinates of
 * its best match and the provider's canonical address for it.
 * 
 * Instances are never modified after the geocoder creates them.
 */
class resolved_location
{
public:
  resolved_location(
    spacial::coordinates coords,
    std::string formatted_address);

public:
  spacial::coordinates const& coords() const;
  std::string const& formatted_address() const;

private:
  spacial::coordinates coords_;
  std::string formatted_address_;
};

std::ostream& operator<<(std::ostream& os, resolved_location const& loc);

}

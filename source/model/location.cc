// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include "location.h"

#include <ostream>

namespace geodist::model 
{

resolved_location::resolved_location(
  spacial::coordinates coords,
  std::string formatted_address)
  : coords_(std::move(coords))
  , formatted_address_(std::move(formatted_address))
{
}

spacial::coordinates const& resolved_location::coords() const
{ return coords_; }

std::string const& resolved_location::formatted_address() const
{ return formatted_address_; }

std::ostream& operator<<(std::ostream& os, resolved_location const& loc)
{
  return os << "'" << loc.formatted_address() << "' " << loc.coords();
}

}  // namespace geodist::model

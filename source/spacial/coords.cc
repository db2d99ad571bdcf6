// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include "coords.h"

#include <ostream>

namespace geodist::spacial
{

coordinates::coordinates()
  : lat_(0)
  , lng_(0)
{
}

coordinates::coordinates(double lat, double lng)
    : lat_(lat)
    , lng_(lng)
{
}

double coordinates::latitude() const 
{ return lat_; }

double coordinates::longitude() const 
{ return lng_; }

double& coordinates::latitude() 
{ return lat_; }

double& coordinates::longitude() 
{ return lng_; }

bool coordinates::valid() const 
{
  return latitude() >= -90.0 && latitude() <= 90.0 &&
         longitude() >= -180.0 && longitude() <= 180.0;
}

bool coordinates::operator==(coordinates const& other) const
{ 
  return latitude() == other.latitude() && 
         longitude() == other.longitude();
}

bool coordinates::operator!=(coordinates const& other) const
{ return !(*this == other); }

std::ostream& operator<<(std::ostream& os, coordinates const& c)
{
  return os << "(" << c.latitude() << ", " << c.longitude() << ")";
}

}

// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include <string>
#include <stdexcept>

namespace geodist::services
{
/**
 * Thrown when one of the place names of a distance query
 * did not match anything at the provider. No distance is 
 * computed in that case.
 */
class location_not_found : public std::runtime_error
{
public:
  location_not_found(std::string query);

public:
  std::string const& query() const;

private:
  std::string query_;
};

}  // namespace geodist::services

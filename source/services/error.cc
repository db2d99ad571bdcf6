// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include "error.h"

namespace geodist::services
{
location_not_found::location_not_found(std::string query)
    : runtime_error("location not found: " + query)
    , query_(std::move(query))
{
}

std::string const& location_not_found::query() const
{ return query_; }

}  // namespace geodist::services

// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include <string>

#include "geocoder.h"

namespace geodist::geocoder
{

/**
 * Interprets the body of a geocoding response.
 *
 * The expected envelope is:
 *   { "status": "OK",
 *     "results": [ { "formatted_address": "...",
 *                    "geometry": { "location": { "lat": 1.0, "lng": 2.0 } } } ] }
 *
 * Only the first element of "results" is looked at. A missing or empty
 * results list is a valid "nothing matched" answer and yields an empty
 * result. Anything that does not fit this shape throws decode_error.
 */
lookup_result parse_response(std::string const& body);

}  // namespace geodist::geocoder

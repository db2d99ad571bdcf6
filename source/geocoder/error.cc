// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include "error.h"

namespace geodist::geocoder
{
transport_error::transport_error()
    : transport_error("transport error")
{
}
transport_error::transport_error(const char *msg)
    : runtime_error(msg)
{
}
transport_error::transport_error(std::string const& msg)
    : runtime_error(msg)
{
}

timeout_error::timeout_error()
    : timeout_error("lookup timed out")
{
}
timeout_error::timeout_error(const char *msg)
    : transport_error(msg)
{
}
timeout_error::timeout_error(std::string const& msg)
    : transport_error(msg)
{
}

cancelled_error::cancelled_error()
    : cancelled_error("lookup cancelled")
{
}
cancelled_error::cancelled_error(const char *msg)
    : transport_error(msg)
{
}
cancelled_error::cancelled_error(std::string const& msg)
    : transport_error(msg)
{
}

decode_error::decode_error()
    : decode_error("malformed geocoding response")
{
}
decode_error::decode_error(const char *msg)
    : runtime_error(msg)
{
}
decode_error::decode_error(std::string const& msg)
    : runtime_error(msg)
{
}

}  // namespace geodist::geocoder

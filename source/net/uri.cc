// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include "uri.h"

#include <regex>
#include <stdexcept>

#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string/case_conv.hpp>

namespace geodist::net
{

uri::uri(std::string value)
    : full_(std::move(value))
{
  static const std::regex urlregex(
      "^(.*)://([A-Za-z0-9\\-\\.]+)(:[0-9]+)?(.*)$",
      std::regex::ECMAScript | std::regex::icase);

  std::smatch matches;
  if (!std::regex_search(full_, matches, urlregex) || 
      matches.size() != 5) {
    throw std::invalid_argument("invalid uri");
  }

  // schemes are case-insensitive, the regex already matched them that way
  const auto scheme = boost::algorithm::to_lower_copy(matches[1].str());
  if (scheme == "http") {
    protocol_ = protocol::http;
  } else if (scheme == "https") {
    protocol_ = protocol::https;
  } else {
    throw std::invalid_argument("protocol not supported");
  }

  host_ = matches[2];
  path_ = matches[4];

  if (path_.empty()) {
    path_ = "/";
  }

  if (matches[3].length() == 0) {
    port_ = protocol_ == protocol::http ? 80 : 443;
  } else {
    try {
      // skip the leading colon
      port_ = boost::lexical_cast<uint16_t>(matches[3].str().substr(1));
    } catch (boost::bad_lexical_cast const&) {
      throw std::invalid_argument("invalid uri port");
    }
  }
}

std::string query_escape(std::string_view value)
{
  static const char hexdigits[] = "0123456789ABCDEF";

  std::string output;
  output.reserve(value.size() * 3);
  for (unsigned char c : value) {
    if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
        (c >= '0' && c <= '9') || 
        c == '-' || c == '_' || c == '.' || c == '~') {
      output.push_back(static_cast<char>(c));
    } else if (c == ' ') {
      output.push_back('+');
    } else {
      output.push_back('%');
      output.push_back(hexdigits[c >> 4]);
      output.push_back(hexdigits[c & 0x0F]);
    }
  }
  return output;
}

}  // namespace geodist::net

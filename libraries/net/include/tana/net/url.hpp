#pragma once

#include <tana/net/exceptions.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace tana::net {

struct url
{
   std::string                  scheme;
   std::optional< std::string > host;
   uint16_t                     port = 0;
   std::string                  target = "/";

   bool is_secure() const;
   std::string authority() const;
};

/**
 * Parses an absolute URL.
 *
 * The scheme and host are lowercased and the port defaults by scheme. A URL
 * with no authority component (e.g. "data:...") parses without a host.
 *
 * Throws invalid_url on a malformed URL.
 */
url parse_url( const std::string& str );

} // tana::net

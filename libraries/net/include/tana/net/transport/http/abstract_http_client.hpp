#pragma once

#include <tana/net/url.hpp>

#include <string>

namespace tana::net::transport::http {

struct http_result
{
   unsigned    status = 0;
   std::string body;
};

/**
 * Performs outbound GET requests.
 *
 * Implementations throw fetch_failed when the request cannot be delivered or
 * its response head cannot be read, and body_read_failed when the body cannot.
 */
struct abstract_http_client
{
   virtual http_result get( const url& u ) = 0;

   abstract_http_client() = default;
   virtual ~abstract_http_client() = default;
};

} // tana::net::transport::http

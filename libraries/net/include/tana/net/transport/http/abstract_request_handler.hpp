#pragma once

#include <map>
#include <string>

namespace tana::net::transport::http {

struct request
{
   std::string                          method;
   std::string                          path;
   std::map< std::string, std::string > query;
   std::map< std::string, std::string > headers;
   std::string                          body;
   std::string                          remote_address;
};

struct response
{
   unsigned                             status = 200;
   std::map< std::string, std::string > headers;
   std::string                          body;
};

struct abstract_request_handler
{
   virtual response handle( const request& req ) = 0;

   abstract_request_handler() = default;
   virtual ~abstract_request_handler() = default;
};

} // tana::net::transport::http

#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>

#include <boost/algorithm/string.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <tana/exception.hpp>
#include <tana/log.hpp>
#include <tana/net/transport/http/abstract_request_handler.hpp>

namespace tana::net::transport::http {

namespace beast = boost::beast;
namespace bhttp = beast::http;

constexpr const char* version_string = "Tana/" TANA_VERSION;

std::string percent_decode( std::string_view s, bool plus_as_space );
void split_target( std::string_view target, std::string& path, std::map< std::string, std::string >& query );

struct router
{
   std::shared_ptr< abstract_request_handler > handler;

   template< class Body, class Allocator, class Send >
   void handle( bhttp::request< Body, bhttp::basic_fields< Allocator > >&& req, const std::string& remote_address, Send&& send ) const
   {
      auto const cors = [ &req ]( auto& res )
      {
         res.set( bhttp::field::server, version_string );
         res.set( bhttp::field::access_control_allow_origin, "*" );
         res.set( bhttp::field::access_control_allow_methods, "GET, POST, OPTIONS" );
         res.set( bhttp::field::access_control_allow_headers, "*" );
         res.keep_alive( req.keep_alive() );
      };

      auto const error_response = [ &req, &cors ]( bhttp::status status, std::string why )
      {
         bhttp::response< bhttp::string_body > res{ status, req.version() };
         cors( res );
         res.set( bhttp::field::content_type, "text/plain" );
         res.body() = std::move( why );
         res.prepare_payload();
         return res;
      };

      switch ( req.method() )
      {
         case bhttp::verb::get:
         case bhttp::verb::post:
            break;
         case bhttp::verb::options:
         {
            bhttp::response< bhttp::empty_body > res{ bhttp::status::no_content, req.version() };
            cors( res );
            res.set( bhttp::field::access_control_max_age, "86400" );
            return send( std::move( res ) );
         }
         default:
            return send( error_response( bhttp::status::method_not_allowed, "unsupported http method" ) );
      }

      if ( !handler )
         return send( error_response( bhttp::status::not_found, "no handler" ) );

      request r;
      r.method = std::string( req.method_string() );
      split_target( std::string_view( req.target().data(), req.target().size() ), r.path, r.query );
      for ( const auto& field : req )
         r.headers[ boost::algorithm::to_lower_copy( std::string( field.name_string() ) ) ] = std::string( field.value() );
      r.body = req.body();
      r.remote_address = remote_address;

      response handled;

      try
      {
         handled = handler->handle( r );
      }
      catch ( const tana::exception& e )
      {
         LOG(error) << boost::diagnostic_information( e );
         return send( error_response( bhttp::status::internal_server_error, e.what() ) );
      }
      catch ( const std::exception& e )
      {
         LOG(error) << e.what();
         return send( error_response( bhttp::status::internal_server_error, e.what() ) );
      }

      bhttp::response< bhttp::string_body > res {
         std::piecewise_construct,
         std::make_tuple( std::move( handled.body ) ),
         std::make_tuple( bhttp::status::ok, req.version() )
      };

      res.result( handled.status >= 100 && handled.status <= 599 ? handled.status : 500 );
      cors( res );
      for ( const auto& [ name, value ] : handled.headers )
         res.set( name, value );
      res.prepare_payload();
      return send( std::move( res ) );
   }
};

} // tana::net::transport::http

#include <tana/edge/contract_handler.hpp>

#include <tana/log.hpp>

#include <chrono>

namespace tana::edge {

using net::transport::http::request;
using net::transport::http::response;

namespace detail {

response json_response( unsigned status, const nlohmann::json& j )
{
   response res;
   res.status = status;
   res.headers[ "Content-Type" ] = "application/json";
   res.body = j.dump( -1, ' ', false, nlohmann::json::error_handler_t::replace );
   return res;
}

} // detail

std::pair< std::string, std::string > split_contract_path( const std::string& path )
{
   auto start = path.find_first_not_of( '/' );
   if ( start == std::string::npos )
      return {};

   auto end = path.find( '/', start );
   if ( end == std::string::npos )
      return { path.substr( start ), std::string() };

   return { path.substr( start, end - start ), path.substr( end + 1 ) };
}

contract_handler::contract_handler( std::shared_ptr< runtime::dispatcher > dispatcher ) :
   _dispatcher( dispatcher )
{}

contract_handler::~contract_handler() {}

response contract_handler::handle( const request& req )
{
   auto start = std::chrono::steady_clock::now();

   auto [ contract_id, rest ] = split_contract_path( req.path );

   if ( contract_id.empty() )
      return detail::json_response( 404, runtime::error_response( "Not found", 404 ) );

   runtime::invocation inv;
   inv.contract_id = contract_id;
   inv.method = req.method;
   inv.path = req.path;
   inv.query = req.query;
   inv.headers = req.headers;
   inv.params[ "contract_id" ] = contract_id;
   inv.params[ "path" ] = rest;
   inv.ip = req.remote_address;

   if ( req.method == "POST" )
   {
      if ( req.body.empty() )
      {
         inv.body = nlohmann::json::object();
      }
      else
      {
         try
         {
            inv.body = nlohmann::json::parse( req.body );
         }
         catch ( const nlohmann::json::parse_error& e )
         {
            LOG(info) << "method=POST contract=" << contract_id << " status=400 rejected invalid JSON body";
            return detail::json_response( 400, runtime::error_response( std::string( "Invalid JSON body: " ) + e.what(), 400 ) );
         }
      }
   }

   auto result = _dispatcher->execute( inv );

   for ( const auto& line : result.console )
   {
      if ( line.stream == runtime::console_stream::err )
         LOG(warning) << "[" << contract_id << "] " << line.text;
      else
         LOG(info) << "[" << contract_id << "] " << line.text;
   }

   auto duration = std::chrono::duration_cast< std::chrono::milliseconds >( std::chrono::steady_clock::now() - start );

   LOG(info) << "method=" << req.method
             << " contract=" << contract_id
             << " status=" << result.status
             << " duration=" << duration.count() << "ms";

   return detail::json_response( result.status, result.response );
}

} // tana::edge

#include <tana/net/egress_gateway.hpp>

#include <tana/log.hpp>

#include <boost/algorithm/string.hpp>

namespace tana::net {

const std::vector< std::string >& default_allowed_domains()
{
   static const std::vector< std::string > domains {
      "pokeapi.co",
      "tana.dev",
      "api.tana.dev",
      "blockchain.tana.dev",
      "localhost",
      "127.0.0.1"
   };

   return domains;
}

egress_gateway::egress_gateway(
   std::shared_ptr< transport::http::abstract_http_client > client,
   std::vector< std::string > allowed_domains ) :
   _client( std::move( client ) ),
   _allowed_domains( std::move( allowed_domains ) )
{
   for ( auto& d : _allowed_domains )
      boost::algorithm::to_lower( d );
}

egress_gateway::~egress_gateway() = default;

bool egress_gateway::is_allowed( const std::string& hostname ) const
{
   auto host = boost::algorithm::to_lower_copy( hostname );

   for ( const auto& domain : _allowed_domains )
   {
      if ( host == domain || boost::algorithm::ends_with( host, "." + domain ) )
         return true;
   }

   return false;
}

transport::http::http_result egress_gateway::fetch( const std::string& str ) const
{
   auto u = parse_url( str );

   TANA_ASSERT( u.host && !u.host->empty(), invalid_hostname, "Invalid hostname" );

   TANA_ASSERT(
      is_allowed( *u.host ),
      domain_not_allowed,
      "fetch blocked: domain \"${host}\" not in whitelist. Allowed domains: ${domains}",
      ("host", *u.host)("domains", boost::algorithm::join( _allowed_domains, ", " ))
   );

   LOG(debug) << "Egress fetch to " << *u.host;

   return _client->get( u );
}

const std::vector< std::string >& egress_gateway::allowed_domains() const
{
   return _allowed_domains;
}

} // tana::net

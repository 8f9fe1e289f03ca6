#include <tana/net/url.hpp>

#include <boost/algorithm/string.hpp>

#include <cctype>

namespace tana::net {

namespace {

uint16_t default_port( const std::string& scheme )
{
   if ( scheme == "https" || scheme == "wss" )
      return 443;
   if ( scheme == "ftp" )
      return 21;
   return 80;
}

bool valid_scheme( const std::string& scheme )
{
   if ( scheme.empty() || !std::isalpha( static_cast< unsigned char >( scheme.front() ) ) )
      return false;

   for ( char c : scheme )
   {
      if ( !std::isalnum( static_cast< unsigned char >( c ) ) && c != '+' && c != '-' && c != '.' )
         return false;
   }

   return true;
}

bool valid_host_char( char c )
{
   return std::isalnum( static_cast< unsigned char >( c ) ) || c == '-' || c == '.' || c == '_' || c == '~' || c == '%';
}

} // anonymous

bool url::is_secure() const
{
   return scheme == "https";
}

std::string url::authority() const
{
   std::string a = host.value_or( "" );
   if ( a.find( ':' ) != std::string::npos )
      a = "[" + a + "]";

   if ( port != default_port( scheme ) )
      a += ":" + std::to_string( port );

   return a;
}

url parse_url( const std::string& str )
{
   auto input = boost::algorithm::trim_copy( str );

   auto colon = input.find( ':' );
   TANA_ASSERT( colon != std::string::npos, invalid_url, "Invalid URL: relative URL without a base" );

   url result;
   result.scheme = boost::algorithm::to_lower_copy( input.substr( 0, colon ) );
   TANA_ASSERT( valid_scheme( result.scheme ), invalid_url, "Invalid URL: relative URL without a base" );
   result.port = default_port( result.scheme );

   auto rest = input.substr( colon + 1 );
   if ( rest.rfind( "//", 0 ) != 0 )
   {
      result.target = rest;
      return result;
   }

   rest = rest.substr( 2 );
   auto authority_end = rest.find_first_of( "/?#" );
   auto authority = rest.substr( 0, authority_end );
   std::string remainder = authority_end == std::string::npos ? "" : rest.substr( authority_end );

   if ( auto at = authority.rfind( '@' ); at != std::string::npos )
      authority = authority.substr( at + 1 );

   std::string host;
   std::string port;

   if ( !authority.empty() && authority.front() == '[' )
   {
      auto close = authority.find( ']' );
      TANA_ASSERT( close != std::string::npos, invalid_url, "Invalid URL: invalid IPv6 address" );
      host = authority.substr( 1, close - 1 );
      auto after = authority.substr( close + 1 );
      if ( !after.empty() )
      {
         TANA_ASSERT( after.front() == ':', invalid_url, "Invalid URL: invalid IPv6 address" );
         port = after.substr( 1 );
      }

      for ( char c : host )
         TANA_ASSERT( std::isxdigit( static_cast< unsigned char >( c ) ) || c == ':' || c == '.', invalid_url, "Invalid URL: invalid IPv6 address" );
   }
   else
   {
      auto port_sep = authority.rfind( ':' );
      host = authority.substr( 0, port_sep );
      if ( port_sep != std::string::npos )
         port = authority.substr( port_sep + 1 );

      for ( char c : host )
         TANA_ASSERT( valid_host_char( c ), invalid_url, "Invalid URL: invalid domain character" );
   }

   TANA_ASSERT( !host.empty(), invalid_url, "Invalid URL: empty host" );

   if ( !port.empty() )
   {
      TANA_ASSERT( port.size() <= 5, invalid_url, "Invalid URL: invalid port number" );
      for ( char c : port )
         TANA_ASSERT( std::isdigit( static_cast< unsigned char >( c ) ), invalid_url, "Invalid URL: invalid port number" );

      auto p = std::stoul( port );
      TANA_ASSERT( p <= 65535, invalid_url, "Invalid URL: invalid port number" );
      result.port = static_cast< uint16_t >( p );
   }

   result.host = boost::algorithm::to_lower_copy( host );

   if ( auto hash = remainder.find( '#' ); hash != std::string::npos )
      remainder = remainder.substr( 0, hash );

   if ( remainder.empty() || remainder.front() != '/' )
      remainder = "/" + remainder;

   result.target = remainder;

   return result;
}

} // tana::net

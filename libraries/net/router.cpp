#include <tana/net/transport/http/router.hpp>

#include <cctype>

namespace tana::net::transport::http {

namespace {

int hex_value( char c )
{
   if ( c >= '0' && c <= '9' ) return c - '0';
   if ( c >= 'a' && c <= 'f' ) return c - 'a' + 10;
   if ( c >= 'A' && c <= 'F' ) return c - 'A' + 10;
   return -1;
}

} // anonymous

std::string percent_decode( std::string_view s, bool plus_as_space )
{
   std::string result;
   result.reserve( s.size() );

   for ( std::size_t i = 0; i < s.size(); i++ )
   {
      if ( s[i] == '%' && i + 2 < s.size() )
      {
         int hi = hex_value( s[i+1] );
         int lo = hex_value( s[i+2] );
         if ( hi >= 0 && lo >= 0 )
         {
            result += char( hi * 16 + lo );
            i += 2;
            continue;
         }
      }

      if ( plus_as_space && s[i] == '+' )
         result += ' ';
      else
         result += s[i];
   }

   return result;
}

void split_target( std::string_view target, std::string& path, std::map< std::string, std::string >& query )
{
   auto q = target.find( '?' );
   path = percent_decode( target.substr( 0, q ), false );
   if ( path.empty() )
      path = "/";

   if ( q == std::string_view::npos )
      return;

   auto rest = target.substr( q + 1 );
   while ( !rest.empty() )
   {
      auto amp = rest.find( '&' );
      auto pair = rest.substr( 0, amp );

      if ( !pair.empty() )
      {
         auto eq = pair.find( '=' );
         if ( eq == std::string_view::npos )
            query[ percent_decode( pair, true ) ] = "";
         else
            query[ percent_decode( pair.substr( 0, eq ), true ) ] = percent_decode( pair.substr( eq + 1 ), true );
      }

      if ( amp == std::string_view::npos )
         break;
      rest = rest.substr( amp + 1 );
   }
}

} // tana::net::transport::http

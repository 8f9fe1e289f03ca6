#include <tana/exception.hpp>

namespace tana { namespace detail {

namespace {

// Strings are substituted without their json quotes.
std::string render( const nlohmann::json& value )
{
   if ( value.is_string() )
      return value.get< std::string >();
   return value.dump();
}

} // anonymous

std::string json_strpolate( const std::string& format_str, const nlohmann::json& j )
{
   std::string result;
   result.reserve( format_str.size() );

   std::size_t pos = 0;
   while ( pos < format_str.size() )
   {
      auto open = format_str.find( "${", pos );
      if ( open == std::string::npos )
         break;

      result.append( format_str, pos, open - pos );

      // "${$" escapes a literal "${"
      if ( open + 2 < format_str.size() && format_str[ open + 2 ] == '$' )
      {
         result.append( format_str, open, 3 );
         pos = open + 3;
         continue;
      }

      auto close = format_str.find( '}', open + 2 );
      if ( close == std::string::npos )
      {
         result.append( format_str, open, 2 );
         pos = open + 2;
         continue;
      }

      auto it = j.find( format_str.substr( open + 2, close - open - 2 ) );
      if ( it != j.end() )
      {
         result += render( *it );
         pos = close + 1;
      }
      else
      {
         result.append( format_str, open, 2 );
         pos = open + 2;
      }
   }

   if ( pos < format_str.size() )
      result.append( format_str, pos, std::string::npos );

   return result;
}

json_initializer::json_initializer( exception& e ) :
   _e( e ),
   _j( *boost::get_error_info< json_info >( e ) )
{}

json_initializer& json_initializer::operator()( const std::string& key, const char* c )
{
   _j[ key ] = c;
   _e.do_message_substitution();
   return *this;
}

json_initializer& json_initializer::operator()()
{
   return *this;
}

} // detail

exception::exception() { *this << detail::json_info( nlohmann::json::object() ); }

exception::exception( const std::string& m ) : exception() { msg = m; }

exception::exception( std::string&& m ) : exception() { msg = std::move( m ); }

exception::~exception() {}

const char* exception::what() const noexcept
{
   return msg.c_str();
}

const nlohmann::json& exception::get_json() const
{
   return *boost::get_error_info< detail::json_info >( *this );
}

const std::string& exception::get_message() const
{
   return msg;
}

void exception::do_message_substitution()
{
   msg = detail::json_strpolate( msg, get_json() );
}

} // tana

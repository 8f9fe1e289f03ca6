#include <tana/runtime/import_rewriter.hpp>

#include <regex>

namespace tana::runtime {

namespace detail {

const std::regex& import_pattern()
{
   static const std::regex re( R"(^\s*import\s+\{([^}]+)\}\s+from\s+["'](tana[:/][^"']+)["'];?\s*$)" );
   return re;
}

const std::regex& export_pattern()
{
   static const std::regex re( R"(^(\s*)export\s+)" );
   return re;
}

const std::regex& alias_pattern()
{
   static const std::regex re( R"(\s+as\s+)" );
   return re;
}

std::string trim( const std::string& s )
{
   auto first = s.find_first_not_of( " \t\r\n" );
   if ( first == std::string::npos )
      return std::string();

   auto last = s.find_last_not_of( " \t\r\n" );
   return s.substr( first, last - first + 1 );
}

std::string rewrite_line( const std::string& line )
{
   std::smatch m;

   if ( std::regex_match( line, m, import_pattern() ) )
   {
      auto names = std::regex_replace( trim( m[1].str() ), alias_pattern(), ": " );
      return "const {" + names + "} = __tanaImport('" + m[2].str() + "');";
   }

   return std::regex_replace( line, export_pattern(), "$1", std::regex_constants::format_first_only );
}

} // detail

std::string rewrite_imports( const std::string& source )
{
   std::string result;
   result.reserve( source.size() );

   std::size_t start = 0;
   while ( start <= source.size() )
   {
      auto end = source.find( '\n', start );
      bool last = end == std::string::npos;
      if ( last )
         end = source.size();

      auto line = source.substr( start, end - start );

      // Keep CRLF endings intact around the rewritten text
      bool cr = !line.empty() && line.back() == '\r';
      if ( cr )
         line.pop_back();

      result += detail::rewrite_line( line );
      if ( cr )
         result += '\r';

      if ( last )
         break;

      result += '\n';
      start = end + 1;
   }

   return result;
}

} // tana::runtime

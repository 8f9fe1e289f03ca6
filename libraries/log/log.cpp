#include <tana/log.hpp>

#include <algorithm>
#include <iostream>
#include <string>

#include <boost/algorithm/string.hpp>
#include <boost/log/sinks/basic_sink_backend.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

namespace tana {

namespace {

constexpr const char* green  = "\033[32m";
constexpr const char* yellow = "\033[33m";
constexpr const char* red    = "\033[31m";
constexpr const char* reset  = "\033[0m";

struct severity_style
{
   const char* name;
   const char* color;
};

severity_style style_of( int level )
{
   switch ( level )
   {
      case boost::log::trivial::trace:   return { "trace", green };
      case boost::log::trivial::debug:   return { "debug", green };
      case boost::log::trivial::info:    return { "info", green };
      case boost::log::trivial::warning: return { "warning", yellow };
      case boost::log::trivial::error:   return { "error", red };
      case boost::log::trivial::fatal:   return { "fatal", red };
      default:                           return { "unknown", red };
   }
}

boost::log::trivial::severity_level parse_severity( const std::string& filter_level )
{
   auto level = boost::algorithm::to_lower_copy( filter_level );

   if ( level == "trace" )
      return boost::log::trivial::trace;
   if ( level == "debug" )
      return boost::log::trivial::debug;
   if ( level == "warning" || level == "warn" )
      return boost::log::trivial::warning;
   if ( level == "error" )
      return boost::log::trivial::error;
   if ( level == "fatal" )
      return boost::log::trivial::fatal;

   return boost::log::trivial::info;
}

} // anonymous

/**
 * Writes "<time> [file:line] <level>: message" lines to stdout, with the level
 * optionally wrapped in ANSI color.
 */
template< bool Color >
class console_sink_impl : public boost::log::sinks::basic_formatted_sink_backend< char, boost::log::sinks::synchronized_feeding >
{
public:
   static void consume( const boost::log::record_view& rec, const string_type& formatted_string )
   {
      auto level = rec[ boost::log::trivial::severity ];
      auto line  = rec.attribute_values()[ "Line" ].extract< int >();
      auto file  = rec.attribute_values()[ "File" ].extract< std::string >();
      auto ptime = rec.attribute_values()[ "TimeStamp" ].extract< boost::posix_time::ptime >();

      std::string out;

      if ( ptime )
      {
         auto stamp = boost::posix_time::to_iso_extended_string( ptime.get() );
         std::replace( stamp.begin(), stamp.end(), 'T', ' ' );
         out += stamp + " ";
      }

      if ( file && line )
         out += "[" + file.get() + ":" + std::to_string( line.get() ) + "] ";

      auto style = style_of( level ? int( level.get() ) : -1 );

      out += "<";
      if constexpr ( Color )
         out += std::string( style.color ) + style.name + reset;
      else
         out += style.name;
      out += ">: " + formatted_string;

      std::cout << out << std::endl;
   }
};

void initialize_logging(
   const std::string& application_name,
   const std::string& filter_level,
   const std::optional< std::filesystem::path >& log_directory,
   bool color )
{
   namespace logging = boost::log;
   auto core = logging::core::get();

   if ( color )
      core->add_sink( boost::make_shared< logging::sinks::synchronous_sink< console_sink_impl< true > > >() );
   else
      core->add_sink( boost::make_shared< logging::sinks::synchronous_sink< console_sink_impl< false > > >() );

   if ( log_directory )
   {
      std::filesystem::create_directories( *log_directory );

      logging::register_simple_formatter_factory< logging::trivial::severity_level, char >( "Severity" );

      // 1 MiB per file, 20 MiB in total, a new file every midnight
      logging::add_file_log(
         logging::keywords::file_name = ( *log_directory / ( application_name + "_%3N.log" ) ).string(),
         logging::keywords::rotation_size = 1 << 20,
         logging::keywords::max_size = 20 << 20,
         logging::keywords::time_based_rotation = logging::sinks::file::rotation_at_time_point( 0, 0, 0 ),
         logging::keywords::format = "%TimeStamp% [%File%:%Line%] <%Severity%>: %Message%",
         logging::keywords::auto_flush = true
      );
   }

   logging::add_common_attributes();
   core->set_filter( logging::trivial::severity >= parse_severity( filter_level ) );
}

} // tana

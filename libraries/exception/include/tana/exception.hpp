#pragma once

#include <boost/exception/all.hpp>

#include <nlohmann/json.hpp>

#include <tana/log.hpp>

#include <string>
#include <type_traits>

#define _DETAIL_TANA_INIT_VA_ARGS( ... ) init __VA_ARGS__

#define TANA_THROW( exception, msg, ... )                                          \
do {                                                                               \
   exception e( msg );                                                             \
   tana::detail::json_initializer init( e );                                       \
   _DETAIL_TANA_INIT_VA_ARGS( __VA_ARGS__ );                                       \
   BOOST_THROW_EXCEPTION( e );                                                     \
} while( 0 )

#define TANA_ASSERT( cond, exc_name, msg, ... )    \
   do {                                            \
      if( !(cond) )                                \
      {                                            \
         TANA_THROW( exc_name, msg, __VA_ARGS__ ); \
      }                                            \
   } while ( 0 )

#define TANA_CAPTURE_CATCH_AND_RETHROW( ... ) \
catch( tana::exception& e )                   \
{                                             \
   tana::detail::json_initializer init( e );  \
   _DETAIL_TANA_INIT_VA_ARGS( __VA_ARGS__ );  \
   throw;                                     \
}

#define TANA_CATCH_LOG_AND_RETHROW( log_level )             \
catch( tana::exception& e )                                 \
{                                                           \
   LOG( log_level ) << boost::diagnostic_information( e );  \
   throw;                                                   \
}

#define TANA_DECLARE_EXCEPTION( exc_name )                         \
   struct exc_name : public tana::exception                        \
   {                                                               \
      exc_name() {}                                                \
      exc_name( const std::string& m ) : tana::exception( m ) {}   \
      exc_name( std::string&& m ) : tana::exception( m ) {}        \
                                                                   \
      virtual ~exc_name() {};                                      \
   };

#define TANA_DECLARE_DERIVED_EXCEPTION( exc_name, base )    \
   struct exc_name : public base                            \
   {                                                        \
      exc_name() {}                                         \
      exc_name( const std::string& m ) : base( m ) {}       \
      exc_name( std::string&& m ) : base( m ) {}            \
                                                            \
      virtual ~exc_name() {};                               \
   };

namespace tana {

// Forward declaration
namespace detail { struct json_initializer; }

struct exception : virtual boost::exception, virtual std::exception
{
   private:
      std::string msg;

   public:
      exception();
      exception( const std::string& m );
      exception( std::string&& m );

      virtual ~exception();

      virtual const char* what() const noexcept override;

      const nlohmann::json& get_json() const;
      const std::string& get_message() const;

   private:
      friend struct detail::json_initializer;

      void do_message_substitution();
};

/*
 * Roots of the error taxonomy. Every library derives its exceptions from one
 * of these so callers can decide how a failure is reported without knowing
 * which library raised it.
 */
TANA_DECLARE_EXCEPTION( validation_exception );
TANA_DECLARE_EXCEPTION( limit_exception );
TANA_DECLARE_EXCEPTION( transport_exception );
TANA_DECLARE_EXCEPTION( setup_exception );

namespace detail {

using json_info = boost::error_info< struct json_tag, nlohmann::json >;

std::string json_strpolate( const std::string& format_str, const nlohmann::json& j );

/**
 * Initializes a json object using a bubble list of key value pairs.
 */
struct json_initializer
{
   exception& _e;
   nlohmann::json& _j;

   json_initializer() = delete;
   json_initializer( exception& e );

   json_initializer& operator()( const std::string& key, const char* c );
   json_initializer& operator()();

   template< typename T >
   json_initializer& operator()( const std::string& key, const T& t )
   {
      _j[ key ] = t;
      _e.do_message_substitution();
      return *this;
   }
};

} } // tana::detail

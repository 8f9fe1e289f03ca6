#pragma once

#include <boost/preprocessor.hpp>

#include <tana/runtime/exceptions.hpp>

#include <tana/runtime/capability_ids.pb.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

// This file exposes three public macros for consumption
// 1. CAPABILITY_DECLARE
// 2. CAPABILITY_REGISTER
// 3. CAPABILITY_REGISTER_ASYNC

#define _CAPABILITY_VA_ARGS(...) , ##__VA_ARGS__

#define CAPABILITY_DECLARE( return_type, name, ... ) \
   namespace capability { return_type BOOST_PP_CAT(_, name)( execution_context& _CAPABILITY_VA_ARGS(__VA_ARGS__) ); }

#define _CAPABILITY_REGISTRATION( r, data, i, elem )                                   \
data.register_capability( runtime::elem, BOOST_PP_STRINGIZE( elem ),                  \
   vm_manager::call_convention::sync, capability::BOOST_PP_CAT(_, elem) );

#define _CAPABILITY_REGISTRATION_ASYNC( r, data, i, elem )                             \
data.register_capability( runtime::elem, BOOST_PP_STRINGIZE( elem ),                  \
   vm_manager::call_convention::async, capability::BOOST_PP_CAT(_, elem) );

#define CAPABILITY_REGISTER( dispatcher, args ) \
   BOOST_PP_SEQ_FOR_EACH_I( _CAPABILITY_REGISTRATION, dispatcher, args )

#define CAPABILITY_REGISTER_ASYNC( dispatcher, args ) \
   BOOST_PP_SEQ_FOR_EACH_I( _CAPABILITY_REGISTRATION_ASYNC, dispatcher, args )

namespace tana::runtime {

class execution_context;

namespace detail {

template< typename T >
using argument_type = std::remove_cv_t< std::remove_reference_t< T > >;

inline const nlohmann::json& argument_at( const nlohmann::json& args, std::size_t index )
{
   static const nlohmann::json missing;

   if ( index < args.size() )
      return args[ index ];

   return missing;
}

template< typename T >
struct argument_traits;

template<>
struct argument_traits< std::string >
{
   static std::string decode( const nlohmann::json& j, std::size_t index )
   {
      TANA_ASSERT( j.is_string(), argument_type_exception, "Argument ${index} must be a string", ("index", index + 1) );
      return j.get< std::string >();
   }
};

template<>
struct argument_traits< double >
{
   static double decode( const nlohmann::json& j, std::size_t index )
   {
      TANA_ASSERT( j.is_number(), argument_type_exception, "Argument ${index} must be a number", ("index", index + 1) );
      return j.get< double >();
   }
};

template<>
struct argument_traits< bool >
{
   static bool decode( const nlohmann::json& j, std::size_t index )
   {
      TANA_ASSERT( j.is_boolean(), argument_type_exception, "Argument ${index} must be a boolean", ("index", index + 1) );
      return j.get< bool >();
   }
};

template<>
struct argument_traits< std::optional< std::string > >
{
   static std::optional< std::string > decode( const nlohmann::json& j, std::size_t index )
   {
      if ( j.is_null() )
         return {};

      return argument_traits< std::string >::decode( j, index );
   }
};

template<>
struct argument_traits< nlohmann::json >
{
   static nlohmann::json decode( const nlohmann::json& j, std::size_t )
   {
      return j;
   }
};

/*
 * Decodes the JSON argument array against the native signature and calls the
 * capability. Arguments are decoded left to right so the first bad argument is
 * the one reported.
 */
template< typename Ret, typename... Args, std::size_t... I >
std::optional< nlohmann::json > call_capability_impl(
   Ret (*fn)( execution_context&, Args... ),
   execution_context& ctx,
   const nlohmann::json& args,
   std::index_sequence< I... > )
{
   TANA_ASSERT( args.is_array(), argument_type_exception, "Arguments must be an array" );

   std::tuple< argument_type< Args >... > decoded{ argument_traits< argument_type< Args > >::decode( argument_at( args, I ), I )... };

   if constexpr ( std::is_void_v< Ret > )
   {
      fn( ctx, std::get< I >( decoded )... );
      return {};
   }
   else
   {
      return nlohmann::json( fn( ctx, std::get< I >( decoded )... ) );
   }
}

} // detail

} // tana::runtime

#pragma once

#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>

#include <string>
#include <vector>

namespace tana::util {

/**
 * Resolves an option by precedence: command line, then the service section of
 * the config file, then its global section, then the default.
 */
template< typename T >
T get_option(
   const std::string& key,
   const T& default_value,
   const boost::program_options::variables_map& cli_args,
   const YAML::Node& service_config = YAML::Node(),
   const YAML::Node& global_config = YAML::Node() )
{
   if ( cli_args.count( key ) )
      return cli_args[ key ].as< T >();

   if ( service_config && service_config[ key ] )
      return service_config[ key ].as< T >();

   if ( global_config && global_config[ key ] )
      return global_config[ key ].as< T >();

   return default_value;
}

/**
 * Resolves a list option. A scalar config entry is read as a one element list.
 */
template< typename T >
std::vector< T > get_options(
   const std::string& key,
   const std::vector< T >& default_value,
   const boost::program_options::variables_map& cli_args,
   const YAML::Node& service_config = YAML::Node(),
   const YAML::Node& global_config = YAML::Node() )
{
   if ( cli_args.count( key ) )
      return cli_args[ key ].as< std::vector< T > >();

   for ( const auto& node : { service_config, global_config } )
   {
      if ( !node || !node[ key ] )
         continue;

      if ( node[ key ].IsSequence() )
         return node[ key ].template as< std::vector< T > >();

      return std::vector< T >{ node[ key ].template as< T >() };
   }

   return default_value;
}

} // tana::util

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <boost/program_options.hpp>
#include <yaml-cpp/yaml.h>

namespace whale::util {

/**
 * Resolves an option, preferring the command line, then the service section of
 * the config file, then the global section, then the default.
 */
template< typename T >
T get_option(
   const std::string& key,
   T default_value,
   const boost::program_options::variables_map& cli_args,
   const YAML::Node& service_config = YAML::Node(),
   const YAML::Node& global_config = YAML::Node() )
{
   if ( cli_args.count( key ) )
      return cli_args[ key ].template as< T >();

   if ( service_config && service_config[ key ] )
      return service_config[ key ].template as< T >();

   if ( global_config && global_config[ key ] )
      return global_config[ key ].template as< T >();

   return default_value;
}

template< typename T >
std::vector< T > get_options(
   const std::string& key,
   const boost::program_options::variables_map& cli_args,
   const YAML::Node& service_config = YAML::Node(),
   const YAML::Node& global_config = YAML::Node() )
{
   if ( cli_args.count( key ) )
      return cli_args[ key ].template as< std::vector< T > >();

   for ( const auto& config : { service_config, global_config } )
   {
      if ( config && config[ key ] )
      {
         const auto node = config[ key ];

         if ( node.IsSequence() )
            return node.template as< std::vector< T > >();

         return { node.template as< T >() };
      }
   }

   return {};
}

std::filesystem::path get_default_base_directory();

} // whale::util

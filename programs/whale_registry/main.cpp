#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>

#include <whale/exception.hpp>
#include <whale/log.hpp>
#include <whale/registry/exceptions.hpp>
#include <whale/service/exceptions.hpp>
#include <whale/service/registry_service.hpp>

#include <whale/util/options.hpp>
#include <whale/util/random.hpp>
#include <whale/util/services.hpp>

#define WHALE_MAJOR_VERSION "0"
#define WHALE_MINOR_VERSION "1"
#define WHALE_PATCH_VERSION "0"

#define HELP_OPTION                 "help"
#define VERSION_OPTION              "version"
#define BASEDIR_OPTION              "basedir"
#define LOG_LEVEL_OPTION            "log-level"
#define LOG_LEVEL_DEFAULT           "info"
#define LOG_DIR_OPTION              "log-dir"
#define LOG_DIR_DEFAULT             ""
#define LOG_COLOR_OPTION            "log-color"
#define LOG_COLOR_DEFAULT           true
#define LOG_DATETIME_OPTION         "log-datetime"
#define LOG_DATETIME_DEFAULT        true
#define INSTANCE_ID_OPTION          "instance-id"
#define STATEDIR_OPTION             "statedir"
#define STATEDIR_DEFAULT            "state"
#define RESET_OPTION                "reset"
#define MINTER_OPTION               "minter"
#define AUTHORIZED_MINTERS_OPTION   "authorized-minters"
#define OPEN_MINT_OPTION            "open-mint"
#define OPEN_MINT_DEFAULT           false
#define MINT_OPTION                 "mint"
#define TRANSFER_FEED_OPTION        "transfer-feed"
#define FEED_FROM_START_OPTION      "feed-from-start"
#define FEED_FROM_START_DEFAULT     false
#define TOKEN_CONTRACT_OPTION       "token-contract"
#define POLL_LIMIT_OPTION           "poll-limit"
#define POLL_LIMIT_DEFAULT          uint64_t( 3 )
#define POLL_INTERVAL_OPTION        "poll-interval"
#define POLL_INTERVAL_DEFAULT       uint64_t( 10'000 )
#define WHALE_THRESHOLD_OPTION      "whale-threshold"
#define WHALE_THRESHOLD_DEFAULT     "1000000"

using namespace boost;
using namespace whale;

const std::string& version_string();

int main( int argc, char** argv )
{
   int retcode = EXIT_SUCCESS;

   try
   {
      program_options::options_description options;

      // clang-format off
      options.add_options()
         ( HELP_OPTION ",h"            , "Print this help message and exit" )
         ( VERSION_OPTION ",v"         , "Print version string and exit" )
         ( BASEDIR_OPTION ",d"         , program_options::value< std::string >()->default_value( util::get_default_base_directory().string() ), "Whale base directory" )
         ( LOG_LEVEL_OPTION ",l"       , program_options::value< std::string >(), "The log filtering level" )
         ( LOG_DIR_OPTION              , program_options::value< std::string >(), "The logging directory (absolute path or relative to basedir/whale_registry)" )
         ( LOG_COLOR_OPTION            , program_options::value< bool >()       , "Log color toggle" )
         ( LOG_DATETIME_OPTION         , program_options::value< bool >()       , "Log datetime on console toggle" )
         ( INSTANCE_ID_OPTION ",i"     , program_options::value< std::string >(), "An ID that uniquely identifies the instance" )
         ( STATEDIR_OPTION             , program_options::value< std::string >(), "The location of the registry snapshot (absolute path or relative to basedir/whale_registry)" )
         ( RESET_OPTION                , program_options::value< bool >()       , "Discard the registry snapshot" )
         ( MINTER_OPTION ",m"          , program_options::value< std::string >(), "The account this service mints as" )
         ( AUTHORIZED_MINTERS_OPTION   , program_options::value< std::vector< std::string > >()->multitoken(), "Accounts permitted to mint (default: the minter)" )
         ( OPEN_MINT_OPTION            , program_options::value< bool >()       , "Permit any account to mint" )
         ( MINT_OPTION                 , program_options::value< std::vector< std::string > >()->composing(), "Mint a whale to the given account" )
         ( TRANSFER_FEED_OPTION ",t"   , program_options::value< std::string >(), "Newline delimited JSON transfer feed to watch" )
         ( FEED_FROM_START_OPTION      , program_options::value< bool >()       , "Read the transfer feed from its beginning instead of its end" )
         ( TOKEN_CONTRACT_OPTION       , program_options::value< std::string >(), "Only consider transfers of this token" )
         ( POLL_LIMIT_OPTION           , program_options::value< uint64_t >()   , "Number of times to poll the transfer feed" )
         ( POLL_INTERVAL_OPTION        , program_options::value< uint64_t >()   , "Milliseconds between polls of the transfer feed" )
         ( WHALE_THRESHOLD_OPTION      , program_options::value< std::string >(), "Transfers above this value earn the sender a whale" );
      // clang-format on

      program_options::variables_map args;
      program_options::store( program_options::parse_command_line( argc, argv, options ), args );

      if ( args.count( HELP_OPTION ) )
      {
         std::cout << options << std::endl;
         return EXIT_SUCCESS;
      }

      if ( args.count( VERSION_OPTION ) )
      {
         const auto& v_str = version_string();
         std::cout.write( v_str.c_str(), v_str.size() );
         std::cout << std::endl;
         return EXIT_SUCCESS;
      }

      auto basedir = std::filesystem::path( args[ BASEDIR_OPTION ].as< std::string >() );
      if ( basedir.is_relative() )
         basedir = std::filesystem::current_path() / basedir;

      YAML::Node config;
      YAML::Node global_config;
      YAML::Node service_config;

      auto yaml_config = basedir / "config.yml";
      if ( !std::filesystem::exists( yaml_config ) )
      {
         yaml_config = basedir / "config.yaml";
      }

      if ( std::filesystem::exists( yaml_config ) )
      {
         config = YAML::LoadFile( yaml_config.string() );
         global_config = config[ "global" ];
         service_config = config[ util::service::whale_registry ];
      }

      auto log_level       = util::get_option< std::string >( LOG_LEVEL_OPTION, LOG_LEVEL_DEFAULT, args, service_config, global_config );
      auto log_dir         = util::get_option< std::string >( LOG_DIR_OPTION, LOG_DIR_DEFAULT, args, service_config, global_config );
      auto log_color       = util::get_option< bool >( LOG_COLOR_OPTION, LOG_COLOR_DEFAULT, args, service_config, global_config );
      auto log_datetime    = util::get_option< bool >( LOG_DATETIME_OPTION, LOG_DATETIME_DEFAULT, args, service_config, global_config );
      auto instance_id     = util::get_option< std::string >( INSTANCE_ID_OPTION, util::random_alphanumeric( 5 ), args, service_config, global_config );
      auto statedir        = std::filesystem::path( util::get_option< std::string >( STATEDIR_OPTION, STATEDIR_DEFAULT, args, service_config, global_config ) );
      auto reset           = util::get_option< bool >( RESET_OPTION, false, args, service_config, global_config );
      auto minter_str      = util::get_option< std::string >( MINTER_OPTION, "", args, service_config, global_config );
      auto authorized      = util::get_options< std::string >( AUTHORIZED_MINTERS_OPTION, args, service_config, global_config );
      auto open_mint       = util::get_option< bool >( OPEN_MINT_OPTION, OPEN_MINT_DEFAULT, args, service_config, global_config );
      auto mint_requests   = util::get_options< std::string >( MINT_OPTION, args, service_config, global_config );
      auto transfer_feed   = util::get_option< std::string >( TRANSFER_FEED_OPTION, "", args, service_config, global_config );
      auto feed_from_start = util::get_option< bool >( FEED_FROM_START_OPTION, FEED_FROM_START_DEFAULT, args, service_config, global_config );
      auto token_contract  = util::get_option< std::string >( TOKEN_CONTRACT_OPTION, "", args, service_config, global_config );
      auto poll_limit      = util::get_option< uint64_t >( POLL_LIMIT_OPTION, POLL_LIMIT_DEFAULT, args, service_config, global_config );
      auto poll_interval   = util::get_option< uint64_t >( POLL_INTERVAL_OPTION, POLL_INTERVAL_DEFAULT, args, service_config, global_config );
      auto threshold_str   = util::get_option< std::string >( WHALE_THRESHOLD_OPTION, WHALE_THRESHOLD_DEFAULT, args, service_config, global_config );

      std::filesystem::path log_path;
      if ( !log_dir.empty() )
      {
         log_path = log_dir;
         if ( log_path.is_relative() )
            log_path = basedir / util::service::whale_registry / log_path;

         std::filesystem::create_directories( log_path );
      }

      whale::initialize_logging( util::service::whale_registry, instance_id, log_level, log_path, log_color, log_datetime );

      LOG(info) << version_string();

      if ( config.IsNull() )
      {
         LOG(warning) << "Could not find config (config.yml or config.yaml expected). Using default values";
      }

      WHALE_ASSERT( !minter_str.empty(), service::invalid_argument, "a minter account is required" );
      WHALE_ASSERT( poll_limit > 0, service::invalid_argument, "poll-limit must be greater than 0" );

      // Every argument is parsed before the first mint
      service::service_options opts;
      opts.minter          = service::parse_address( MINTER_OPTION, minter_str );
      opts.open_mint       = open_mint;
      opts.reset           = reset;
      opts.feed_from_start = feed_from_start;

      for ( const auto& a : authorized )
         opts.authorized_minters.insert( service::parse_address( AUTHORIZED_MINTERS_OPTION, a ) );

      for ( const auto& recipient : mint_requests )
         opts.mint_requests.push_back( service::parse_address( MINT_OPTION, recipient ) );

      opts.watch.poll_limit      = poll_limit;
      opts.watch.poll_interval   = std::chrono::milliseconds( poll_interval );
      opts.watch.whale_threshold = service::parse_amount( WHALE_THRESHOLD_OPTION, threshold_str );

      if ( !token_contract.empty() )
         opts.watch.token_contract = service::parse_address( TOKEN_CONTRACT_OPTION, token_contract );

      opts.state_directory = statedir;
      if ( opts.state_directory.is_relative() )
         opts.state_directory = basedir / util::service::whale_registry / opts.state_directory;

      if ( !transfer_feed.empty() )
      {
         auto feed_path = std::filesystem::path( transfer_feed );
         if ( feed_path.is_relative() )
            feed_path = basedir / util::service::whale_registry / feed_path;

         opts.transfer_feed = feed_path;
      }

      service::registry_service svc( std::move( opts ) );

      for ( const auto& result : svc.process_mint_requests() )
      {
         if ( result.id )
            std::cout << "Minted whale " << *result.id << " to " << result.recipient << std::endl;
         else
            retcode = EXIT_FAILURE;
      }

      if ( !transfer_feed.empty() )
      {
         for ( const auto& line : svc.watch() )
            std::cout << line << std::endl;
      }

      LOG(info) << "Minted " << svc.get_registry().total_minted() << " whales in total";
   }
   catch ( const service::invalid_argument& e )
   {
      LOG(error) << "Invalid argument: " << e.what();
      retcode = EXIT_FAILURE;
   }
   catch ( const registry::identifier_collision& e )
   {
      LOG(fatal) << "Registry state is inconsistent: " << boost::diagnostic_information( e );
      retcode = EXIT_FAILURE;
   }
   catch ( const whale::exception& e )
   {
      LOG(fatal) << "An unexpected error has occurred: " << e.what();
      retcode = EXIT_FAILURE;
   }
   catch ( const boost::exception& e )
   {
      LOG(fatal) << "An unexpected error has occurred: " << boost::diagnostic_information( e );
      retcode = EXIT_FAILURE;
   }
   catch ( const std::exception& e )
   {
      LOG(fatal) << "An unexpected error has occurred: " << e.what();
      retcode = EXIT_FAILURE;
   }
   catch ( ... )
   {
      LOG(fatal) << "An unexpected error has occurred";
      retcode = EXIT_FAILURE;
   }

   LOG(info) << "Shut down gracefully";

   return retcode;
}

const std::string& version_string()
{
   static std::string v_str = "Whale registry v" WHALE_MAJOR_VERSION "." WHALE_MINOR_VERSION "." WHALE_PATCH_VERSION;
   return v_str;
}

#include <whale/common/exceptions.hpp>
#include <whale/ledger/exceptions.hpp>
#include <whale/log.hpp>
#include <whale/registry/mint_authority.hpp>
#include <whale/registry/snapshot.hpp>
#include <whale/service/exceptions.hpp>
#include <whale/service/registry_service.hpp>
#include <whale/watcher/json_file_source.hpp>

#include <boost/asio.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>

namespace whale::service {

address parse_address( const std::string& option, const std::string& value )
{
   try
   {
      return address::from_hex( value );
   }
   catch ( const malformed_address& ex )
   {
      WHALE_THROW( invalid_argument, "invalid ${o}: ${e}", ("o", option)("e", ex.what()) );
   }
}

uint256_t parse_amount( const std::string& option, const std::string& value )
{
   try
   {
      return amount_from_string( value );
   }
   catch ( const malformed_amount& ex )
   {
      WHALE_THROW( invalid_argument, "invalid ${o}: ${e}", ("o", option)("e", ex.what()) );
   }
}

registry_service::registry_service( service_options options ) :
   _options( std::move( options ) ),
   _snapshot_file( _options.state_directory / snapshot_file_name ),
   _ledger( std::make_shared< ledger::map::map_ledger >() )
{
   registry::mint_authority authority;
   if ( _options.open_mint )
   {
      LOG(warning) << "Minting is open to every account";
      authority = registry::allow_any();
   }
   else
   {
      auto minters = _options.authorized_minters;
      if ( minters.empty() )
         minters.insert( _options.minter );

      LOG(info) << "Minting is restricted to " << minters.size() << " account(s)";
      authority = registry::allow_only( std::move( minters ) );
   }

   if ( !std::filesystem::exists( _options.state_directory ) )
      std::filesystem::create_directories( _options.state_directory );

   token_id next_id = 0;

   if ( _options.reset )
   {
      LOG(info) << "Resetting registry state";
      std::filesystem::remove( _snapshot_file );
   }
   else if ( std::filesystem::exists( _snapshot_file ) )
   {
      try
      {
         next_id = registry::read_snapshot( _snapshot_file, *_ledger );
      }
      WHALE_CAPTURE_CATCH_AND_RETHROW( ("statedir", _options.state_directory.string()) )
   }

   _registry = std::make_unique< registry::token_registry >( _ledger, std::move( authority ), next_id );
   _registry->set_mint_handler( [this]( token_id, const address& ) { persist(); } );

   LOG(info) << "Next token id: " << _registry->next_token_id();
}

registry_service::~registry_service() {}

void registry_service::persist()
{
   std::lock_guard< std::mutex > lock( _snapshot_mutex );
   registry::write_snapshot( *_registry, _snapshot_file );
}

std::vector< mint_result > registry_service::process_mint_requests()
{
   std::vector< mint_result > results;
   results.reserve( _options.mint_requests.size() );

   for ( const auto& recipient : _options.mint_requests )
   {
      mint_result result{ recipient, std::nullopt };

      try
      {
         result.id = _registry->mint( _options.minter, recipient );
      }
      catch ( const ledger::invalid_recipient& e )
      {
         LOG(error) << "Could not mint whale to " << recipient << ": " << e.what();
      }

      results.push_back( std::move( result ) );
   }

   return results;
}

std::vector< std::string > registry_service::watch()
{
   WHALE_ASSERT( _options.transfer_feed, invalid_argument, "no transfer feed configured" );

   auto opts = _options.watch;
   opts.minter = _options.minter;

   boost::asio::io_context ioc;
   auto source = std::make_shared< watcher::json_file_source >( *_options.transfer_feed, _options.feed_from_start );
   watcher::transfer_watcher whale_watcher( ioc, source, *_registry, opts );

   boost::asio::signal_set signals( ioc );
   signals.add( SIGINT );
   signals.add( SIGTERM );
#if defined( SIGQUIT )
   signals.add( SIGQUIT );
#endif

   signals.async_wait( [&]( const boost::system::error_code& err, int )
   {
      if ( err )
         return;

      LOG(info) << "Caught signal, shutting down...";
      if ( whale_watcher.is_polling() )
         LOG(info) << whale_watcher.stop();
   } );

   whale_watcher.set_completion_handler( [&]() { signals.cancel(); } );

   LOG(info) << whale_watcher.start();
   ioc.run();

   return whale_watcher.logs();
}

const registry::token_registry& registry_service::get_registry() const
{
   return *_registry;
}

const std::filesystem::path& registry_service::snapshot_file() const
{
   return _snapshot_file;
}

} // whale::service

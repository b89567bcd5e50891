#include <whale/ledger/exceptions.hpp>
#include <whale/log.hpp>
#include <whale/registry/exceptions.hpp>
#include <whale/watcher/exceptions.hpp>
#include <whale/watcher/transfer_watcher.hpp>

namespace whale::watcher {

std::string abbreviate( const address& a )
{
   auto s = a.to_string();
   return "0x" + s.substr( 2, 3 ) + "..." + s.substr( s.size() - 3 );
}

std::string format_transfer( const transfer_event& event )
{
   return abbreviate( event.from ) + " -> " + abbreviate( event.to ) + ", value: " + event.value.str();
}

transfer_watcher::transfer_watcher(
   boost::asio::io_context& ioc,
   std::shared_ptr< abstract_transfer_source > source,
   registry::token_registry& registry,
   watcher_options options ) :
   _ioc( ioc ),
   _timer( ioc ),
   _source( std::move( source ) ),
   _registry( registry ),
   _options( std::move( options ) )
{
   WHALE_ASSERT( _source, invalid_watcher_options, "watcher requires a transfer source" );
   WHALE_ASSERT( _options.poll_limit > 0, invalid_watcher_options, "poll limit must be greater than 0" );
}

transfer_watcher::~transfer_watcher() {}

void transfer_watcher::set_completion_handler( std::function< void() > handler )
{
   std::lock_guard< std::mutex > lock( _mutex );
   _on_complete = std::move( handler );
}

std::string transfer_watcher::start()
{
   std::lock_guard< std::mutex > lock( _mutex );

   WHALE_ASSERT( !_polling, already_watching, "Already watching for logs." );

   _logs.clear();
   _poll_count = 0;
   _polling = true;
   auto generation = ++_generation;

   boost::asio::post( _ioc, [this, generation]() { poll( generation ); } );

   LOG(info) << "Watching for transfers above " << _options.whale_threshold << ", polling " << _options.poll_limit << " times";

   return "Watching for logs, polling " + std::to_string( _options.poll_limit ) + " times.";
}

std::string transfer_watcher::stop()
{
   std::lock_guard< std::mutex > lock( _mutex );

   WHALE_ASSERT( _polling, not_watching, "No timer to clear." );

   _polling = false;
   ++_generation;

   boost::asio::post( _ioc, [this]() { _timer.cancel(); } );

   LOG(info) << "Stopped watching after " << _poll_count << " polls";

   return "Watching for logs stopped.";
}

bool transfer_watcher::is_polling() const
{
   std::lock_guard< std::mutex > lock( _mutex );
   return _polling;
}

uint64_t transfer_watcher::poll_count() const
{
   std::lock_guard< std::mutex > lock( _mutex );
   return _poll_count;
}

std::vector< std::string > transfer_watcher::logs() const
{
   std::lock_guard< std::mutex > lock( _mutex );
   return _logs;
}

bool transfer_watcher::is_whale( const transfer_event& event ) const
{
   if ( _options.token_contract && event.token != *_options.token_contract )
      return false;

   return event.value > _options.whale_threshold;
}

void transfer_watcher::schedule_poll( uint64_t generation )
{
   _timer.expires_after( _options.poll_interval );
   _timer.async_wait( [this, generation]( const boost::system::error_code& ec )
   {
      if ( ec == boost::asio::error::operation_aborted )
         return;

      poll( generation );
   } );
}

void transfer_watcher::poll( uint64_t generation )
{
   {
      std::lock_guard< std::mutex > lock( _mutex );
      if ( !_polling || generation != _generation )
         return;
   }

   std::vector< transfer_event > events;

   try
   {
      events = _source->poll();
   }
   catch ( const whale::exception& e )
   {
      LOG(warning) << "Unable to poll transfer source: " << e.what();
   }
   catch ( const std::exception& e )
   {
      LOG(warning) << "Unable to poll transfer source: " << e.what();
   }

   for ( const auto& event : events )
   {
      if ( !is_whale( event ) )
         continue;

      auto line = format_transfer( event );
      LOG(info) << "Whale transfer " << line;

      {
         std::lock_guard< std::mutex > lock( _mutex );
         if ( generation != _generation )
            return;

         _logs.push_back( line );
      }

      try
      {
         auto id = _registry.mint( _options.minter, event.from );
         LOG(info) << "Issued whale " << id << " to " << event.from;
      }
      catch ( const ledger::invalid_recipient& e )
      {
         LOG(warning) << "Could not issue whale to " << event.from << ": " << e.what();
      }
      catch ( const registry::unauthorized_minter& e )
      {
         LOG(error) << "Could not issue whale to " << event.from << ": " << e.what();
      }
   }

   std::function< void() > on_complete;

   {
      std::lock_guard< std::mutex > lock( _mutex );
      if ( generation != _generation )
         return;

      _poll_count++;

      if ( _poll_count < _options.poll_limit )
      {
         schedule_poll( generation );
         return;
      }

      _polling = false;
      on_complete = _on_complete;
   }

   LOG(info) << "Finished watching after " << _options.poll_limit << " polls";

   if ( on_complete )
      on_complete();
}

} // whale::watcher

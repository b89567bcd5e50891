#pragma once

#include <whale/bigint.hpp>
#include <whale/common/address.hpp>
#include <whale/registry/token_registry.hpp>
#include <whale/watcher/transfer_source.hpp>

#include <boost/asio.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace whale::watcher {

struct watcher_options
{
   uint64_t                  poll_limit      = 3;
   std::chrono::milliseconds poll_interval   = std::chrono::seconds( 10 );
   uint256_t                 whale_threshold = 1'000'000;
   address                   minter;
   std::optional< address >  token_contract;
};

// "0xabc...def" from the third to fifth and the last three characters of the lowercase address
std::string abbreviate( const address& a );

// "0xabc...def -> 0x123...456, value: 1000001"
std::string format_transfer( const transfer_event& event );

/**
 * Polls a transfer source a bounded number of times and mints a whale to the
 * sender of every transfer above the whale threshold.
 *
 * All polling happens on the io_context. The watcher must outlive any
 * handlers it has posted there.
 */
class transfer_watcher final
{
   public:
      transfer_watcher(
         boost::asio::io_context& ioc,
         std::shared_ptr< abstract_transfer_source > source,
         registry::token_registry& registry,
         watcher_options options );
      ~transfer_watcher();

      std::string start();
      std::string stop();

      bool                       is_polling() const;
      uint64_t                   poll_count() const;
      std::vector< std::string > logs() const;

      // Called on the io_context once a watch has reached its poll limit
      void set_completion_handler( std::function< void() > handler );

   private:
      void poll( uint64_t generation );
      void schedule_poll( uint64_t generation );
      bool is_whale( const transfer_event& event ) const;

      boost::asio::io_context&                    _ioc;
      boost::asio::steady_timer                   _timer;
      std::shared_ptr< abstract_transfer_source > _source;
      registry::token_registry&                   _registry;
      const watcher_options                       _options;
      std::function< void() >                     _on_complete;

      mutable std::mutex         _mutex;
      bool                       _polling    = false;
      uint64_t                   _generation = 0;
      uint64_t                   _poll_count = 0;
      std::vector< std::string > _logs;
};

} // whale::watcher

#pragma once

#include <whale/bigint.hpp>
#include <whale/common/address.hpp>
#include <whale/common/types.hpp>
#include <whale/ledger/map/map_ledger.hpp>
#include <whale/registry/token_registry.hpp>
#include <whale/watcher/transfer_watcher.hpp>

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace whale::service {

/**
 * Everything the service needs, already parsed. Building one of these is the
 * only place user input can be rejected, so it happens before any mint.
 */
struct service_options
{
   std::filesystem::path                  state_directory;
   bool                                   reset = false;
   address                                minter;
   std::set< address >                    authorized_minters;
   bool                                   open_mint = false;
   std::vector< address >                 mint_requests;
   std::optional< std::filesystem::path > transfer_feed;
   bool                                   feed_from_start = false;
   watcher::watcher_options               watch;
};

struct mint_result
{
   address                   recipient;
   std::optional< token_id > id;
};

// Both throw invalid_argument naming the option
address   parse_address( const std::string& option, const std::string& value );
uint256_t parse_amount( const std::string& option, const std::string& value );

/**
 * Owns the registry for one run of the program.
 *
 * The registry is restored from <state_directory>/registry.snapshot and the
 * snapshot is rewritten after every successful mint, so a run that ends early
 * never loses an issued identifier.
 */
class registry_service final
{
   public:
      static constexpr const char* snapshot_file_name = "registry.snapshot";

      explicit registry_service( service_options options );
      ~registry_service();

      // One result per requested recipient, in order. Rejected recipients have no id.
      std::vector< mint_result > process_mint_requests();

      /**
       * Runs the transfer watcher until it reaches its poll limit or SIGINT,
       * SIGTERM or SIGQUIT arrives. Returns the whale transfer lines.
       */
      std::vector< std::string > watch();

      const registry::token_registry& get_registry() const;
      const std::filesystem::path& snapshot_file() const;

   private:
      void persist();

      service_options                              _options;
      std::filesystem::path                        _snapshot_file;
      std::shared_ptr< ledger::map::map_ledger >   _ledger;
      std::unique_ptr< registry::token_registry >  _registry;
      std::mutex                                   _snapshot_mutex;
};

} // whale::service

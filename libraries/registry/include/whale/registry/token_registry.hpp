#pragma once

#include <whale/common/address.hpp>
#include <whale/common/types.hpp>
#include <whale/ledger/ledger.hpp>
#include <whale/registry/mint_authority.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace whale::registry {

// The counter and every ledger record, read together
struct registry_state
{
   token_id                            next_token_id = 0;
   std::vector< ledger::token_record > tokens;
};

/**
 * Allocates token identifiers and hands them to an ownership ledger.
 *
 * Identifiers start at next_id and increase by one per successful mint. An
 * identifier is only consumed once the ledger has accepted it, so a rejected
 * mint leaves the counter untouched.
 */
class token_registry final
{
   public:
      /**
       * The ledger must hold exactly the identifiers below next_id, which is
       * the case for an empty ledger and next_id = 0. Throws
       * corrupt_registry_state otherwise.
       */
      token_registry( std::shared_ptr< ledger::abstract_ledger > l, mint_authority authority, token_id next_id = 0 );

      token_id mint( const address& caller, const address& target_owner );

      token_id       next_token_id() const;
      uint64_t       total_minted() const;
      address        owner_of( token_id id ) const;
      registry_state state() const;

      /**
       * Called after every successful mint, outside the registry lock. An
       * exception from the handler propagates out of mint, the token stays
       * minted.
       */
      void set_mint_handler( std::function< void( token_id, const address& ) > handler );

   private:
      std::shared_ptr< ledger::abstract_ledger >           _ledger;
      mint_authority                                       _authority;
      token_id                                             _next_id;
      std::function< void( token_id, const address& ) >    _on_mint;
      mutable std::mutex                                   _mutex;
};

} // whale::registry

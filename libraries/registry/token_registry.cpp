#include <whale/ledger/exceptions.hpp>
#include <whale/log.hpp>
#include <whale/registry/exceptions.hpp>
#include <whale/registry/token_registry.hpp>

namespace whale::registry {

token_registry::token_registry( std::shared_ptr< ledger::abstract_ledger > l, mint_authority authority, token_id next_id ) :
   _ledger( std::move( l ) ),
   _authority( std::move( authority ) ),
   _next_id( next_id )
{
   WHALE_ASSERT( _ledger, corrupt_registry_state, "registry requires an ownership ledger" );
   WHALE_ASSERT( _authority, corrupt_registry_state, "registry requires a mint authority" );

   WHALE_ASSERT(
      _ledger->size() == _next_id,
      corrupt_registry_state,
      "ledger holds ${size} tokens but the next token id is ${next}", ("size", _ledger->size())("next", _next_id)
   );

   if ( _next_id > 0 )
   {
      auto last = _ledger->tokens().back().id;
      WHALE_ASSERT(
         last < _next_id,
         corrupt_registry_state,
         "ledger holds token ${id} which is not below the next token id ${next}", ("id", last)("next", _next_id)
      );
   }
}

token_id token_registry::mint( const address& caller, const address& target_owner )
{
   WHALE_ASSERT( _authority( caller ), unauthorized_minter, "${caller} is not permitted to mint", ("caller", caller) );

   token_id id;
   std::function< void( token_id, const address& ) > on_mint;

   {
      std::lock_guard< std::mutex > lock( _mutex );

      id = _next_id;

      try
      {
         _ledger->record_new_ownership( id, target_owner );
      }
      catch ( const ledger::token_exists& )
      {
         LOG(fatal) << "Ledger already holds token " << id << ", the identifier counter is out of sync";
         WHALE_THROW( identifier_collision, "token ${id} was already recorded by the ledger", ("id", id) );
      }

      _next_id = id + 1;
      on_mint = _on_mint;
   }

   LOG(info) << "Minted token " << id << " to " << target_owner;

   if ( on_mint )
      on_mint( id, target_owner );

   return id;
}

token_id token_registry::next_token_id() const
{
   std::lock_guard< std::mutex > lock( _mutex );
   return _next_id;
}

uint64_t token_registry::total_minted() const
{
   return next_token_id();
}

address token_registry::owner_of( token_id id ) const
{
   std::lock_guard< std::mutex > lock( _mutex );
   return _ledger->owner_of( id );
}

registry_state token_registry::state() const
{
   std::lock_guard< std::mutex > lock( _mutex );
   return registry_state{ _next_id, _ledger->tokens() };
}

void token_registry::set_mint_handler( std::function< void( token_id, const address& ) > handler )
{
   std::lock_guard< std::mutex > lock( _mutex );
   _on_mint = std::move( handler );
}

} // whale::registry

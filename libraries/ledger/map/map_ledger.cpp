#include <whale/ledger/exceptions.hpp>
#include <whale/ledger/map/map_ledger.hpp>

namespace whale::ledger::map {

map_ledger::map_ledger() {}

map_ledger::~map_ledger() {}

void map_ledger::record_new_ownership( token_id id, const address& owner )
{
   WHALE_ASSERT( !owner.is_zero(), invalid_recipient, "cannot record token ${id} to the zero address", ("id", id) );
   WHALE_ASSERT( _tokens.find( id ) == _tokens.end(), token_exists, "token ${id} already exists", ("id", id) );

   _tokens.emplace( id, token_record{ id, owner, std::nullopt } );
   _balances[ owner ]++;
}

void map_ledger::transfer( const address& caller, const address& from, const address& to, token_id id )
{
   auto itr = _tokens.find( id );
   WHALE_ASSERT( itr != _tokens.end(), token_not_found, "token ${id} does not exist", ("id", id) );

   auto& record = itr->second;

   WHALE_ASSERT( !to.is_zero(), invalid_recipient, "cannot transfer token ${id} to the zero address", ("id", id) );
   WHALE_ASSERT( record.owner == from, incorrect_owner, "token ${id} is not owned by ${from}", ("id", id)("from", from) );
   WHALE_ASSERT(
      caller == record.owner || ( record.approved && *record.approved == caller ),
      transfer_unauthorized,
      "${caller} may not transfer token ${id}", ("caller", caller)("id", id)
   );

   if ( --_balances[ from ] == 0 )
      _balances.erase( from );

   _balances[ to ]++;
   record.owner = to;
   record.approved.reset();
}

void map_ledger::approve( const address& caller, const address& approved, token_id id )
{
   auto itr = _tokens.find( id );
   WHALE_ASSERT( itr != _tokens.end(), token_not_found, "token ${id} does not exist", ("id", id) );
   WHALE_ASSERT( itr->second.owner == caller, transfer_unauthorized, "${caller} does not own token ${id}", ("caller", caller)("id", id) );

   if ( approved.is_zero() )
      itr->second.approved.reset();
   else
      itr->second.approved = approved;
}

const token_record& map_ledger::get_record( token_id id ) const
{
   auto itr = _tokens.find( id );
   WHALE_ASSERT( itr != _tokens.end(), token_not_found, "token ${id} does not exist", ("id", id) );
   return itr->second;
}

address map_ledger::owner_of( token_id id ) const
{
   return get_record( id ).owner;
}

bool map_ledger::exists( token_id id ) const noexcept
{
   return _tokens.find( id ) != _tokens.end();
}

map_ledger::size_type map_ledger::balance_of( const address& owner ) const noexcept
{
   auto itr = _balances.find( owner );
   if ( itr == _balances.end() )
      return 0;

   return itr->second;
}

std::optional< address > map_ledger::get_approved( token_id id ) const
{
   return get_record( id ).approved;
}

std::vector< token_record > map_ledger::tokens() const
{
   std::vector< token_record > records;
   records.reserve( _tokens.size() );

   for ( const auto& [ id, record ] : _tokens )
      records.push_back( record );

   return records;
}

map_ledger::size_type map_ledger::size() const noexcept
{
   return _tokens.size();
}

} // whale::ledger::map

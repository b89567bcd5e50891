#include <whale/common/address.hpp>
#include <whale/log.hpp>
#include <whale/registry/exceptions.hpp>
#include <whale/registry/snapshot.hpp>

#include <whale/protocol.pb.h>

#include <fstream>

namespace whale::registry {

void write_snapshot( const token_registry& r, const std::filesystem::path& p )
{
   auto state = r.state();

   protocol::registry_snapshot snapshot;
   snapshot.set_next_token_id( state.next_token_id );

   for ( const auto& record : state.tokens )
   {
      auto* t = snapshot.add_tokens();
      t->set_id( record.id );
      t->set_owner( record.owner.to_bytes() );
      if ( record.approved )
         t->set_approved( record.approved->to_bytes() );
   }

   auto tmp = p;
   tmp += ".tmp";

   {
      std::ofstream ofs( tmp, std::ios::binary | std::ios::trunc );
      WHALE_ASSERT( ofs.is_open(), snapshot_exception, "unable to open snapshot file ${p}", ("p", tmp.string()) );
      WHALE_ASSERT( snapshot.SerializeToOstream( &ofs ), snapshot_exception, "unable to write snapshot file ${p}", ("p", tmp.string()) );
   }

   std::error_code ec;
   std::filesystem::rename( tmp, p, ec );
   WHALE_ASSERT( !ec, snapshot_exception, "unable to replace snapshot ${p}: ${e}", ("p", p.string())("e", ec.message()) );

   LOG(debug) << "Wrote snapshot of " << snapshot.tokens_size() << " tokens to " << p;
}

token_id read_snapshot( const std::filesystem::path& p, ledger::abstract_ledger& l )
{
   WHALE_ASSERT( l.empty(), snapshot_exception, "snapshot must be restored into an empty ledger" );

   std::ifstream ifs( p, std::ios::binary );
   WHALE_ASSERT( ifs.is_open(), snapshot_exception, "unable to open snapshot file ${p}", ("p", p.string()) );

   protocol::registry_snapshot snapshot;
   WHALE_ASSERT( snapshot.ParseFromIstream( &ifs ), snapshot_exception, "unable to parse snapshot file ${p}", ("p", p.string()) );

   try
   {
      for ( const auto& t : snapshot.tokens() )
      {
         auto owner = address::from_bytes( t.owner() );
         l.record_new_ownership( t.id(), owner );

         if ( !t.approved().empty() )
            l.approve( owner, address::from_bytes( t.approved() ), t.id() );
      }
   }
   catch ( const whale::exception& ex )
   {
      WHALE_THROW( snapshot_exception, "snapshot ${p} is invalid: ${e}", ("p", p.string())("e", ex.what()) );
   }

   LOG(info) << "Restored " << snapshot.tokens_size() << " tokens from " << p;

   return snapshot.next_token_id();
}

} // whale::registry

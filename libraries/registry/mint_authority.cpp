#include <whale/registry/mint_authority.hpp>

namespace whale::registry {

mint_authority allow_any()
{
   return []( const address& ) { return true; };
}

mint_authority allow_only( std::set< address > minters )
{
   return [minters = std::move( minters )]( const address& caller )
   {
      return minters.find( caller ) != minters.end();
   };
}

} // whale::registry

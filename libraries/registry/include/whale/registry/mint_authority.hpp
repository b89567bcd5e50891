#pragma once

#include <whale/common/address.hpp>

#include <functional>
#include <set>

namespace whale::registry {

// Decides whether an account may call mint
using mint_authority = std::function< bool( const address& ) >;

mint_authority allow_any();
mint_authority allow_only( std::set< address > minters );

} // whale::registry

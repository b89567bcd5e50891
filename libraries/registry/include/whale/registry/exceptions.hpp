#pragma once
#include <whale/exception.hpp>

namespace whale::registry {

WHALE_DECLARE_EXCEPTION( registry_exception );
WHALE_DECLARE_DERIVED_EXCEPTION( unauthorized_minter, registry_exception );
WHALE_DECLARE_DERIVED_EXCEPTION( identifier_collision, registry_exception );
WHALE_DECLARE_DERIVED_EXCEPTION( corrupt_registry_state, registry_exception );
WHALE_DECLARE_DERIVED_EXCEPTION( snapshot_exception, registry_exception );

} // whale::registry

#pragma once
#include <whale/exception.hpp>

namespace whale {

WHALE_DECLARE_EXCEPTION( common_exception );
WHALE_DECLARE_DERIVED_EXCEPTION( malformed_address, common_exception );
WHALE_DECLARE_DERIVED_EXCEPTION( malformed_amount, common_exception );

} // whale

#pragma once
#include <whale/exception.hpp>

namespace whale::util {

WHALE_DECLARE_EXCEPTION( util_exception );
WHALE_DECLARE_DERIVED_EXCEPTION( invalid_hex, util_exception );

} // whale::util

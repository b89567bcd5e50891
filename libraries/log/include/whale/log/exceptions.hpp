#pragma once
#include <whale/exception.hpp>

namespace whale {

WHALE_DECLARE_EXCEPTION( log_exception );
WHALE_DECLARE_DERIVED_EXCEPTION( invalid_log_level, log_exception );

} // whale

#pragma once
#include <whale/exception.hpp>

namespace whale::service {

WHALE_DECLARE_EXCEPTION( service_exception );
WHALE_DECLARE_DERIVED_EXCEPTION( invalid_argument, service_exception );

} // whale::service

#pragma once

#include <cstddef>
#include <string>

namespace whale::util {

std::string random_alphanumeric( std::size_t len );

} // whale::util

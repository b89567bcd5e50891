#pragma once

#include <boost/multiprecision/cpp_int.hpp>

namespace whale {

using boost::multiprecision::uint256_t;

} // whale

#pragma once

#include <cstdint>
#include <string>

#include <whale/bigint.hpp>

namespace whale {

using token_id = uint64_t;

/**
 * Parses a non-negative decimal amount. Throws malformed_amount.
 */
uint256_t amount_from_string( const std::string& s );

} // whale

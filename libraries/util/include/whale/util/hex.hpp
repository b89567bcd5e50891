#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace whale::util {

bool is_hex( std::string_view s );

std::string to_hex( const uint8_t* data, std::size_t size, bool prefix = true );

template< typename Container >
std::string to_hex( const Container& c, bool prefix = true )
{
   return to_hex( reinterpret_cast< const uint8_t* >( c.data() ), c.size(), prefix );
}

/**
 * Decodes a hex string, with or without a leading "0x".
 *
 * Throws invalid_hex on odd length or non-hex characters.
 */
std::vector< uint8_t > from_hex( std::string_view s );

} // whale::util

#include <whale/util/exceptions.hpp>
#include <whale/util/hex.hpp>

#include <boost/algorithm/hex.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace whale::util {

namespace {

std::string_view strip_prefix( std::string_view s )
{
   if ( s.size() >= 2 && s[0] == '0' && ( s[1] == 'x' || s[1] == 'X' ) )
      s.remove_prefix( 2 );
   return s;
}

} // anonymous

bool is_hex( std::string_view s )
{
   s = strip_prefix( s );
   return std::all_of( s.begin(), s.end(), []( unsigned char c ) { return std::isxdigit( c ); } );
}

std::string to_hex( const uint8_t* data, std::size_t size, bool prefix )
{
   std::string s = prefix ? "0x" : "";
   s.reserve( s.size() + size * 2 );
   boost::algorithm::hex_lower( data, data + size, std::back_inserter( s ) );
   return s;
}

std::vector< uint8_t > from_hex( std::string_view s )
{
   auto digits = strip_prefix( s );

   std::vector< uint8_t > bytes;
   bytes.reserve( digits.size() / 2 );

   try
   {
      boost::algorithm::unhex( digits.begin(), digits.end(), std::back_inserter( bytes ) );
   }
   catch ( const boost::algorithm::hex_decode_error& )
   {
      WHALE_THROW( invalid_hex, "'${s}' is not an even length hex string", ("s", std::string( s )) );
   }

   return bytes;
}

} // whale::util

#include <whale/common/exceptions.hpp>
#include <whale/common/types.hpp>

#include <algorithm>
#include <cctype>
#include <limits>

namespace whale {

uint256_t amount_from_string( const std::string& s )
{
   WHALE_ASSERT(
      !s.empty() && s.size() <= 78 && std::all_of( s.begin(), s.end(), []( unsigned char c ) { return std::isdigit( c ); } ),
      malformed_amount,
      "'${s}' is not a decimal amount", ("s", s)
   );

   uint256_t max = std::numeric_limits< uint256_t >::max();
   uint256_t value = 0;

   for ( auto c : s )
   {
      unsigned digit = unsigned( c - '0' );
      WHALE_ASSERT( value <= ( max - digit ) / 10, malformed_amount, "amount '${s}' does not fit in 256 bits", ("s", s) );
      value = value * 10 + digit;
   }

   return value;
}

} // whale

#include <whale/util/random.hpp>

#include <random>

namespace whale::util {

std::string random_alphanumeric( std::size_t len )
{
   static constexpr char charset[] =
      "0123456789"
      "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
      "abcdefghijklmnopqrstuvwxyz";

   std::random_device rd;
   std::mt19937 gen( rd() );
   std::uniform_int_distribution< std::size_t > dist( 0, sizeof( charset ) - 2 );

   std::string s;
   s.reserve( len );
   for ( std::size_t i = 0; i < len; i++ )
      s += charset[ dist( gen ) ];

   return s;
}

} // whale::util

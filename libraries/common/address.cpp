#include <whale/common/address.hpp>
#include <whale/common/exceptions.hpp>
#include <whale/util/hex.hpp>

#include <algorithm>

namespace whale {

address::address()
{
   _bytes.fill( 0 );
}

address::address( const bytes_type& b ) : _bytes( b ) {}

address address::from_hex( std::string_view s )
{
   WHALE_ASSERT(
      s.size() == 2 + 2 * size && s[0] == '0' && ( s[1] == 'x' || s[1] == 'X' ),
      malformed_address,
      "address '${a}' must be 0x followed by ${n} hex digits", ("a", std::string( s ))("n", 2 * size)
   );
   WHALE_ASSERT( util::is_hex( s ), malformed_address, "address '${a}' contains non-hex characters", ("a", std::string( s )) );

   auto decoded = util::from_hex( s );

   bytes_type b;
   std::copy( decoded.begin(), decoded.end(), b.begin() );
   return address( b );
}

address address::from_bytes( const std::string& b )
{
   WHALE_ASSERT( b.size() == size, malformed_address, "address must be ${n} bytes, was ${s}", ("n", size)("s", b.size()) );

   bytes_type bytes;
   std::copy( b.begin(), b.end(), bytes.begin() );
   return address( bytes );
}

const address& address::zero()
{
   static const address z;
   return z;
}

bool address::is_zero() const
{
   return std::all_of( _bytes.begin(), _bytes.end(), []( uint8_t b ) { return b == 0; } );
}

const address::bytes_type& address::bytes() const
{
   return _bytes;
}

std::string address::to_bytes() const
{
   return std::string( reinterpret_cast< const char* >( _bytes.data() ), _bytes.size() );
}

std::string address::to_string() const
{
   return util::to_hex( _bytes );
}

std::ostream& operator<<( std::ostream& os, const address& a )
{
   return os << a.to_string();
}

void to_json( nlohmann::json& j, const address& a )
{
   j = a.to_string();
}

} // whale

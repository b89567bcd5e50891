#pragma once

#include <array>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace whale {

/**
 * A 20 byte account identifier, written as "0x" followed by 40 hex digits.
 */
class address
{
   public:
      static constexpr std::size_t size = 20;
      using bytes_type = std::array< uint8_t, size >;

      address();
      explicit address( const bytes_type& b );

      static address from_hex( std::string_view s );
      static address from_bytes( const std::string& b );
      static const address& zero();

      bool is_zero() const;

      const bytes_type& bytes() const;
      std::string to_bytes() const;
      std::string to_string() const;

      friend bool operator==( const address& a, const address& b ) { return a._bytes == b._bytes; }
      friend bool operator!=( const address& a, const address& b ) { return a._bytes != b._bytes; }
      friend bool operator< ( const address& a, const address& b ) { return a._bytes <  b._bytes; }

   private:
      bytes_type _bytes;
};

std::ostream& operator<<( std::ostream& os, const address& a );

void to_json( nlohmann::json& j, const address& a );

} // whale

#include <whale/util/options.hpp>

#include <cstdlib>

namespace whale::util {

std::filesystem::path get_default_base_directory()
{
   if ( const char* home = std::getenv( "HOME" ) )
      return std::filesystem::path( home ) / ".whale";

   return std::filesystem::current_path() / ".whale";
}

} // whale::util

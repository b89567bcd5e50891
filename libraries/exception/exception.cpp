#include <whale/exception.hpp>

#include <sstream>

namespace whale { namespace detail {

namespace {

// Strings are substituted without their json quotes
std::string to_message_text( const nlohmann::json& v )
{
   return v.is_string() ? v.get< std::string >() : v.dump();
}

} // anonymous

/**
 * Replaces every ${key} in format_str whose key is present in j; unknown keys
 * stay as written. "${$" escapes a literal "${".
 */
std::string json_strpolate( const std::string& format_str, const nlohmann::json& j )
{
   std::string result;
   result.reserve( format_str.size() );

   std::size_t pos = 0;
   while ( pos < format_str.size() )
   {
      auto open = format_str.find( "${", pos );
      if ( open == std::string::npos )
         break;

      result.append( format_str, pos, open - pos );

      if ( open + 2 < format_str.size() && format_str[ open + 2 ] == '$' )
      {
         result.append( format_str, open, 3 );
         pos = open + 3;
         continue;
      }

      auto close = format_str.find( '}', open + 2 );
      if ( close == std::string::npos )
      {
         pos = open;
         break;
      }

      auto itr = j.find( format_str.substr( open + 2, close - open - 2 ) );
      if ( itr != j.end() )
         result += to_message_text( *itr );
      else
         result.append( format_str, open, close - open + 1 );

      pos = close + 1;
   }

   result.append( format_str, pos, std::string::npos );
   return result;
}

json_initializer::json_initializer( exception& e ) :
   _e(e),
   _j(*boost::get_error_info< whale::detail::json_info >(e))
{}

json_initializer& json_initializer::operator()( const std::string& key, const char* c )
{
   _j[key] = c;
   _e.do_message_substitution();
   return *this;
}

json_initializer& json_initializer::operator()( const std::string& key, std::size_t v )
{
   _j[key] = uint64_t( v );
   _e.do_message_substitution();
   return *this;
}

json_initializer& json_initializer::operator()()
{
   return *this;
}

} // detail

exception::exception() { *this << whale::detail::json_info( nlohmann::json() ); }

exception::exception( const std::string& m ) : exception() { msg = m; }

exception::exception( std::string&& m ) : exception() { msg = std::move( m ); }

exception::~exception() {}

const char* exception::what() const noexcept
{
   return msg.c_str();
}

std::string exception::get_stacktrace() const
{
   std::stringstream ss;
   if ( auto st = boost::get_error_info< whale::detail::exception_stacktrace >( *this ) )
      ss << *st;
   return ss.str();
}

const nlohmann::json& exception::get_json() const
{
   return *boost::get_error_info< whale::detail::json_info >( *this );
}

const std::string& exception::get_message() const
{
   return msg;
}

void exception::do_message_substitution()
{
   msg = detail::json_strpolate( msg, *boost::get_error_info< whale::detail::json_info >( *this ) );
}

} // whale

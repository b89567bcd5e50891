#include <whale/common/types.hpp>
#include <whale/log.hpp>
#include <whale/watcher/exceptions.hpp>
#include <whale/watcher/json_file_source.hpp>

#include <whale/protocol.pb.h>

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <fstream>
#include <iterator>

namespace whale::watcher {

json_file_source::json_file_source( const std::filesystem::path& p, bool from_start ) :
   _path( p )
{
   if ( !from_start )
      _offset = end_of_last_line();

   LOG(info) << "Reading transfers from " << _path << " at offset " << _offset;
}

std::streamoff json_file_source::end_of_last_line() const
{
   constexpr std::streamoff block_size = 4096;

   std::ifstream ifs( _path, std::ios::binary );
   if ( !ifs.is_open() )
      return 0;

   ifs.seekg( 0, std::ios::end );
   std::streamoff end = ifs.tellg();
   if ( end <= 0 )
      return 0;

   std::string block;
   while ( end > 0 )
   {
      auto start = std::max< std::streamoff >( 0, end - block_size );
      block.resize( std::size_t( end - start ) );

      ifs.seekg( start );
      ifs.read( block.data(), std::streamsize( block.size() ) );
      WHALE_ASSERT( ifs, transfer_source_exception, "unable to read transfer feed ${p}", ("p", _path.string()) );

      auto pos = block.rfind( '\n' );
      if ( pos != std::string::npos )
         return start + std::streamoff( pos ) + 1;

      end = start;
   }

   // A single unterminated line is still being written
   return 0;
}

json_file_source::~json_file_source() {}

std::vector< transfer_event > json_file_source::poll()
{
   std::error_code ec;
   auto size = std::filesystem::file_size( _path, ec );
   WHALE_ASSERT( !ec, transfer_source_exception, "unable to read transfer feed ${p}: ${e}", ("p", _path.string())("e", ec.message()) );

   if ( std::streamoff( size ) < _offset )
   {
      LOG(warning) << "Transfer feed " << _path << " was truncated, reading from the beginning";
      _offset = 0;
   }

   std::ifstream ifs( _path, std::ios::binary );
   WHALE_ASSERT( ifs.is_open(), transfer_source_exception, "unable to open transfer feed ${p}", ("p", _path.string()) );

   ifs.seekg( _offset );
   std::string data( ( std::istreambuf_iterator< char >( ifs ) ), std::istreambuf_iterator< char >() );

   std::vector< transfer_event > events;

   std::size_t start = 0;
   for ( auto end = data.find( '\n' ); end != std::string::npos; end = data.find( '\n', start ) )
   {
      auto line = data.substr( start, end - start );
      start = end + 1;

      if ( line.find_first_not_of( " \t\r" ) == std::string::npos )
         continue;

      if ( auto event = parse_line( line ) )
         events.push_back( std::move( *event ) );
   }

   _offset += std::streamoff( start );

   return events;
}

std::optional< transfer_event > json_file_source::parse_line( const std::string& line ) const
{
   protocol::transfer_event msg;
   google::protobuf::util::JsonParseOptions options;
   options.ignore_unknown_fields = true;

   auto status = google::protobuf::util::JsonStringToMessage( line, &msg, options );
   if ( !status.ok() )
   {
      LOG(warning) << "Skipping malformed transfer in " << _path << ": " << status.ToString();
      return std::nullopt;
   }

   try
   {
      transfer_event event;
      if ( !msg.token().empty() )
         event.token = address::from_hex( msg.token() );
      event.from  = address::from_hex( msg.from() );
      event.to    = address::from_hex( msg.to() );
      event.value = amount_from_string( msg.value() );
      return event;
   }
   catch ( const whale::exception& e )
   {
      LOG(warning) << "Skipping invalid transfer in " << _path << ": " << e.what();
   }

   return std::nullopt;
}

} // whale::watcher

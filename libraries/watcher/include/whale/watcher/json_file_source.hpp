#pragma once

#include <whale/watcher/transfer_source.hpp>

#include <filesystem>
#include <ios>
#include <optional>
#include <string>

namespace whale::watcher {

/**
 * Tails a file of newline delimited whale.protocol.transfer_event JSON
 * objects. Malformed lines are logged and skipped. A trailing line without a
 * newline is left for the next poll. A source that does not read from the
 * start skips every complete line already in the file.
 */
class json_file_source final : public abstract_transfer_source
{
   public:
      json_file_source( const std::filesystem::path& p, bool from_start );
      virtual ~json_file_source() override;

      virtual std::vector< transfer_event > poll() override;

   private:
      std::optional< transfer_event > parse_line( const std::string& line ) const;

      // Offset just past the final newline, 0 when there is none
      std::streamoff end_of_last_line() const;

      std::filesystem::path _path;
      std::streamoff        _offset = 0;
};

} // whale::watcher

#pragma once

#include <whale/bigint.hpp>
#include <whale/common/address.hpp>

#include <vector>

namespace whale::watcher {

struct transfer_event
{
   address   token;
   address   from;
   address   to;
   uint256_t value = 0;
};

class abstract_transfer_source
{
   public:
      virtual ~abstract_transfer_source() {};

      // Returns the transfers that arrived since the previous call
      virtual std::vector< transfer_event > poll() = 0;
};

} // whale::watcher

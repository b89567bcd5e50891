#include <whale/ledger/ledger.hpp>

namespace whale::ledger {

bool abstract_ledger::empty() const
{
   return size() == 0;
}

} // whale::ledger

#pragma once
#include <whale/exception.hpp>

namespace whale::ledger {

WHALE_DECLARE_EXCEPTION( ledger_exception );
WHALE_DECLARE_DERIVED_EXCEPTION( invalid_recipient, ledger_exception );
WHALE_DECLARE_DERIVED_EXCEPTION( token_exists, ledger_exception );
WHALE_DECLARE_DERIVED_EXCEPTION( token_not_found, ledger_exception );
WHALE_DECLARE_DERIVED_EXCEPTION( incorrect_owner, ledger_exception );
WHALE_DECLARE_DERIVED_EXCEPTION( transfer_unauthorized, ledger_exception );

} // whale::ledger

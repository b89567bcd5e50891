#pragma once
#include <whale/exception.hpp>

namespace whale::watcher {

WHALE_DECLARE_EXCEPTION( watcher_exception );
WHALE_DECLARE_DERIVED_EXCEPTION( already_watching, watcher_exception );
WHALE_DECLARE_DERIVED_EXCEPTION( not_watching, watcher_exception );
WHALE_DECLARE_DERIVED_EXCEPTION( invalid_watcher_options, watcher_exception );
WHALE_DECLARE_DERIVED_EXCEPTION( transfer_source_exception, watcher_exception );

} // whale::watcher

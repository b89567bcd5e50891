#pragma once

namespace whale::util::service {

constexpr const char* whale_registry = "whale_registry";

} // whale::util::service

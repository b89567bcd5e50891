#pragma once

#include <whale/ledger/ledger.hpp>
#include <whale/registry/token_registry.hpp>

#include <filesystem>

namespace whale::registry {

/**
 * Writes the counter and every ledger record to p as a binary
 * whale.protocol.registry_snapshot. Both are taken in one registry_state, so
 * concurrent mints never produce a torn snapshot. The file is replaced
 * atomically. Writers sharing a path must be serialised by the caller.
 */
void write_snapshot( const token_registry& r, const std::filesystem::path& p );

/**
 * Records every token stored at p into l, which must be empty, and returns
 * the stored next token id. Throws snapshot_exception.
 */
token_id read_snapshot( const std::filesystem::path& p, ledger::abstract_ledger& l );

} // whale::registry

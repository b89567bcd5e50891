#pragma once

#include <whale/common/address.hpp>
#include <whale/common/types.hpp>

#include <optional>
#include <vector>

namespace whale::ledger {

struct token_record
{
   token_id                 id = 0;
   address                  owner;
   std::optional< address > approved;
};

/**
 * Identifier to owner storage for non-fungible tokens.
 *
 * A ledger never assigns identifiers itself. It records the identifiers it is
 * handed and refuses to record the same identifier twice.
 */
class abstract_ledger
{
   public:
      using size_type = uint64_t;

      virtual ~abstract_ledger() {};

      /**
       * Records id as a new token owned by owner.
       *
       * Throws invalid_recipient for the zero address and token_exists when
       * id has already been recorded.
       */
      virtual void record_new_ownership( token_id id, const address& owner ) = 0;

      /**
       * Throws token_not_found when id was never recorded.
       */
      virtual address owner_of( token_id id ) const = 0;
      virtual bool exists( token_id id ) const = 0;
      virtual size_type balance_of( const address& owner ) const = 0;

      virtual void transfer( const address& caller, const address& from, const address& to, token_id id ) = 0;
      virtual void approve( const address& caller, const address& approved, token_id id ) = 0;
      virtual std::optional< address > get_approved( token_id id ) const = 0;

      // All records ordered by id
      virtual std::vector< token_record > tokens() const = 0;

      virtual size_type size() const = 0;
      bool empty() const;
};

} // whale::ledger

#pragma once

#include <whale/ledger/ledger.hpp>

#include <map>

namespace whale::ledger::map {

class map_ledger final : public abstract_ledger {
   public:
      using size_type = abstract_ledger::size_type;

      map_ledger();
      virtual ~map_ledger() override;

      // Modifiers
      virtual void record_new_ownership( token_id id, const address& owner ) override;
      virtual void transfer( const address& caller, const address& from, const address& to, token_id id ) override;
      virtual void approve( const address& caller, const address& approved, token_id id ) override;

      // Lookup
      virtual address owner_of( token_id id ) const override;
      virtual bool exists( token_id id ) const noexcept override;
      virtual size_type balance_of( const address& owner ) const noexcept override;
      virtual std::optional< address > get_approved( token_id id ) const override;
      virtual std::vector< token_record > tokens() const override;

      virtual size_type size() const noexcept override;

   private:
      const token_record& get_record( token_id id ) const;

      std::map< token_id, token_record > _tokens;
      std::map< address, size_type >     _balances;
};

} // whale::ledger::map

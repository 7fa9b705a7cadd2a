#pragma once

#include <map>
#include <utility>

#include <reflecta/ledger/store.hpp>

namespace reflecta::ledger {

class memory_store final: public store
{
public:
  memory_store()                       = default;
  memory_store( const memory_store& )  = delete;
  memory_store( memory_store&& )       = delete;
  ~memory_store() override             = default;

  memory_store& operator=( const memory_store& ) = delete;
  memory_store& operator=( memory_store&& )      = delete;

  result< global_state > load_global() override;
  std::error_code save_global( const global_state& state ) override;

  result< account_record > load_account( const address& account ) override;
  std::error_code save_account( const address& account, const account_record& record ) override;

  result< exemption > load_exemption( const address& account ) override;
  std::error_code save_exemption( const address& account, const exemption& entry ) override;

  result< amount > load_allowance( const address& owner, const address& spender ) override;
  std::error_code save_allowance( const address& owner, const address& spender, amount allowance ) override;

  std::size_t accounts() const noexcept;

private:
  global_state _global;
  std::map< address, account_record > _accounts;
  std::map< address, exemption > _exemptions;
  std::map< std::pair< address, address >, amount > _allowances;
};

} // namespace reflecta::ledger

#pragma once

#include <reflecta/ledger/error.hpp>
#include <reflecta/ledger/types.hpp>

namespace reflecta::ledger {

/**
 * Durable storage for ledger records. Absent records load as their default
 * value: an empty global state, an included account with no reflected
 * units, no exemptions and a zero allowance.
 */
struct store
{
  store()                = default;
  store( const store& )  = delete;
  store( store&& )       = delete;
  virtual ~store()       = default;

  store& operator=( const store& ) = delete;
  store& operator=( store&& )      = delete;

  virtual result< global_state > load_global()                  = 0;
  virtual std::error_code save_global( const global_state& state ) = 0;

  virtual result< account_record > load_account( const address& account )                        = 0;
  virtual std::error_code save_account( const address& account, const account_record& record ) = 0;

  virtual result< exemption > load_exemption( const address& account )                         = 0;
  virtual std::error_code save_exemption( const address& account, const exemption& entry ) = 0;

  virtual result< amount > load_allowance( const address& owner, const address& spender )                     = 0;
  virtual std::error_code save_allowance( const address& owner, const address& spender, amount allowance ) = 0;
};

} // namespace reflecta::ledger

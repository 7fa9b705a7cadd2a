#pragma once

#include <map>
#include <optional>
#include <utility>

#include <reflecta/ledger/store.hpp>

namespace reflecta::ledger {

/**
 * Stages ledger mutations in memory on top of a store. Nothing reaches the
 * store until commit() succeeds, and discard() drops every staged change.
 *
 * The journal also tracks the true amount that has been debited from a
 * holder but has not yet landed anywhere. A journal with tokens in flight
 * cannot be committed.
 */
class journal final
{
public:
  explicit journal( store& backing ) noexcept;
  journal( const journal& ) = delete;
  journal( journal&& )      = delete;
  ~journal()                = default;

  journal& operator=( const journal& ) = delete;
  journal& operator=( journal&& )      = delete;

  result< global_state > global();
  void set_global( const global_state& state );

  result< account_record > account( const address& account );
  void set_account( const address& account, const account_record& record );

  result< exemption > exemption_of( const address& account );
  void set_exemption( const address& account, const exemption& entry );

  result< amount > allowance( const address& owner, const address& spender );
  void set_allowance( const address& owner, const address& spender, amount allowance );

  amount in_flight() const noexcept;
  void set_in_flight( amount value ) noexcept;

  bool dirty() const noexcept;

  std::error_code commit();
  void discard() noexcept;

private:
  template< typename T >
  struct staged
  {
    T value;
    bool dirty = false;
  };

  store& _store;
  std::optional< staged< global_state > > _global;
  std::map< address, staged< account_record > > _accounts;
  std::map< address, staged< exemption > > _exemptions;
  std::map< std::pair< address, address >, staged< amount > > _allowances;
  amount _in_flight = 0;
};

} // namespace reflecta::ledger

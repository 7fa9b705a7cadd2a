#pragma once

#include <reflecta/ledger/journal.hpp>

namespace reflecta::ledger {

/**
 * Balance store based on reflected units.
 *
 * Included accounts hold reflected units whose true value is derived from
 * the current rate, total_reflected / circulating, where circulating is
 * total_supply - total_excluded - in_flight. Shrinking total_reflected
 * relative to the circulating supply raises the true balance of every
 * included holder at once.
 *
 * Debit deltas round up. Credit and include deltas round down. When no
 * reflected units are outstanding conversions use initial_rate.
 */
class reflection_ledger final
{
public:
  explicit reflection_ledger( journal& staged ) noexcept;
  reflection_ledger( const reflection_ledger& ) = delete;
  reflection_ledger( reflection_ledger&& )      = delete;
  ~reflection_ledger()                          = default;

  reflection_ledger& operator=( const reflection_ledger& ) = delete;
  reflection_ledger& operator=( reflection_ledger&& )      = delete;

  static const reflected_amount initial_rate;

  result< global_state > state();
  result< amount > total_supply();

  result< amount > balance_of( const address& account );
  result< reflected_amount > reflected_of( const address& account );
  result< bool > is_excluded( const address& account );

  /**
   * Removes exactly value from the account and places it in flight.
   */
  std::error_code debit( const address& account, amount value );

  /**
   * Lands value in-flight tokens on the account.
   */
  std::error_code credit( const address& account, amount value );

  /**
   * Destroys value in-flight tokens, reducing total supply.
   */
  std::error_code burn( amount value );

  /**
   * Returns value in-flight tokens to the circulating supply without
   * returning any reflected units, distributing them over every included
   * holder.
   */
  std::error_code reflect( amount value );

  std::error_code set_excluded( const address& account, bool exclude );

  /**
   * Creates value tokens and credits them to the account.
   */
  std::error_code mint( const address& account, amount value );

private:
  result< amount > circulating( const global_state& state ) const;
  result< reflected_amount > to_reflected( const global_state& state, amount value, bool round_up ) const;
  result< amount > to_true( const global_state& state, const reflected_amount& reflected ) const;

  journal& _journal;
};

} // namespace reflecta::ledger

#pragma once

#include <reflecta/ledger/error.hpp>
#include <reflecta/ledger/types.hpp>

namespace reflecta::ledger {

class tax_policy final
{
public:
  explicit tax_policy( const tax_rates& rates ) noexcept;

  /**
   * Splits a gross amount into the net amount and the burn, reflect and
   * treasury shares. Transfers involving a tax exempt party are untaxed.
   * The truncation remainder is added to the treasury share so the parts
   * always sum to the gross amount.
   */
  result< tax_split > compute_split( amount gross, bool sender_exempt, bool recipient_exempt ) const;

  /**
   * The split a non-exempt transfer of gross would receive.
   */
  result< tax_split > quote( amount gross ) const;

private:
  tax_rates _rates;
};

} // namespace reflecta::ledger

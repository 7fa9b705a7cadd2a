#pragma once

#include <reflecta/ledger/journal.hpp>
#include <reflecta/ledger/reflection_ledger.hpp>

namespace reflecta::ledger {

/**
 * Tracks which accounts are tax exempt and which are excluded from
 * reflections. Toggling exclusion converts the account's ledger record.
 */
class exemption_registry final
{
public:
  exemption_registry( journal& staged, reflection_ledger& ledger ) noexcept;
  exemption_registry( const exemption_registry& ) = delete;
  exemption_registry( exemption_registry&& )      = delete;
  ~exemption_registry()                           = default;

  exemption_registry& operator=( const exemption_registry& ) = delete;
  exemption_registry& operator=( exemption_registry&& )      = delete;

  result< exemption > get( const address& account );

  std::error_code set_tax_exempt( const address& account, bool exempt );
  std::error_code set_excluded( const address& account, bool exclude );

private:
  journal& _journal;
  reflection_ledger& _ledger;
};

} // namespace reflecta::ledger

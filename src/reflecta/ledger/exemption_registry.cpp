#include <reflecta/ledger/exemption_registry.hpp>

namespace reflecta::ledger {

exemption_registry::exemption_registry( journal& staged, reflection_ledger& ledger ) noexcept:
    _journal( staged ),
    _ledger( ledger )
{}

result< exemption > exemption_registry::get( const address& account )
{
  return _journal.exemption_of( account );
}

std::error_code exemption_registry::set_tax_exempt( const address& account, bool exempt )
{
  auto entry = _journal.exemption_of( account );
  if( !entry )
    return entry.error();

  entry->tax_exempt = exempt;
  _journal.set_exemption( account, *entry );

  return ledger_errc::ok;
}

std::error_code exemption_registry::set_excluded( const address& account, bool exclude )
{
  auto entry = _journal.exemption_of( account );
  if( !entry )
    return entry.error();

  if( auto error = _ledger.set_excluded( account, exclude ); error )
    return error;

  entry->reflection_excluded = exclude;
  _journal.set_exemption( account, *entry );

  return ledger_errc::ok;
}

} // namespace reflecta::ledger

#include <reflecta/ledger/tax_policy.hpp>

namespace reflecta::ledger {

tax_policy::tax_policy( const tax_rates& rates ) noexcept:
    _rates( rates )
{}

static amount share_of( amount gross, std::uint16_t rate )
{
  return static_cast< amount >( reflected_amount( gross ) * rate / basis_points );
}

result< tax_split > tax_policy::compute_split( amount gross, bool sender_exempt, bool recipient_exempt ) const
{
  if( auto error = _rates.validate(); error )
    return std::unexpected( error );

  if( sender_exempt || recipient_exempt )
    return tax_split{ .net = gross };

  // The treasury absorbs the difference between the truncated total and the truncated shares
  auto total = static_cast< amount >( reflected_amount( gross ) * _rates.total() / basis_points );

  tax_split split{ .burn = share_of( gross, _rates.burn ), .reflect = share_of( gross, _rates.reflect ) };
  split.treasury = total - split.burn - split.reflect;
  split.net      = gross - total;

  return split;
}

result< tax_split > tax_policy::quote( amount gross ) const
{
  return compute_split( gross, false, false );
}

} // namespace reflecta::ledger

#include <reflecta/ledger/error.hpp>
#include <reflecta/ledger/types.hpp>

namespace reflecta::ledger {

std::uint32_t tax_rates::total() const noexcept
{
  return std::uint32_t( burn ) + std::uint32_t( reflect ) + std::uint32_t( treasury );
}

std::error_code tax_rates::validate() const noexcept
{
  if( total() > basis_points )
    return ledger_errc::invalid_config;

  return ledger_errc::ok;
}

amount fraction::of( amount value ) const
{
  auto scaled = reflected_amount( value ) * numerator / denominator;
  return static_cast< amount >( scaled );
}

std::error_code fraction::validate() const noexcept
{
  if( !denominator || numerator > denominator )
    return ledger_errc::invalid_config;

  return ledger_errc::ok;
}

std::error_code anti_whale_config::validate() const noexcept
{
  if( auto error = max_transaction.validate(); error )
    return error;

  return max_wallet.validate();
}

amount tax_split::tax() const noexcept
{
  return burn + reflect + treasury;
}

} // namespace reflecta::ledger

#include <reflecta/ledger/anti_whale_guard.hpp>

#include <limits>

namespace reflecta::ledger {

anti_whale_guard::anti_whale_guard( const anti_whale_config& config ) noexcept:
    _config( config )
{}

std::error_code anti_whale_guard::check_wallet( amount balance, amount value, amount supply ) const
{
  if( reflected_amount( balance ) + value > _config.max_wallet.of( supply ) )
    return ledger_errc::whale_limit_exceeded;

  return ledger_errc::ok;
}

std::error_code anti_whale_guard::check( const whale_check& request ) const
{
  if( auto error = _config.validate(); error )
    return error;

  if( request.exempt )
    return ledger_errc::ok;

  if( request.gross > _config.max_transaction.of( request.supply ) )
    return ledger_errc::whale_limit_exceeded;

  return check_wallet( request.recipient_balance, request.net, request.supply );
}

std::error_code
anti_whale_guard::check_mint( amount value, amount recipient_balance, amount supply, bool exempt ) const
{
  if( auto error = _config.validate(); error )
    return error;

  if( exempt )
    return ledger_errc::ok;

  if( std::numeric_limits< amount >::max() - supply < value )
    return ledger_errc::arithmetic_error;

  // Mints are capped against the supply they produce
  return check_wallet( recipient_balance, value, supply + value );
}

} // namespace reflecta::ledger

#pragma once

#include <reflecta/ledger/error.hpp>
#include <reflecta/ledger/types.hpp>

namespace reflecta::ledger {

struct whale_check
{
  amount gross             = 0;
  amount net               = 0;
  amount recipient_balance = 0;
  amount supply            = 0;
  bool exempt              = false;
};

/**
 * Caps the size of a single transfer and the balance a wallet may reach,
 * both as fractions of the pre-transfer supply.
 */
class anti_whale_guard final
{
public:
  explicit anti_whale_guard( const anti_whale_config& config ) noexcept;

  std::error_code check( const whale_check& request ) const;
  std::error_code check_mint( amount value, amount recipient_balance, amount supply, bool exempt ) const;

private:
  std::error_code check_wallet( amount balance, amount value, amount supply ) const;

  anti_whale_config _config;
};

} // namespace reflecta::ledger

#pragma once

#include <cstdint>
#include <system_error>
#include <variant>

#include <boost/multiprecision/cpp_int.hpp>

#include <reflecta/protocol/account.hpp>

namespace reflecta::ledger {

using amount           = std::uint64_t;
using reflected_amount = boost::multiprecision::uint128_t;
using address          = protocol::account;

constexpr std::uint32_t basis_points = 10'000;

struct included
{
  reflected_amount reflected = 0;

  bool operator==( const included& ) const = default;
};

struct excluded
{
  amount balance = 0;

  bool operator==( const excluded& ) const = default;
};

/**
 * An included account holds reflected units and has its balance derived
 * from the current rate. An excluded account holds its balance directly.
 */
using account_record = std::variant< included, excluded >;

/**
 * The reflection rate is total_reflected / (total_supply - total_excluded)
 * and is recomputed on every conversion.
 */
struct global_state
{
  amount total_supply              = 0;
  reflected_amount total_reflected = 0;
  amount total_excluded            = 0;

  bool operator==( const global_state& ) const = default;
};

struct exemption
{
  bool tax_exempt          = false;
  bool reflection_excluded = false;

  bool operator==( const exemption& ) const = default;
};

struct tax_rates
{
  std::uint16_t burn     = 0;
  std::uint16_t reflect  = 0;
  std::uint16_t treasury = 0;

  std::uint32_t total() const noexcept;
  std::error_code validate() const noexcept;

  bool operator==( const tax_rates& ) const = default;
};

struct fraction
{
  std::uint64_t numerator   = 1;
  std::uint64_t denominator = 1;

  /**
   * Returns floor(value * numerator / denominator). Requires a valid fraction.
   */
  amount of( amount value ) const;
  std::error_code validate() const noexcept;

  bool operator==( const fraction& ) const = default;
};

struct anti_whale_config
{
  fraction max_transaction;
  fraction max_wallet;

  std::error_code validate() const noexcept;

  bool operator==( const anti_whale_config& ) const = default;
};

struct tax_split
{
  amount net      = 0;
  amount burn     = 0;
  amount reflect  = 0;
  amount treasury = 0;

  amount tax() const noexcept;

  bool operator==( const tax_split& ) const = default;
};

struct transfer_receipt
{
  address from;
  address to;
  amount gross = 0;
  tax_split split;
};

} // namespace reflecta::ledger

#pragma once

#include <expected>
#include <system_error>

namespace reflecta::ledger {

enum class ledger_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  insufficient_balance,
  insufficient_allowance,
  whale_limit_exceeded,
  arithmetic_error,
  invalid_config,
  treasury_forward_failed
};

const std::error_category& ledger_category() noexcept;

std::error_code make_error_code( ledger_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace reflecta::ledger

template<>
struct std::is_error_code_enum< reflecta::ledger::ledger_errc >: public std::true_type
{};

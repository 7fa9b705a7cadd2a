#include <reflecta/ledger/error.hpp>

#include <utility>

namespace reflecta::ledger {

struct _ledger_category final: std::error_category
{
  const char* name() const noexcept final;
  std::string message( int condition ) const noexcept final;
};

const char* _ledger_category::name() const noexcept
{
  return "ledger";
}

std::string _ledger_category::message( int condition ) const noexcept
{
  using namespace std::string_literals;
  switch( static_cast< ledger_errc >( condition ) )
  {
    case ledger_errc::ok:
      return "ok"s;
    case ledger_errc::insufficient_balance:
      return "insufficient balance"s;
    case ledger_errc::insufficient_allowance:
      return "insufficient allowance"s;
    case ledger_errc::whale_limit_exceeded:
      return "whale limit exceeded"s;
    case ledger_errc::arithmetic_error:
      return "arithmetic error"s;
    case ledger_errc::invalid_config:
      return "invalid configuration"s;
    case ledger_errc::treasury_forward_failed:
      return "treasury forward failed"s;
  }
  std::unreachable();
}

const std::error_category& ledger_category() noexcept
{
  static _ledger_category category;
  return category;
}

std::error_code make_error_code( ledger_errc e )
{
  return std::error_code( static_cast< int >( e ), ledger_category() );
}

} // namespace reflecta::ledger

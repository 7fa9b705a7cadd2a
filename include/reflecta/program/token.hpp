#pragma once

#include <string>

#include <reflecta/program/error.hpp>
#include <reflecta/program/program.hpp>

namespace reflecta::program {

class input;

/**
 * The taxed reflection token. Each call decodes one instruction from stdin,
 * runs it against the ledger kept in the program's object space and writes
 * any result to stdout.
 */
struct token final: public program
{
  token()               = default;
  token( const token& ) = delete;
  token( token&& )      = delete;
  ~token() override     = default;

  token& operator=( const token& ) = delete;
  token& operator=( token&& )      = delete;

  std::error_code run( system_interface* system, std::span< const std::string > arguments ) override;

  enum class instruction : std::uint32_t // NOLINT(performance-enum-size)
  {
    authorize = entry_point::authorize,
    receive   = entry_point::receive,
    name,
    symbol,
    decimals,
    total_supply,
    balance_of,
    transfer,
    mint,
    burn,
    allowance,
    approve,
    decrease_allowance,
    transfer_from,
    send,
    send_from,
    exemption,
    set_exempt,
    set_excluded,
    tax_rates,
    set_tax_rates,
    anti_whale,
    set_anti_whale,
    set_treasury,
    quote_tax,
    reflection_state,
    initialize
  };

private:
  std::error_code metadata( system_interface* system, instruction i );
  std::error_code query( system_interface* system, input& in, instruction i );
  std::error_code transfer( system_interface* system, input& in, instruction i );
  std::error_code supply( system_interface* system, input& in, instruction i );
  std::error_code allowance( system_interface* system, input& in, instruction i );
  std::error_code administer( system_interface* system, input& in, instruction i );
  std::error_code initialize( system_interface* system, input& in );
};

} // namespace reflecta::program

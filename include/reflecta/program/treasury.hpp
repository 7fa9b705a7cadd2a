#pragma once

#include <string>

#include <reflecta/program/error.hpp>
#include <reflecta/program/program.hpp>

namespace reflecta::program {

class input;

/**
 * Holds the token's treasury share. The token announces every deposit, and
 * the admin spends from the treasury balance through withdrawals and
 * airdrops, which are ordinary token transfers made by this program.
 */
struct treasury final: public program
{
  treasury()                  = default;
  treasury( const treasury& ) = delete;
  treasury( treasury&& )      = delete;
  ~treasury() override        = default;

  treasury& operator=( const treasury& ) = delete;
  treasury& operator=( treasury&& )      = delete;

  std::error_code run( system_interface* system, std::span< const std::string > arguments ) override;

  enum class instruction : std::uint32_t // NOLINT(performance-enum-size)
  {
    authorize = entry_point::authorize,
    receive   = entry_point::receive,
    initialize,
    deposit,
    deposited,
    balance,
    withdraw,
    airdrop,
    token,
    admin
  };

  static constexpr std::uint32_t max_airdrop_recipients = 256;

private:
  std::error_code initialize( system_interface* system, input& in );
  std::error_code deposit( system_interface* system, input& in );
  std::error_code balance( system_interface* system );
  std::error_code withdraw( system_interface* system, input& in );
  std::error_code airdrop( system_interface* system, input& in );
};

} // namespace reflecta::program

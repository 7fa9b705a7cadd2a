#pragma once

#include <optional>
#include <string>

#include <reflecta/encode/binary.hpp>
#include <reflecta/ledger/store.hpp>
#include <reflecta/program/system_interface.hpp>

namespace reflecta::program {

namespace token_object {

constexpr std::uint32_t settings   = 0;
constexpr std::uint32_t global     = 1;
constexpr std::uint32_t accounts   = 2;
constexpr std::uint32_t exemptions = 3;
constexpr std::uint32_t allowances = 4;

} // namespace token_object

struct token_settings
{
  std::string name;
  std::string symbol;
  std::uint8_t decimals = 0;
  protocol::account admin{};
  protocol::account treasury{};
  ledger::tax_rates rates;
  ledger::anti_whale_config limits;
  std::uint64_t mint_cap = 0;

  void write( encode::byte_writer& writer ) const;
  static result< token_settings > read( encode::byte_reader& reader );
};

/**
 * Ledger records kept in the token program's object space.
 */
class token_store final: public ledger::store
{
public:
  explicit token_store( system_interface* system ) noexcept;
  token_store( const token_store& ) = delete;
  token_store( token_store&& )      = delete;
  ~token_store() override           = default;

  token_store& operator=( const token_store& ) = delete;
  token_store& operator=( token_store&& )      = delete;

  result< std::optional< token_settings > > load_settings();
  std::error_code save_settings( const token_settings& settings );

  ledger::result< ledger::global_state > load_global() override;
  std::error_code save_global( const ledger::global_state& state ) override;

  ledger::result< ledger::account_record > load_account( const ledger::address& account ) override;
  std::error_code save_account( const ledger::address& account, const ledger::account_record& record ) override;

  ledger::result< ledger::exemption > load_exemption( const ledger::address& account ) override;
  std::error_code save_exemption( const ledger::address& account, const ledger::exemption& entry ) override;

  ledger::result< ledger::amount > load_allowance( const ledger::address& owner,
                                                   const ledger::address& spender ) override;
  std::error_code
  save_allowance( const ledger::address& owner, const ledger::address& spender, ledger::amount allowance ) override;

private:
  system_interface* _system;
};

void write_reflected( encode::byte_writer& writer, const ledger::reflected_amount& value );
encode::result< ledger::reflected_amount > read_reflected( encode::byte_reader& reader );

} // namespace reflecta::program

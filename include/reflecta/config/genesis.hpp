#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <reflecta/config/error.hpp>
#include <reflecta/ledger/types.hpp>
#include <reflecta/protocol.hpp>

namespace YAML {
class Node;
} // namespace YAML

namespace reflecta::config {

struct balance_entry
{
  protocol::account account{};
  std::uint64_t amount = 0;
};

struct transfer_entry
{
  protocol::account from{};
  protocol::account to{};
  std::uint64_t amount = 0;
};

/**
 * The initial configuration of a token ledger: metadata, tax and
 * anti-whale settings, opening balances and exemptions, followed by a
 * script of transfers to run against it.
 */
struct genesis
{
  std::string name;
  std::string symbol;
  std::uint8_t decimals = 0;
  std::uint64_t mint_cap = 0;

  protocol::account token{};
  protocol::account admin{};
  protocol::account treasury{};

  ledger::tax_rates rates;
  ledger::anti_whale_config limits;

  std::vector< balance_entry > balances;
  std::vector< protocol::account > exempt;
  std::vector< protocol::account > excluded;
  std::vector< transfer_entry > transfers;

  std::error_code validate() const;
};

/**
 * Accounts are written as "user:<name>", "native:<name>" or as the 66
 * character hex encoding of the raw account bytes.
 */
result< protocol::account > parse_account( std::string_view text );

result< genesis > parse_genesis( const YAML::Node& document );
result< genesis > parse_genesis( std::string_view text );
result< genesis > load_genesis( const std::filesystem::path& path );

/**
 * Transactions that initialize the treasury and the token, mint the
 * opening balances and apply the exemptions. All are signed by the admin.
 */
std::vector< protocol::transaction > setup_transactions( const genesis& g );

/**
 * One transaction per scripted transfer, signed by the sender.
 */
std::vector< protocol::transaction > transfer_transactions( const genesis& g );

} // namespace reflecta::config

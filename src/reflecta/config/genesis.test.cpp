#include <gtest/gtest.h>

#include <string_view>

#include <yaml-cpp/yaml.h>

#include <reflecta/config/genesis.hpp>
#include <reflecta/encode/hex.hpp>
#include <reflecta/memory.hpp>
#include <reflecta/program/calls.hpp>

using namespace std::string_view_literals;
using namespace reflecta;

namespace {

constexpr auto document = R"(
token:
  name: Reflecta
  symbol: RFX
  decimals: 8
  mint_cap: 2000000
admin: user:admin
tax:
  burn: 200
  reflect: 500
  treasury: 300
anti_whale:
  max_transaction: [1, 100]
  max_wallet: [3, 100]
balances:
  - account: user:alice
    amount: 500000
  - account: user:bob
    amount: 100000
exempt:
  - user:exchange
excluded:
  - user:exchange
transfers:
  - from: user:alice
    to: user:bob
    amount: 1000
)"sv;

} // namespace

TEST( genesis, parse )
{
  auto g = config::parse_genesis( document );
  ASSERT_TRUE( g ) << g.error().message();

  EXPECT_EQ( g->name, "Reflecta" );
  EXPECT_EQ( g->symbol, "RFX" );
  EXPECT_EQ( g->decimals, 8 );
  EXPECT_EQ( g->mint_cap, 2'000'000 );
  EXPECT_EQ( g->token, protocol::system_program( "token" ) );
  EXPECT_EQ( g->treasury, protocol::system_program( "treasury" ) );
  EXPECT_EQ( g->admin, protocol::user_account( "admin" ) );

  EXPECT_EQ( g->rates, ( ledger::tax_rates{ .burn = 200, .reflect = 500, .treasury = 300 } ) );
  EXPECT_EQ( g->limits.max_transaction, ( ledger::fraction{ .numerator = 1, .denominator = 100 } ) );
  EXPECT_EQ( g->limits.max_wallet, ( ledger::fraction{ .numerator = 3, .denominator = 100 } ) );

  ASSERT_EQ( g->balances.size(), 2 );
  EXPECT_EQ( g->balances[ 0 ].account, protocol::user_account( "alice" ) );
  EXPECT_EQ( g->balances[ 0 ].amount, 500'000 );
  EXPECT_EQ( g->balances[ 1 ].account, protocol::user_account( "bob" ) );

  ASSERT_EQ( g->exempt.size(), 1 );
  ASSERT_EQ( g->excluded.size(), 1 );
  EXPECT_EQ( g->exempt.front(), protocol::user_account( "exchange" ) );

  ASSERT_EQ( g->transfers.size(), 1 );
  EXPECT_EQ( g->transfers.front().from, protocol::user_account( "alice" ) );
  EXPECT_EQ( g->transfers.front().to, protocol::user_account( "bob" ) );
  EXPECT_EQ( g->transfers.front().amount, 1'000 );
}

TEST( genesis, defaults )
{
  auto g = config::parse_genesis( R"(
token:
  name: Plain
  symbol: PLN
admin: user:admin
)"sv );
  ASSERT_TRUE( g ) << g.error().message();

  EXPECT_EQ( g->decimals, 0 );
  EXPECT_EQ( g->mint_cap, 0 );
  EXPECT_EQ( g->rates, ledger::tax_rates{} );
  EXPECT_EQ( g->limits, ledger::anti_whale_config{} );
  EXPECT_TRUE( g->balances.empty() );
  EXPECT_TRUE( g->transfers.empty() );
}

TEST( genesis, errors )
{
  auto g = config::parse_genesis( "token: { name: A, symbol: B }"sv );
  ASSERT_FALSE( g );
  EXPECT_EQ( g.error(), config::config_errc::missing_key );

  g = config::parse_genesis( "token: { name: A, symbol: B }\nadmin: user:admin\ntax: { burn: 6000, reflect: 5000 }"sv );
  ASSERT_FALSE( g );
  EXPECT_EQ( g.error(), config::config_errc::invalid_value );

  g = config::parse_genesis( "token: { name: A, symbol: B }\nadmin: user:admin\ntax: { burn: 70000 }"sv );
  ASSERT_FALSE( g );
  EXPECT_EQ( g.error(), config::config_errc::invalid_value );

  g = config::parse_genesis( "token: { name: A, symbol: B, decimals: 256 }\nadmin: user:admin"sv );
  ASSERT_FALSE( g );
  EXPECT_EQ( g.error(), config::config_errc::invalid_value );

  g = config::parse_genesis( "token: { name: A, symbol: B }\nadmin: user:admin\nanti_whale: { max_wallet: [2, 1] }"sv );
  ASSERT_FALSE( g );
  EXPECT_EQ( g.error(), config::config_errc::invalid_value );

  g = config::parse_genesis( "token: { name: A, symbol: B }\nadmin: user:admin\ntreasury: user:vault"sv );
  ASSERT_FALSE( g );
  EXPECT_EQ( g.error(), config::config_errc::invalid_account );

  g = config::parse_genesis( "token: { name: A, symbol: B, mint_cap: 10 }\nadmin: user:admin\n"
                             "balances: [ { account: user:alice, amount: 11 } ]"sv );
  ASSERT_FALSE( g );
  EXPECT_EQ( g.error(), config::config_errc::invalid_value );

  g = config::parse_genesis( "- just\n- a list"sv );
  ASSERT_FALSE( g );
  EXPECT_EQ( g.error(), config::config_errc::malformed_document );

  g = config::parse_genesis( "token: [ unbalanced"sv );
  ASSERT_FALSE( g );
  EXPECT_EQ( g.error(), config::config_errc::malformed_document );
  EXPECT_EQ( g.error().message(), "malformed document" );

  auto missing = config::load_genesis( "/nonexistent/genesis.yaml" );
  ASSERT_FALSE( missing );
  EXPECT_EQ( missing.error(), config::config_errc::unreadable_file );
}

TEST( genesis, parse_account )
{
  auto account = config::parse_account( "user:alice" );
  ASSERT_TRUE( account );
  EXPECT_EQ( *account, protocol::user_account( "alice" ) );
  EXPECT_TRUE( account->user() );

  account = config::parse_account( "native:token" );
  ASSERT_TRUE( account );
  EXPECT_EQ( *account, protocol::system_program( "token" ) );
  EXPECT_TRUE( account->program() );

  const auto bob = protocol::user_account( "bob" );
  account        = config::parse_account( encode::to_hex( memory::as_bytes( bob ) ) );
  ASSERT_TRUE( account );
  EXPECT_EQ( *account, bob );

  account = config::parse_account( "0x0102" );
  ASSERT_FALSE( account );
  EXPECT_EQ( account.error(), config::config_errc::invalid_account );

  account = config::parse_account( "alice" );
  ASSERT_FALSE( account );
  EXPECT_EQ( account.error(), config::config_errc::invalid_account );
}

TEST( genesis, transactions )
{
  auto g = config::parse_genesis( document );
  ASSERT_TRUE( g );

  auto setup = config::setup_transactions( *g );
  ASSERT_EQ( setup.size(), 3 );

  for( const auto& transaction: setup )
  {
    ASSERT_EQ( transaction.signers.size(), 1 );
    EXPECT_EQ( transaction.signers.front(), g->admin );
    EXPECT_TRUE( transaction.validate() );
  }

  // The treasury must be configured before the token forwards to it
  ASSERT_EQ( setup[ 0 ].operations.size(), 2 );
  EXPECT_EQ( setup[ 0 ].operations[ 0 ].id, g->treasury );
  EXPECT_EQ( setup[ 0 ].operations[ 0 ].input.stdin, program::calls::treasury::initialize( g->token, g->admin ) );
  EXPECT_EQ( setup[ 0 ].operations[ 1 ].id, g->token );

  ASSERT_EQ( setup[ 1 ].operations.size(), 2 );
  EXPECT_EQ( setup[ 1 ].operations[ 0 ].input.stdin,
             program::calls::token::set_exempt( protocol::user_account( "exchange" ), true ) );
  EXPECT_EQ( setup[ 1 ].operations[ 1 ].input.stdin,
             program::calls::token::set_excluded( protocol::user_account( "exchange" ), true ) );

  ASSERT_EQ( setup[ 2 ].operations.size(), 2 );
  EXPECT_EQ( setup[ 2 ].operations[ 0 ].input.stdin,
             program::calls::token::mint( protocol::user_account( "alice" ), 500'000 ) );

  auto transfers = config::transfer_transactions( *g );
  ASSERT_EQ( transfers.size(), 1 );
  ASSERT_EQ( transfers.front().signers.size(), 1 );
  EXPECT_EQ( transfers.front().signers.front(), protocol::user_account( "alice" ) );
  EXPECT_EQ( transfers.front().operations.front().input.stdin,
             program::calls::token::transfer( protocol::user_account( "alice" ),
                                              protocol::user_account( "bob" ),
                                              1'000 ) );
}

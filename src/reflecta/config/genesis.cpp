#include <reflecta/config/genesis.hpp>

#include <concepts>
#include <limits>
#include <string>
#include <utility>

#include <yaml-cpp/yaml.h>

#include <reflecta/encode/hex.hpp>
#include <reflecta/program/calls.hpp>

namespace reflecta::config {

namespace {

using namespace std::string_view_literals;

constexpr auto user_prefix   = "user:"sv;
constexpr auto native_prefix = "native:"sv;

template< typename T >
result< T > scalar( const YAML::Node& node )
{
  if( !node.IsScalar() )
    return std::unexpected( config_errc::invalid_value );

  try
  {
    return node.as< T >();
  }
  catch( const YAML::Exception& )
  {
    return std::unexpected( config_errc::invalid_value );
  }
}

template< typename T >
result< T > required( const YAML::Node& node, const std::string& key )
{
  auto value = node[ key ];
  if( !value )
    return std::unexpected( config_errc::missing_key );

  return scalar< T >( value );
}

template< typename T >
result< T > optional( const YAML::Node& node, const std::string& key, T fallback )
{
  auto value = node[ key ];
  if( !value )
    return fallback;

  return scalar< T >( value );
}

template< std::unsigned_integral T >
result< T > bounded( const YAML::Node& node, const std::string& key, T fallback )
{
  auto value = optional< std::uint64_t >( node, key, fallback );
  if( !value )
    return std::unexpected( value.error() );

  if( *value > std::numeric_limits< T >::max() )
    return std::unexpected( config_errc::invalid_value );

  return static_cast< T >( *value );
}

result< protocol::account > account_at( const YAML::Node& node, const std::string& key )
{
  auto text = required< std::string >( node, key );
  if( !text )
    return std::unexpected( text.error() );

  return parse_account( *text );
}

result< protocol::account > account_at( const YAML::Node& node, const std::string& key, std::string_view fallback )
{
  auto text = optional< std::string >( node, key, std::string( fallback ) );
  if( !text )
    return std::unexpected( text.error() );

  return parse_account( *text );
}

result< ledger::fraction > fraction_at( const YAML::Node& node, const std::string& key )
{
  auto value = node[ key ];
  if( !value )
    return ledger::fraction{};

  if( !value.IsSequence() || value.size() != 2 )
    return std::unexpected( config_errc::invalid_value );

  auto numerator = scalar< std::uint64_t >( value[ 0 ] );
  if( !numerator )
    return std::unexpected( numerator.error() );

  auto denominator = scalar< std::uint64_t >( value[ 1 ] );
  if( !denominator )
    return std::unexpected( denominator.error() );

  return ledger::fraction{ .numerator = *numerator, .denominator = *denominator };
}

result< std::vector< protocol::account > > account_list( const YAML::Node& node, const std::string& key )
{
  std::vector< protocol::account > accounts;

  auto list = node[ key ];
  if( !list )
    return accounts;

  if( !list.IsSequence() )
    return std::unexpected( config_errc::invalid_value );

  for( const auto& entry: list )
  {
    auto text = scalar< std::string >( entry );
    if( !text )
      return std::unexpected( text.error() );

    auto account = parse_account( *text );
    if( !account )
      return std::unexpected( account.error() );

    accounts.push_back( *account );
  }

  return accounts;
}

protocol::call_program call( const protocol::account& id, std::vector< std::byte >&& stdin )
{
  protocol::call_program op;
  op.id          = id;
  op.input.stdin = std::move( stdin );
  return op;
}

} // namespace

std::error_code genesis::validate() const
{
  if( name.empty() || symbol.empty() )
    return config_errc::invalid_value;

  if( !token.program() || !treasury.program() || token == treasury )
    return config_errc::invalid_account;

  if( admin.type() == protocol::account_type::invalid )
    return config_errc::invalid_account;

  if( rates.validate() || limits.validate() )
    return config_errc::invalid_value;

  std::uint64_t supply = 0;
  for( const auto& entry: balances )
  {
    if( entry.amount > std::numeric_limits< std::uint64_t >::max() - supply )
      return config_errc::invalid_value;

    supply += entry.amount;
  }

  if( mint_cap && supply > mint_cap )
    return config_errc::invalid_value;

  return config_errc::ok;
}

result< protocol::account > parse_account( std::string_view text )
{
  protocol::account account{};

  if( text.starts_with( user_prefix ) )
    account = protocol::user_account( text.substr( user_prefix.size() ) );
  else if( text.starts_with( native_prefix ) )
    account = protocol::system_program( text.substr( native_prefix.size() ) );
  else if( auto bytes = encode::from_hex< protocol::account_length >( text ); bytes )
    account = protocol::make_account( *bytes );

  if( account.type() == protocol::account_type::invalid )
    return std::unexpected( config_errc::invalid_account );

  return account;
}

result< genesis > parse_genesis( const YAML::Node& document )
{
  if( !document.IsMap() )
    return std::unexpected( config_errc::malformed_document );

  genesis g;

  auto token = document[ "token" ];
  if( !token )
    return std::unexpected( config_errc::missing_key );

  if( !token.IsMap() )
    return std::unexpected( config_errc::invalid_value );

  auto name = required< std::string >( token, "name" );
  if( !name )
    return std::unexpected( name.error() );

  auto symbol = required< std::string >( token, "symbol" );
  if( !symbol )
    return std::unexpected( symbol.error() );

  auto decimals = bounded< std::uint8_t >( token, "decimals", 0 );
  if( !decimals )
    return std::unexpected( decimals.error() );

  auto mint_cap = bounded< std::uint64_t >( token, "mint_cap", 0 );
  if( !mint_cap )
    return std::unexpected( mint_cap.error() );

  auto token_id = account_at( token, "id", "native:token" );
  if( !token_id )
    return std::unexpected( token_id.error() );

  auto admin = account_at( document, "admin" );
  if( !admin )
    return std::unexpected( admin.error() );

  auto treasury = account_at( document, "treasury", "native:treasury" );
  if( !treasury )
    return std::unexpected( treasury.error() );

  g.name     = std::move( *name );
  g.symbol   = std::move( *symbol );
  g.decimals = *decimals;
  g.mint_cap = *mint_cap;
  g.token    = *token_id;
  g.admin    = *admin;
  g.treasury = *treasury;

  if( auto tax = document[ "tax" ]; tax )
  {
    if( !tax.IsMap() )
      return std::unexpected( config_errc::invalid_value );

    for( auto [ key, rate ]: { std::pair{ "burn", &g.rates.burn },
                               std::pair{ "reflect", &g.rates.reflect },
                               std::pair{ "treasury", &g.rates.treasury } } )
    {
      auto value = bounded< std::uint16_t >( tax, key, 0 );
      if( !value )
        return std::unexpected( value.error() );

      *rate = *value;
    }
  }

  if( auto anti_whale = document[ "anti_whale" ]; anti_whale )
  {
    if( !anti_whale.IsMap() )
      return std::unexpected( config_errc::invalid_value );

    auto max_transaction = fraction_at( anti_whale, "max_transaction" );
    if( !max_transaction )
      return std::unexpected( max_transaction.error() );

    auto max_wallet = fraction_at( anti_whale, "max_wallet" );
    if( !max_wallet )
      return std::unexpected( max_wallet.error() );

    g.limits = ledger::anti_whale_config{ .max_transaction = *max_transaction, .max_wallet = *max_wallet };
  }

  if( auto balances = document[ "balances" ]; balances )
  {
    if( !balances.IsSequence() )
      return std::unexpected( config_errc::invalid_value );

    for( const auto& entry: balances )
    {
      auto account = account_at( entry, "account" );
      if( !account )
        return std::unexpected( account.error() );

      auto amount = required< std::uint64_t >( entry, "amount" );
      if( !amount )
        return std::unexpected( amount.error() );

      g.balances.push_back( balance_entry{ .account = *account, .amount = *amount } );
    }
  }

  auto exempt = account_list( document, "exempt" );
  if( !exempt )
    return std::unexpected( exempt.error() );

  auto excluded = account_list( document, "excluded" );
  if( !excluded )
    return std::unexpected( excluded.error() );

  g.exempt   = std::move( *exempt );
  g.excluded = std::move( *excluded );

  if( auto transfers = document[ "transfers" ]; transfers )
  {
    if( !transfers.IsSequence() )
      return std::unexpected( config_errc::invalid_value );

    for( const auto& entry: transfers )
    {
      auto from = account_at( entry, "from" );
      if( !from )
        return std::unexpected( from.error() );

      auto to = account_at( entry, "to" );
      if( !to )
        return std::unexpected( to.error() );

      auto amount = required< std::uint64_t >( entry, "amount" );
      if( !amount )
        return std::unexpected( amount.error() );

      g.transfers.push_back( transfer_entry{ .from = *from, .to = *to, .amount = *amount } );
    }
  }

  if( auto error = g.validate(); error )
    return std::unexpected( error );

  return g;
}

result< genesis > parse_genesis( std::string_view text )
{
  YAML::Node document;

  try
  {
    document = YAML::Load( std::string( text ) );
  }
  catch( const YAML::Exception& )
  {
    return std::unexpected( config_errc::malformed_document );
  }

  return parse_genesis( document );
}

result< genesis > load_genesis( const std::filesystem::path& path )
{
  YAML::Node document;

  try
  {
    document = YAML::LoadFile( path.string() );
  }
  catch( const YAML::BadFile& )
  {
    return std::unexpected( config_errc::unreadable_file );
  }
  catch( const YAML::Exception& )
  {
    return std::unexpected( config_errc::malformed_document );
  }

  return parse_genesis( document );
}

std::vector< protocol::transaction > setup_transactions( const genesis& g )
{
  namespace token    = program::calls::token;
  namespace treasury = program::calls::treasury;

  std::vector< protocol::transaction > transactions;

  auto& initialize = transactions.emplace_back();
  initialize.signers.push_back( g.admin );
  initialize.operations.push_back( call( g.treasury, treasury::initialize( g.token, g.admin ) ) );
  initialize.operations.push_back(
    call( g.token,
          token::initialize( g.name, g.symbol, g.decimals, g.admin, g.treasury, g.rates, g.limits, g.mint_cap ) ) );

  if( !g.exempt.empty() || !g.excluded.empty() )
  {
    auto& exemptions = transactions.emplace_back();
    exemptions.signers.push_back( g.admin );

    for( const auto& account: g.exempt )
      exemptions.operations.push_back( call( g.token, token::set_exempt( account, true ) ) );

    for( const auto& account: g.excluded )
      exemptions.operations.push_back( call( g.token, token::set_excluded( account, true ) ) );
  }

  if( !g.balances.empty() )
  {
    auto& mints = transactions.emplace_back();
    mints.signers.push_back( g.admin );

    for( const auto& entry: g.balances )
      mints.operations.push_back( call( g.token, token::mint( entry.account, entry.amount ) ) );
  }

  return transactions;
}

std::vector< protocol::transaction > transfer_transactions( const genesis& g )
{
  std::vector< protocol::transaction > transactions;

  for( const auto& entry: g.transfers )
  {
    auto& transaction = transactions.emplace_back();
    transaction.signers.push_back( entry.from );
    transaction.operations.push_back(
      call( g.token, program::calls::token::transfer( entry.from, entry.to, entry.amount ) ) );
  }

  return transactions;
}

} // namespace reflecta::config

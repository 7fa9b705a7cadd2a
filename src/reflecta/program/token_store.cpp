#include <reflecta/program/token_store.hpp>

#include <algorithm>
#include <array>
#include <limits>
#include <type_traits>
#include <utility>
#include <variant>

namespace reflecta::program {

namespace {

enum class record_tag : std::uint8_t
{
  included = 0,
  excluded = 1
};

std::span< const std::byte > allowance_key( const ledger::address& owner,
                                            const ledger::address& spender,
                                            std::array< std::byte, 2 * protocol::account_length >& key )
{
  std::ranges::copy( owner, key.begin() );
  std::ranges::copy( spender, key.begin() + protocol::account_length );
  return key;
}

template< typename T >
result< T > finish( encode::byte_reader& reader, encode::result< T >&& value )
{
  if( !value || !reader.empty() )
    return std::unexpected( program_errc::unexpected_object );

  return std::move( *value );
}

} // namespace

void write_reflected( encode::byte_writer& writer, const ledger::reflected_amount& value )
{
  const ledger::reflected_amount mask = std::numeric_limits< std::uint64_t >::max();
  writer.write( static_cast< std::uint64_t >( value & mask ) );
  writer.write( static_cast< std::uint64_t >( value >> 64 ) );
}

encode::result< ledger::reflected_amount > read_reflected( encode::byte_reader& reader )
{
  auto low = reader.read< std::uint64_t >();
  if( !low )
    return std::unexpected( low.error() );

  auto high = reader.read< std::uint64_t >();
  if( !high )
    return std::unexpected( high.error() );

  return ( ledger::reflected_amount( *high ) << 64 ) | *low;
}

void token_settings::write( encode::byte_writer& writer ) const
{
  writer.write_sized( name );
  writer.write_sized( symbol );
  writer.write( decimals );
  writer.write( memory::as_bytes( admin ) );
  writer.write( memory::as_bytes( treasury ) );
  writer.write( rates.burn ).write( rates.reflect ).write( rates.treasury );
  writer.write( limits.max_transaction.numerator ).write( limits.max_transaction.denominator );
  writer.write( limits.max_wallet.numerator ).write( limits.max_wallet.denominator );
  writer.write( mint_cap );
}

result< token_settings > token_settings::read( encode::byte_reader& reader )
{
  auto value = [ & ]() -> encode::result< token_settings >
  {
    token_settings settings;

    auto name = reader.read_string();
    if( !name )
      return std::unexpected( name.error() );
    settings.name = std::move( *name );

    auto symbol = reader.read_string();
    if( !symbol )
      return std::unexpected( symbol.error() );
    settings.symbol = std::move( *symbol );

    auto decimals = reader.read< std::uint8_t >();
    if( !decimals )
      return std::unexpected( decimals.error() );
    settings.decimals = *decimals;

    auto admin = reader.read_array< protocol::account_length >();
    if( !admin )
      return std::unexpected( admin.error() );
    settings.admin = protocol::make_account( *admin );

    auto treasury = reader.read_array< protocol::account_length >();
    if( !treasury )
      return std::unexpected( treasury.error() );
    settings.treasury = protocol::make_account( *treasury );

    for( auto* rate: { &settings.rates.burn, &settings.rates.reflect, &settings.rates.treasury } )
    {
      auto bps = reader.read< std::uint16_t >();
      if( !bps )
        return std::unexpected( bps.error() );
      *rate = *bps;
    }

    for( auto* part: { &settings.limits.max_transaction.numerator,
                       &settings.limits.max_transaction.denominator,
                       &settings.limits.max_wallet.numerator,
                       &settings.limits.max_wallet.denominator,
                       &settings.mint_cap } )
    {
      auto field = reader.read< std::uint64_t >();
      if( !field )
        return std::unexpected( field.error() );
      *part = *field;
    }

    return settings;
  }();

  return finish( reader, std::move( value ) );
}

token_store::token_store( system_interface* system ) noexcept:
    _system( system )
{}

result< std::optional< token_settings > > token_store::load_settings()
{
  auto object = _system->get_object( token_object::settings, std::span< const std::byte >{} );
  if( object.empty() )
    return std::optional< token_settings >{};

  encode::byte_reader reader( object );
  auto settings = token_settings::read( reader );
  if( !settings )
    return std::unexpected( settings.error() );

  return std::optional< token_settings >( std::move( *settings ) );
}

std::error_code token_store::save_settings( const token_settings& settings )
{
  encode::byte_writer writer;
  settings.write( writer );
  return _system->put_object( token_object::settings, std::span< const std::byte >{}, writer.data() );
}

ledger::result< ledger::global_state > token_store::load_global()
{
  auto object = _system->get_object( token_object::global, std::span< const std::byte >{} );
  if( object.empty() )
    return ledger::global_state{};

  encode::byte_reader reader( object );
  auto value = [ & ]() -> encode::result< ledger::global_state >
  {
    ledger::global_state state;

    auto supply = reader.read< std::uint64_t >();
    if( !supply )
      return std::unexpected( supply.error() );
    state.total_supply = *supply;

    auto reflected = read_reflected( reader );
    if( !reflected )
      return std::unexpected( reflected.error() );
    state.total_reflected = *reflected;

    auto excluded = reader.read< std::uint64_t >();
    if( !excluded )
      return std::unexpected( excluded.error() );
    state.total_excluded = *excluded;

    return state;
  }();

  return finish( reader, std::move( value ) );
}

std::error_code token_store::save_global( const ledger::global_state& state )
{
  encode::byte_writer writer;
  writer.write( state.total_supply );
  write_reflected( writer, state.total_reflected );
  writer.write( state.total_excluded );
  return _system->put_object( token_object::global, std::span< const std::byte >{}, writer.data() );
}

ledger::result< ledger::account_record > token_store::load_account( const ledger::address& account )
{
  auto object = _system->get_object( token_object::accounts, memory::as_bytes( account ) );
  if( object.empty() )
    return ledger::included{};

  encode::byte_reader reader( object );
  auto value = [ & ]() -> encode::result< ledger::account_record >
  {
    auto tag = reader.read< std::uint8_t >();
    if( !tag )
      return std::unexpected( tag.error() );

    switch( *tag )
    {
      case std::to_underlying( record_tag::included ):
        {
          auto reflected = read_reflected( reader );
          if( !reflected )
            return std::unexpected( reflected.error() );
          return ledger::included{ .reflected = *reflected };
        }
      case std::to_underlying( record_tag::excluded ):
        {
          auto balance = reader.read< std::uint64_t >();
          if( !balance )
            return std::unexpected( balance.error() );
          return ledger::excluded{ .balance = *balance };
        }
      default:
        return std::unexpected( encode::encode_errc::invalid_character );
    }
  }();

  return finish( reader, std::move( value ) );
}

std::error_code token_store::save_account( const ledger::address& account, const ledger::account_record& record )
{
  // Empty included records carry no information
  if( const auto* holder = std::get_if< ledger::included >( &record ); holder && !holder->reflected )
    return _system->remove_object( token_object::accounts, memory::as_bytes( account ) );

  encode::byte_writer writer;
  std::visit(
    [ & ]( const auto& entry )
    {
      using entry_type = std::decay_t< decltype( entry ) >;
      if constexpr( std::is_same_v< entry_type, ledger::included > )
      {
        writer.write( std::to_underlying( record_tag::included ) );
        write_reflected( writer, entry.reflected );
      }
      else
      {
        writer.write( std::to_underlying( record_tag::excluded ) );
        writer.write( entry.balance );
      }
    },
    record );

  return _system->put_object( token_object::accounts, memory::as_bytes( account ), writer.data() );
}

ledger::result< ledger::exemption > token_store::load_exemption( const ledger::address& account )
{
  auto object = _system->get_object( token_object::exemptions, memory::as_bytes( account ) );
  if( object.empty() )
    return ledger::exemption{};

  encode::byte_reader reader( object );
  auto value = [ & ]() -> encode::result< ledger::exemption >
  {
    auto tax_exempt = reader.read_bool();
    if( !tax_exempt )
      return std::unexpected( tax_exempt.error() );

    auto excluded = reader.read_bool();
    if( !excluded )
      return std::unexpected( excluded.error() );

    return ledger::exemption{ .tax_exempt = *tax_exempt, .reflection_excluded = *excluded };
  }();

  return finish( reader, std::move( value ) );
}

std::error_code token_store::save_exemption( const ledger::address& account, const ledger::exemption& entry )
{
  if( entry == ledger::exemption{} )
    return _system->remove_object( token_object::exemptions, memory::as_bytes( account ) );

  encode::byte_writer writer;
  writer.write( entry.tax_exempt ).write( entry.reflection_excluded );
  return _system->put_object( token_object::exemptions, memory::as_bytes( account ), writer.data() );
}

ledger::result< ledger::amount > token_store::load_allowance( const ledger::address& owner,
                                                              const ledger::address& spender )
{
  std::array< std::byte, 2 * protocol::account_length > key{};
  auto object = _system->get_object( token_object::allowances, allowance_key( owner, spender, key ) );
  if( object.empty() )
    return ledger::amount( 0 );

  encode::byte_reader reader( object );
  return finish( reader, reader.read< std::uint64_t >() );
}

std::error_code
token_store::save_allowance( const ledger::address& owner, const ledger::address& spender, ledger::amount allowance )
{
  std::array< std::byte, 2 * protocol::account_length > key{};
  allowance_key( owner, spender, key );

  if( !allowance )
    return _system->remove_object( token_object::allowances, key );

  encode::byte_writer writer;
  writer.write( allowance );
  return _system->put_object( token_object::allowances, key, writer.data() );
}

} // namespace reflecta::program

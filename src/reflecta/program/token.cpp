#include <reflecta/program/token.hpp>

#include <limits>
#include <optional>
#include <utility>
#include <vector>

#include <reflecta/ledger.hpp>
#include <reflecta/memory.hpp>
#include <reflecta/program/io.hpp>
#include <reflecta/program/token_store.hpp>
#include <reflecta/program/treasury.hpp>

namespace reflecta::program {

namespace {

/**
 * Announces the treasury share to the treasury program.
 */
class treasury_forwarder final: public ledger::treasury_account
{
public:
  treasury_forwarder( system_interface* system, const protocol::account& id ) noexcept:
      _system( system ),
      _id( id )
  {}

  const ledger::address& id() const override
  {
    return _id;
  }

  std::error_code deposit( ledger::amount value ) override
  {
    encode::byte_writer writer;
    writer.write( std::to_underlying( treasury::instruction::deposit ) ).write( value );

    if( auto output = _system->call_program( _id, writer.data() ); !output )
      return output.error();

    return program_errc::ok;
  }

private:
  system_interface* _system;
  protocol::account _id;
};

class program_notifier final: public ledger::recipient_notifier
{
public:
  explicit program_notifier( system_interface* system ) noexcept:
      _system( system )
  {}

  std::error_code notify( const ledger::address& recipient,
                          const ledger::address& sender,
                          ledger::amount net,
                          std::span< const std::byte > payload ) override
  {
    encode::byte_writer writer;
    writer.write( entry_point::receive ).write( memory::as_bytes( sender ) ).write( net ).write_sized( payload );

    if( auto output = _system->call_program( recipient, writer.data() ); !output )
      return program_errc::notification_failed;

    return program_errc::ok;
  }

private:
  system_interface* _system;
};

std::error_code require_authority( system_interface* system, protocol::account_view account )
{
  auto permitted = authorized( system, account );
  if( !permitted )
    return permitted.error();

  if( !*permitted )
    return program_errc::unauthorized;

  return program_errc::ok;
}

result< token_settings > require_settings( token_store& store )
{
  auto settings = store.load_settings();
  if( !settings )
    return std::unexpected( settings.error() );

  if( !*settings )
    return std::unexpected( program_errc::not_initialized );

  return std::move( **settings );
}

void write_split( encode::byte_writer& writer, const ledger::tax_split& split )
{
  writer.write( split.net ).write( split.burn ).write( split.reflect ).write( split.treasury );
}

void write_rates( encode::byte_writer& writer, const ledger::tax_rates& rates )
{
  writer.write( rates.burn ).write( rates.reflect ).write( rates.treasury );
}

void write_limits( encode::byte_writer& writer, const ledger::anti_whale_config& limits )
{
  writer.write( limits.max_transaction.numerator ).write( limits.max_transaction.denominator );
  writer.write( limits.max_wallet.numerator ).write( limits.max_wallet.denominator );
}

result< ledger::tax_rates > read_rates( input& in )
{
  ledger::tax_rates rates;
  for( auto* rate: { &rates.burn, &rates.reflect, &rates.treasury } )
  {
    auto value = in.read< std::uint16_t >();
    if( !value )
      return std::unexpected( value.error() );

    *rate = *value;
  }

  return rates;
}

result< ledger::anti_whale_config > read_limits( input& in )
{
  ledger::anti_whale_config limits;
  for( auto* field: { &limits.max_transaction.numerator,
                      &limits.max_transaction.denominator,
                      &limits.max_wallet.numerator,
                      &limits.max_wallet.denominator } )
  {
    auto value = in.read< std::uint64_t >();
    if( !value )
      return std::unexpected( value.error() );

    *field = *value;
  }

  return limits;
}

std::error_code announce_transfer( system_interface* system, const ledger::transfer_receipt& receipt )
{
  encode::byte_writer writer;
  writer.write( memory::as_bytes( receipt.from ) ).write( memory::as_bytes( receipt.to ) ).write( receipt.gross );
  write_split( writer, receipt.split );

  return system->event( "token.transfer", writer.data(), { receipt.from, receipt.to } );
}

std::error_code announce_exemption( system_interface* system,
                                    const protocol::account& account,
                                    const ledger::exemption& entry )
{
  encode::byte_writer writer;
  writer.write( memory::as_bytes( account ) ).write( entry.tax_exempt ).write( entry.reflection_excluded );

  return system->event( "token.exemption", writer.data(), { account } );
}

std::error_code announce_settings( system_interface* system, const token_settings& settings )
{
  encode::byte_writer writer;
  settings.write( writer );

  return system->event( "token.settings", writer.data(), { settings.admin, settings.treasury } );
}

} // namespace

std::error_code token::run( system_interface* system, std::span< const std::string > arguments )
{
  input in( system );

  auto selector = in.read< std::uint32_t >();
  if( !selector )
    return program_errc::invalid_instruction;

  auto i = static_cast< instruction >( *selector );
  switch( i )
  {
    case instruction::authorize:
      {
        encode::byte_writer writer;
        writer.write( false );
        return write_output( system, writer );
      }
    case instruction::receive:
      return program_errc::invalid_instruction;
    case instruction::name:
    case instruction::symbol:
    case instruction::decimals:
      return metadata( system, i );
    case instruction::total_supply:
    case instruction::balance_of:
    case instruction::allowance:
    case instruction::exemption:
    case instruction::tax_rates:
    case instruction::anti_whale:
    case instruction::quote_tax:
    case instruction::reflection_state:
      return query( system, in, i );
    case instruction::transfer:
    case instruction::transfer_from:
    case instruction::send:
    case instruction::send_from:
      return transfer( system, in, i );
    case instruction::mint:
    case instruction::burn:
      return supply( system, in, i );
    case instruction::approve:
    case instruction::decrease_allowance:
      return allowance( system, in, i );
    case instruction::set_exempt:
    case instruction::set_excluded:
    case instruction::set_tax_rates:
    case instruction::set_anti_whale:
    case instruction::set_treasury:
      return administer( system, in, i );
    case instruction::initialize:
      return initialize( system, in );
  }

  return program_errc::invalid_instruction;
}

std::error_code token::metadata( system_interface* system, instruction i )
{
  token_store store( system );
  auto settings = require_settings( store );
  if( !settings )
    return settings.error();

  encode::byte_writer writer;
  switch( i )
  {
    case instruction::name:
      writer.write( memory::as_bytes( settings->name ) );
      break;
    case instruction::symbol:
      writer.write( memory::as_bytes( settings->symbol ) );
      break;
    case instruction::decimals:
      writer.write( settings->decimals );
      break;
    default:
      std::unreachable();
  }

  return write_output( system, writer );
}

std::error_code token::query( system_interface* system, input& in, instruction i )
{
  token_store store( system );
  ledger::journal staged( store );
  ledger::reflection_ledger reflections( staged );

  encode::byte_writer writer;
  switch( i )
  {
    case instruction::total_supply:
      {
        auto supply = reflections.total_supply();
        if( !supply )
          return supply.error();

        writer.write( *supply );
        break;
      }
    case instruction::balance_of:
      {
        auto account = in.read_account();
        if( !account )
          return account.error();

        auto balance = reflections.balance_of( *account );
        if( !balance )
          return balance.error();

        writer.write( *balance );
        break;
      }
    case instruction::allowance:
      {
        auto owner = in.read_account();
        if( !owner )
          return owner.error();

        auto spender = in.read_account();
        if( !spender )
          return spender.error();

        auto allowance = staged.allowance( *owner, *spender );
        if( !allowance )
          return allowance.error();

        writer.write( *allowance );
        break;
      }
    case instruction::exemption:
      {
        auto account = in.read_account();
        if( !account )
          return account.error();

        auto entry = staged.exemption_of( *account );
        if( !entry )
          return entry.error();

        writer.write( entry->tax_exempt ).write( entry->reflection_excluded );
        break;
      }
    case instruction::tax_rates:
    case instruction::anti_whale:
      {
        auto settings = require_settings( store );
        if( !settings )
          return settings.error();

        if( i == instruction::tax_rates )
          write_rates( writer, settings->rates );
        else
          write_limits( writer, settings->limits );
        break;
      }
    case instruction::quote_tax:
      {
        auto value = in.read< std::uint64_t >();
        if( !value )
          return value.error();

        auto settings = require_settings( store );
        if( !settings )
          return settings.error();

        auto split = ledger::tax_policy( settings->rates ).quote( *value );
        if( !split )
          return split.error();

        write_split( writer, *split );
        break;
      }
    case instruction::reflection_state:
      {
        auto state = reflections.state();
        if( !state )
          return state.error();

        writer.write( state->total_supply );
        write_reflected( writer, state->total_reflected );
        writer.write( state->total_excluded );
        break;
      }
    default:
      std::unreachable();
  }

  return write_output( system, writer );
}

std::error_code token::transfer( system_interface* system, input& in, instruction i )
{
  const bool delegated = i == instruction::transfer_from || i == instruction::send_from;
  const bool notified  = i == instruction::send || i == instruction::send_from;

  std::optional< protocol::account > spender;
  if( delegated )
  {
    auto account = in.read_account();
    if( !account )
      return account.error();

    spender = *account;
  }

  auto from = in.read_account();
  if( !from )
    return from.error();

  auto to = in.read_account();
  if( !to )
    return to.error();

  auto value = in.read< std::uint64_t >();
  if( !value )
    return value.error();

  std::vector< std::byte > payload;
  if( notified )
  {
    auto bytes = in.read_sized();
    if( !bytes )
      return bytes.error();

    if( !to->program() )
      return program_errc::invalid_argument;

    payload = std::move( *bytes );
  }

  if( auto error = require_authority( system, spender ? *spender : *from ); error )
    return error;

  token_store store( system );
  auto settings = require_settings( store );
  if( !settings )
    return settings.error();

  ledger::journal staged( store );
  treasury_forwarder forwarder( system, settings->treasury );
  program_notifier notifier( system );
  ledger::transfer_engine engine( staged, settings->rates, settings->limits, forwarder );

  auto receipt = [ & ]() -> ledger::result< ledger::transfer_receipt >
  {
    switch( i )
    {
      case instruction::transfer:
        return engine.transfer( *from, *to, *value );
      case instruction::transfer_from:
        return engine.transfer_from( *spender, *from, *to, *value );
      case instruction::send:
        return engine.send( *from, *to, *value, payload, notifier );
      case instruction::send_from:
        return engine.send_from( *spender, *from, *to, *value, payload, notifier );
      default:
        std::unreachable();
    }
  }();

  if( !receipt )
    return receipt.error();

  if( receipt->gross )
  {
    if( auto error = announce_transfer( system, *receipt ); error )
      return error;
  }

  encode::byte_writer writer;
  write_split( writer, receipt->split );
  return write_output( system, writer );
}

std::error_code token::supply( system_interface* system, input& in, instruction i )
{
  auto account = in.read_account();
  if( !account )
    return account.error();

  auto value = in.read< std::uint64_t >();
  if( !value )
    return value.error();

  token_store store( system );
  auto settings = require_settings( store );
  if( !settings )
    return settings.error();

  ledger::journal staged( store );
  treasury_forwarder forwarder( system, settings->treasury );
  ledger::transfer_engine engine( staged, settings->rates, settings->limits, forwarder );

  encode::byte_writer writer;
  writer.write( memory::as_bytes( *account ) ).write( *value );

  if( i == instruction::mint )
  {
    if( auto error = require_authority( system, settings->admin ); error )
      return error;

    if( settings->mint_cap )
    {
      auto supply = engine.ledger().total_supply();
      if( !supply )
        return supply.error();

      if( *supply > settings->mint_cap || *value > settings->mint_cap - *supply )
        return program_errc::invalid_argument;
    }

    if( auto error = engine.mint( *account, *value ); error )
      return error;

    return system->event( "token.mint", writer.data(), { *account } );
  }

  if( auto error = require_authority( system, *account ); error )
    return error;

  if( auto error = engine.burn( *account, *value ); error )
    return error;

  return system->event( "token.burn", writer.data(), { *account } );
}

std::error_code token::allowance( system_interface* system, input& in, instruction i )
{
  auto owner = in.read_account();
  if( !owner )
    return owner.error();

  auto spender = in.read_account();
  if( !spender )
    return spender.error();

  auto value = in.read< std::uint64_t >();
  if( !value )
    return value.error();

  if( auto error = require_authority( system, *owner ); error )
    return error;

  token_store store( system );
  ledger::journal staged( store );

  auto current = staged.allowance( *owner, *spender );
  if( !current )
    return current.error();

  ledger::amount updated = 0;
  if( i == instruction::approve )
  {
    if( *value > std::numeric_limits< ledger::amount >::max() - *current )
      return ledger::ledger_errc::arithmetic_error;

    updated = *current + *value;
  }
  else
  {
    updated = *current > *value ? *current - *value : 0;
  }

  staged.set_allowance( *owner, *spender, updated );
  if( auto error = staged.commit(); error )
    return error;

  encode::byte_writer writer;
  writer.write( memory::as_bytes( *owner ) ).write( memory::as_bytes( *spender ) ).write( updated );
  if( auto error = system->event( "token.allowance", writer.data(), { *owner, *spender } ); error )
    return error;

  encode::byte_writer output;
  output.write( updated );
  return write_output( system, output );
}

std::error_code token::administer( system_interface* system, input& in, instruction i )
{
  token_store store( system );
  auto settings = require_settings( store );
  if( !settings )
    return settings.error();

  ledger::journal staged( store );
  ledger::reflection_ledger reflections( staged );
  ledger::exemption_registry registry( staged, reflections );

  switch( i )
  {
    case instruction::set_exempt:
    case instruction::set_excluded:
      {
        auto account = in.read_account();
        if( !account )
          return account.error();

        auto flag = in.read_bool();
        if( !flag )
          return flag.error();

        if( auto error = require_authority( system, settings->admin ); error )
          return error;

        auto status = i == instruction::set_exempt ? registry.set_tax_exempt( *account, *flag )
                                                   : registry.set_excluded( *account, *flag );
        if( status )
          return status;

        auto entry = registry.get( *account );
        if( !entry )
          return entry.error();

        if( auto error = staged.commit(); error )
          return error;

        return announce_exemption( system, *account, *entry );
      }
    case instruction::set_tax_rates:
      {
        auto rates = read_rates( in );
        if( !rates )
          return rates.error();

        if( auto error = require_authority( system, settings->admin ); error )
          return error;

        if( auto error = rates->validate(); error )
          return error;

        settings->rates = *rates;
        break;
      }
    case instruction::set_anti_whale:
      {
        auto limits = read_limits( in );
        if( !limits )
          return limits.error();

        if( auto error = require_authority( system, settings->admin ); error )
          return error;

        if( auto error = limits->validate(); error )
          return error;

        settings->limits = *limits;
        break;
      }
    case instruction::set_treasury:
      {
        auto account = in.read_account();
        if( !account )
          return account.error();

        if( auto error = require_authority( system, settings->admin ); error )
          return error;

        if( !account->program() )
          return program_errc::invalid_argument;

        if( auto error = registry.set_tax_exempt( *account, true ); error )
          return error;

        if( auto error = registry.set_excluded( *account, true ); error )
          return error;

        if( auto error = staged.commit(); error )
          return error;

        settings->treasury = *account;
        break;
      }
    default:
      std::unreachable();
  }

  if( auto error = store.save_settings( *settings ); error )
    return error;

  return announce_settings( system, *settings );
}

std::error_code token::initialize( system_interface* system, input& in )
{
  token_settings settings;

  auto name = in.read_string();
  if( !name )
    return name.error();

  auto symbol = in.read_string();
  if( !symbol )
    return symbol.error();

  auto decimals = in.read< std::uint8_t >();
  if( !decimals )
    return decimals.error();

  auto admin = in.read_account();
  if( !admin )
    return admin.error();

  auto treasury_id = in.read_account();
  if( !treasury_id )
    return treasury_id.error();

  auto rates = read_rates( in );
  if( !rates )
    return rates.error();

  auto limits = read_limits( in );
  if( !limits )
    return limits.error();

  auto mint_cap = in.read< std::uint64_t >();
  if( !mint_cap )
    return mint_cap.error();

  token_store store( system );
  auto existing = store.load_settings();
  if( !existing )
    return existing.error();

  if( *existing )
    return program_errc::already_initialized;

  if( auto error = require_authority( system, *admin ); error )
    return error;

  if( !treasury_id->program() )
    return program_errc::invalid_argument;

  if( auto error = rates->validate(); error )
    return error;

  if( auto error = limits->validate(); error )
    return error;

  settings.name     = std::move( *name );
  settings.symbol   = std::move( *symbol );
  settings.decimals = *decimals;
  settings.admin    = *admin;
  settings.treasury = *treasury_id;
  settings.rates    = *rates;
  settings.limits   = *limits;
  settings.mint_cap = *mint_cap;

  ledger::journal staged( store );
  ledger::reflection_ledger reflections( staged );
  ledger::exemption_registry registry( staged, reflections );

  if( auto error = registry.set_tax_exempt( settings.admin, true ); error )
    return error;

  if( auto error = registry.set_tax_exempt( settings.treasury, true ); error )
    return error;

  if( auto error = registry.set_excluded( settings.treasury, true ); error )
    return error;

  if( auto error = staged.commit(); error )
    return error;

  if( auto error = store.save_settings( settings ); error )
    return error;

  system->log( "token initialized: " + settings.symbol );
  return announce_settings( system, settings );
}

} // namespace reflecta::program

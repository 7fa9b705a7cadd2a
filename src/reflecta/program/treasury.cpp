#include <reflecta/program/treasury.hpp>

#include <algorithm>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include <reflecta/encode/hex.hpp>
#include <reflecta/ledger/error.hpp>
#include <reflecta/memory.hpp>
#include <reflecta/program/calls.hpp>
#include <reflecta/program/io.hpp>

namespace reflecta::program {

namespace {

constexpr std::uint32_t config_id    = 0;
constexpr std::uint32_t deposited_id = 1;

struct treasury_config
{
  protocol::account token{};
  protocol::account admin{};
};

result< std::optional< treasury_config > > load_config( system_interface* system )
{
  auto object = system->get_object( config_id, std::span< const std::byte >{} );
  if( object.empty() )
    return std::nullopt;

  encode::byte_reader reader( object );
  auto token = reader.read_array< protocol::account_length >();
  auto admin = reader.read_array< protocol::account_length >();
  if( !token || !admin || !reader.empty() )
    return std::unexpected( program_errc::unexpected_object );

  return treasury_config{ .token = protocol::make_account( *token ), .admin = protocol::make_account( *admin ) };
}

result< treasury_config > require_config( system_interface* system )
{
  auto config = load_config( system );
  if( !config )
    return std::unexpected( config.error() );

  if( !*config )
    return std::unexpected( program_errc::not_initialized );

  return **config;
}

std::uint64_t deposited_total( system_interface* system )
{
  auto object = system->get_object( deposited_id, std::span< const std::byte >{} );
  if( object.size() != sizeof( std::uint64_t ) )
    return 0;

  auto total = memory::bit_cast< std::uint64_t >( object );
  boost::endian::little_to_native_inplace( total );
  return total;
}

std::error_code require_token_caller( system_interface* system, const treasury_config& config )
{
  if( !std::ranges::equal( system->get_caller(), config.token ) )
    return program_errc::unauthorized;

  return program_errc::ok;
}

std::error_code require_admin( system_interface* system, const treasury_config& config )
{
  auto permitted = authorized( system, config.admin );
  if( !permitted )
    return permitted.error();

  if( !*permitted )
    return program_errc::unauthorized;

  return program_errc::ok;
}

std::error_code
pay( system_interface* system, const treasury_config& config, const protocol::account& to, std::uint64_t value )
{
  auto request = calls::token::transfer( protocol::make_account( system->get_program_id() ), to, value );

  if( auto output = system->call_program( config.token, request ); !output )
    return output.error();

  system->log( "treasury paid " + std::to_string( value ) + " to " + encode::to_hex( memory::as_bytes( to ) ) );
  return program_errc::ok;
}

} // namespace

std::error_code treasury::run( system_interface* system, std::span< const std::string > arguments )
{
  input in( system );

  auto selector = in.read< std::uint32_t >();
  if( !selector )
    return program_errc::invalid_instruction;

  switch( static_cast< instruction >( *selector ) )
  {
    case instruction::authorize:
      {
        encode::byte_writer writer;
        writer.write( false );
        return write_output( system, writer );
      }
    case instruction::receive:
      {
        auto config = require_config( system );
        if( !config )
          return config.error();

        if( auto error = require_token_caller( system, *config ); error )
          return error;

        auto sender = in.read_account();
        if( !sender )
          return sender.error();

        auto value = in.read< std::uint64_t >();
        if( !value )
          return value.error();

        if( auto payload = in.read_sized(); !payload )
          return payload.error();

        return program_errc::ok;
      }
    case instruction::initialize:
      return initialize( system, in );
    case instruction::deposit:
      return deposit( system, in );
    case instruction::deposited:
      {
        encode::byte_writer writer;
        writer.write( deposited_total( system ) );
        return write_output( system, writer );
      }
    case instruction::balance:
      return balance( system );
    case instruction::withdraw:
      return withdraw( system, in );
    case instruction::airdrop:
      return airdrop( system, in );
    case instruction::token:
    case instruction::admin:
      {
        auto config = require_config( system );
        if( !config )
          return config.error();

        encode::byte_writer writer;
        writer.write( memory::as_bytes( *selector == std::to_underlying( instruction::token ) ? config->token
                                                                                             : config->admin ) );
        return write_output( system, writer );
      }
  }

  return program_errc::invalid_instruction;
}

std::error_code treasury::initialize( system_interface* system, input& in )
{
  auto token_id = in.read_account();
  if( !token_id )
    return token_id.error();

  auto admin = in.read_account();
  if( !admin )
    return admin.error();

  auto existing = load_config( system );
  if( !existing )
    return existing.error();

  if( *existing )
    return program_errc::already_initialized;

  if( !token_id->program() )
    return program_errc::invalid_argument;

  if( auto error = require_admin( system, treasury_config{ .token = *token_id, .admin = *admin } ); error )
    return error;

  encode::byte_writer writer;
  writer.write( memory::as_bytes( *token_id ) ).write( memory::as_bytes( *admin ) );

  if( auto error = system->put_object( config_id, std::span< const std::byte >{}, writer.data() ); error )
    return error;

  return system->event( "treasury.initialize", writer.data(), { *admin } );
}

std::error_code treasury::deposit( system_interface* system, input& in )
{
  auto value = in.read< std::uint64_t >();
  if( !value )
    return value.error();

  auto config = require_config( system );
  if( !config )
    return config.error();

  if( auto error = require_token_caller( system, *config ); error )
    return error;

  if( !*value )
    return program_errc::ok;

  auto total = deposited_total( system );
  if( *value > std::numeric_limits< std::uint64_t >::max() - total )
    return ledger::ledger_errc::arithmetic_error;

  total += *value;

  encode::byte_writer object;
  object.write( total );
  if( auto error = system->put_object( deposited_id, std::span< const std::byte >{}, object.data() ); error )
    return error;

  encode::byte_writer writer;
  writer.write( *value ).write( total );
  return system->event( "treasury.deposit", writer.data() );
}

std::error_code treasury::balance( system_interface* system )
{
  auto config = require_config( system );
  if( !config )
    return config.error();

  auto request = calls::token::balance_of( protocol::make_account( system->get_program_id() ) );

  auto output = system->call_program( config->token, request );
  if( !output )
    return output.error();

  if( output->stdout.size() != sizeof( std::uint64_t ) )
    return program_errc::unexpected_object;

  return system->write( file_descriptor::stdout, output->stdout );
}

std::error_code treasury::withdraw( system_interface* system, input& in )
{
  auto to = in.read_account();
  if( !to )
    return to.error();

  auto value = in.read< std::uint64_t >();
  if( !value )
    return value.error();

  auto config = require_config( system );
  if( !config )
    return config.error();

  if( auto error = require_admin( system, *config ); error )
    return error;

  if( auto error = pay( system, *config, *to, *value ); error )
    return error;

  encode::byte_writer writer;
  writer.write( memory::as_bytes( *to ) ).write( *value );
  return system->event( "treasury.withdraw", writer.data(), { *to } );
}

std::error_code treasury::airdrop( system_interface* system, input& in )
{
  auto count = in.read< std::uint32_t >();
  if( !count )
    return count.error();

  if( !*count || *count > max_airdrop_recipients )
    return program_errc::invalid_argument;

  std::vector< protocol::account > recipients;
  recipients.reserve( *count );
  for( std::uint32_t n = 0; n < *count; ++n )
  {
    auto recipient = in.read_account();
    if( !recipient )
      return recipient.error();

    recipients.push_back( *recipient );
  }

  auto amount_each = in.read< std::uint64_t >();
  if( !amount_each )
    return amount_each.error();

  auto config = require_config( system );
  if( !config )
    return config.error();

  if( auto error = require_admin( system, *config ); error )
    return error;

  for( const auto& recipient: recipients )
  {
    if( auto error = pay( system, *config, recipient, *amount_each ); error )
      return error;
  }

  encode::byte_writer writer;
  writer.write( *count ).write( *amount_each );
  return system->event( "treasury.airdrop", writer.data(), recipients );
}

} // namespace reflecta::program

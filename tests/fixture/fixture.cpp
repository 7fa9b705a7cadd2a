// NOLINTBEGIN

#include <test/fixture.hpp>

#include <reflecta/encode.hpp>
#include <reflecta/log.hpp>
#include <reflecta/program/calls.hpp>

namespace test {

fixture::fixture( const std::string& name, const std::string& log_level )
{
  reflecta::log::initialize();
  reflecta::log::set_level( log_level );

  LOG_INFO( reflecta::log::instance(), "Setting up fixture: {}", name );

  _controller = std::make_unique< reflecta::controller::controller >();
  _controller->open();
}

fixture::~fixture()
{
  _controller->close();
}

reflecta::protocol::call_program fixture::make_call( const reflecta::protocol::account& id,
                                                     std::vector< std::byte >&& stdin ) const
{
  reflecta::protocol::call_program op;
  op.id          = id;
  op.input.stdin = std::move( stdin );
  return op;
}

reflecta::protocol::program_input fixture::make_input( std::vector< std::byte >&& stdin,
                                                       std::vector< std::string >&& arguments ) const noexcept
{
  reflecta::protocol::program_input input;
  input.stdin     = std::move( stdin );
  input.arguments = std::move( arguments );
  return input;
}

std::uint64_t fixture::read_amount( const reflecta::protocol::account& program, std::vector< std::byte >&& stdin ) const
{
  auto output = _controller->read_program( program, make_input( std::move( stdin ) ) );
  if( !output )
  {
    LOG_ERROR( reflecta::log::instance(), "Query has failed with: {}", output.error().message() );
    return 0;
  }

  reflecta::encode::byte_reader reader( output->stdout );
  auto value = reader.read< std::uint64_t >();
  if( !value || !reader.empty() )
  {
    LOG_ERROR( reflecta::log::instance(),
               "Query returned a malformed amount: {}",
               reflecta::log::hex{ output->stdout.data(), output->stdout.size() } );
    return 0;
  }

  return *value;
}

std::uint64_t fixture::balance_of( const reflecta::protocol::account& account ) const
{
  return read_amount( _token, reflecta::program::calls::token::balance_of( account ) );
}

std::uint64_t fixture::total_supply() const
{
  return read_amount( _token, reflecta::program::calls::token::total_supply() );
}

bool fixture::initialize( const reflecta::ledger::tax_rates& rates,
                          const reflecta::ledger::anti_whale_config& limits,
                          std::uint64_t mint_cap )
{
  namespace calls = reflecta::program::calls;

  return verify(
    _controller->process( make_transaction(
      { _admin },
      make_call( _treasury, calls::treasury::initialize( _token, _admin ) ),
      make_call( _token, calls::token::initialize( "Reflecta", "RFX", 8, _admin, _treasury, rates, limits, mint_cap ) ) ) ),
    verification::processed | verification::revision );
}

bool fixture::mint( const reflecta::protocol::account& to, std::uint64_t amount )
{
  return verify(
    _controller->process(
      make_transaction( { _admin }, make_call( _token, reflecta::program::calls::token::mint( to, amount ) ) ) ),
    verification::processed );
}

bool fixture::verify( reflecta::controller::result< reflecta::protocol::transaction_receipt > receipt,
                      std::uint64_t flags ) const
{
  if( flags == verification::none )
    return true;

  if( !receipt.has_value() )
  {
    LOG_ERROR( reflecta::log::instance(), "Transaction submission has failed with: {}", receipt.error().message() );
    return false;
  }

  if( flags & verification::revision )
  {
    if( receipt->revision != _controller->revision() )
    {
      LOG_ERROR( reflecta::log::instance(),
                 "Receipt revision {} does not match state revision {}",
                 receipt->revision,
                 _controller->revision() );
      return false;
    }
  }

  return true;
}

} // namespace test

// NOLINTEND

#include <cstdlib>
#include <iostream>
#include <print>
#include <ranges>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include <reflecta/config/genesis.hpp>
#include <reflecta/controller/controller.hpp>
#include <reflecta/encode/binary.hpp>
#include <reflecta/log.hpp>
#include <reflecta/program/calls.hpp>

namespace {

std::uint64_t query_amount( const reflecta::controller::controller& controller,
                            const reflecta::protocol::account& program,
                            std::vector< std::byte >&& stdin )
{
  reflecta::protocol::program_input input;
  input.stdin = std::move( stdin );

  auto output = controller.read_program( program, input );
  if( !output )
    throw std::runtime_error( "query failed: " + output.error().message() );

  reflecta::encode::byte_reader reader( output->stdout );
  auto value = reader.read< std::uint64_t >();
  if( !value )
    throw std::runtime_error( "query returned a malformed amount" );

  return *value;
}

} // namespace

auto main( int argc, char** argv ) -> int
{
  reflecta::log::initialize();

  boost::program_options::options_description options;

  // clang-format off
  options.add_options()
    ( "help,h"     , "Print this help message and exit" )
    ( "version,v"  , "Print version string and exit" )
    ( "config,c"   , boost::program_options::value< std::string >(), "The genesis YAML file describing the token ledger" )
    ( "log-level,l", boost::program_options::value< std::string >()->default_value( "info" ), "The log filtering level" );
  // clang-format on

  boost::program_options::variables_map args;

  try
  {
    boost::program_options::store( boost::program_options::parse_command_line( argc, argv, options ), args );
    boost::program_options::notify( args );
  }
  catch( const boost::program_options::error& e )
  {
    LOG_ERROR( reflecta::log::instance(), "Invalid argument: {}", e.what() );
    return EXIT_FAILURE;
  }

  if( args.count( "help" ) )
  {
    options.print( std::cout );
    return EXIT_SUCCESS;
  }

  if( args.count( "version" ) )
  {
    std::println( "v0.1.0" );
    return EXIT_SUCCESS;
  }

  if( !reflecta::log::set_level( args[ "log-level" ].as< std::string >() ) )
  {
    LOG_ERROR( reflecta::log::instance(), "Unknown log level: {}", args[ "log-level" ].as< std::string >() );
    return EXIT_FAILURE;
  }

  if( !args.count( "config" ) )
  {
    LOG_ERROR( reflecta::log::instance(), "A genesis file is required" );
    return EXIT_FAILURE;
  }

  const auto path = args[ "config" ].as< std::string >();
  auto genesis    = reflecta::config::load_genesis( path );
  if( !genesis )
  {
    LOG_ERROR( reflecta::log::instance(), "Could not load genesis file '{}': {}", path, genesis.error().message() );
    return EXIT_FAILURE;
  }

  LOG_INFO( reflecta::log::instance(),
            "Loaded {} ({}) - Tax: {} burn, {} reflect, {} treasury",
            genesis->name,
            genesis->symbol,
            reflecta::log::percent{ genesis->rates.burn, reflecta::ledger::basis_points },
            reflecta::log::percent{ genesis->rates.reflect, reflecta::ledger::basis_points },
            reflecta::log::percent{ genesis->rates.treasury, reflecta::ledger::basis_points } );

  reflecta::controller::controller controller;

  try
  {
    controller.open();

    for( const auto& transaction: reflecta::config::setup_transactions( *genesis ) )
    {
      if( auto receipt = controller.process( transaction ); !receipt )
      {
        LOG_ERROR( reflecta::log::instance(), "Genesis transaction failed: {}", receipt.error().message() );
        controller.close();
        return EXIT_FAILURE;
      }
    }

    std::size_t applied = 0;
    for( const auto& [ transaction, entry ]:
         std::views::zip( reflecta::config::transfer_transactions( *genesis ), genesis->transfers ) )
    {
      if( auto receipt = controller.process( transaction ); receipt )
      {
        ++applied;
        LOG_INFO( reflecta::log::instance(),
                  "Transfer {} -> {} of {} applied",
                  reflecta::log::account{ entry.from.data(), entry.from.size() },
                  reflecta::log::account{ entry.to.data(), entry.to.size() },
                  entry.amount );
      }
      else
      {
        LOG_WARNING( reflecta::log::instance(),
                     "Transfer {} -> {} of {} rejected: {}",
                     reflecta::log::account{ entry.from.data(), entry.from.size() },
                     reflecta::log::account{ entry.to.data(), entry.to.size() },
                     entry.amount,
                     receipt.error().message() );
      }
    }

    std::set< reflecta::protocol::account > holders{ genesis->admin, genesis->treasury };
    for( const auto& entry: genesis->balances )
      holders.insert( entry.account );

    for( const auto& entry: genesis->transfers )
    {
      holders.insert( entry.from );
      holders.insert( entry.to );
    }

    namespace calls = reflecta::program::calls;

    std::println( "{} transfer(s) applied, {} rejected", applied, genesis->transfers.size() - applied );
    std::println( "total supply: {}", query_amount( controller, genesis->token, calls::token::total_supply() ) );
    std::println( "treasury deposits: {}",
                  query_amount( controller, genesis->treasury, calls::treasury::deposited() ) );

    for( const auto& holder: holders )
    {
      auto name = holder | std::views::drop( 1 )
                  | std::views::take_while(
                    []( std::byte b )
                    {
                      return b != std::byte{ 0x00 };
                    } )
                  | std::views::transform(
                    []( std::byte b )
                    {
                      return std::to_integer< char >( b );
                    } )
                  | std::ranges::to< std::string >();

      std::println( "{:>32}: {}",
                    name,
                    query_amount( controller, genesis->token, calls::token::balance_of( holder ) ) );
    }
  }
  catch( const std::exception& e )
  {
    LOG_ERROR( reflecta::log::instance(), "An unexpected error has occurred: {}", e.what() );
    controller.close();
    return EXIT_FAILURE;
  }

  controller.close();
  return EXIT_SUCCESS;
}

#pragma once

#include <concepts>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <reflecta/controller/controller.hpp>
#include <reflecta/ledger/types.hpp>
#include <reflecta/protocol.hpp>

namespace test {

struct fixture
{
  fixture( const fixture& )            = delete;
  fixture( fixture&& )                 = delete;
  fixture& operator=( const fixture& ) = delete;
  fixture& operator=( fixture&& )      = delete;
  fixture( const std::string& name, const std::string& log_level );
  ~fixture();

  reflecta::protocol::call_program make_call( const reflecta::protocol::account& id,
                                              std::vector< std::byte >&& stdin ) const;

  template< Operation... Args >
  reflecta::protocol::transaction make_transaction( std::vector< reflecta::protocol::account > signers,
                                                    Args... args ) const
  {
    reflecta::protocol::transaction t;
    ( ( t.operations.emplace_back( std::forward< Args >( args ) ) ), ... );
    t.signers = std::move( signers );
    return t;
  }

  reflecta::protocol::program_input make_input( std::vector< std::byte >&& stdin,
                                                std::vector< std::string >&& arguments = {} ) const noexcept;

  /**
   * Runs a read-only query whose output is a single little-endian
   * 64 bit amount. Returns 0 and logs when the query fails.
   */
  std::uint64_t read_amount( const reflecta::protocol::account& program, std::vector< std::byte >&& stdin ) const;

  std::uint64_t balance_of( const reflecta::protocol::account& account ) const;
  std::uint64_t total_supply() const;

  /**
   * Initializes the treasury and the token with the admin as signer.
   */
  bool initialize( const reflecta::ledger::tax_rates& rates,
                   const reflecta::ledger::anti_whale_config& limits = {},
                   std::uint64_t mint_cap                           = 0 );

  bool mint( const reflecta::protocol::account& to, std::uint64_t amount );

  enum verification : std::uint_fast8_t
  {
    none      = 0,
    processed = 1 << 0,
    revision  = 1 << 1
  };

  bool verify( reflecta::controller::result< reflecta::protocol::transaction_receipt > receipt,
               std::uint64_t flags ) const;

  std::unique_ptr< reflecta::controller::controller > _controller;

  const reflecta::protocol::account _token    = reflecta::protocol::system_program( "token" );
  const reflecta::protocol::account _treasury = reflecta::protocol::system_program( "treasury" );
  const reflecta::protocol::account _admin    = reflecta::protocol::user_account( "admin" );
};

} // namespace test

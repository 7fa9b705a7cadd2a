#include <reflecta/program/calls.hpp>

#include <utility>

#include <reflecta/encode/binary.hpp>
#include <reflecta/memory.hpp>
#include <reflecta/program/token.hpp>
#include <reflecta/program/treasury.hpp>

namespace reflecta::program::calls {

namespace {

using token_instruction    = reflecta::program::token::instruction;
using treasury_instruction = reflecta::program::treasury::instruction;

template< typename Instruction >
encode::byte_writer request( Instruction i )
{
  encode::byte_writer writer;
  writer.write( std::to_underlying( i ) );
  return writer;
}

encode::byte_writer& write_account( encode::byte_writer& writer, const protocol::account& account )
{
  return writer.write( memory::as_bytes( account ) );
}

} // namespace

namespace token {

std::vector< std::byte > name()
{
  return request( token_instruction::name ).release();
}

std::vector< std::byte > symbol()
{
  return request( token_instruction::symbol ).release();
}

std::vector< std::byte > decimals()
{
  return request( token_instruction::decimals ).release();
}

std::vector< std::byte > total_supply()
{
  return request( token_instruction::total_supply ).release();
}

std::vector< std::byte > balance_of( const protocol::account& account )
{
  auto writer = request( token_instruction::balance_of );
  write_account( writer, account );
  return writer.release();
}

std::vector< std::byte > transfer( const protocol::account& from, const protocol::account& to, std::uint64_t value )
{
  auto writer = request( token_instruction::transfer );
  write_account( writer, from );
  write_account( writer, to ).write( value );
  return writer.release();
}

std::vector< std::byte > transfer_from( const protocol::account& spender,
                                        const protocol::account& owner,
                                        const protocol::account& to,
                                        std::uint64_t value )
{
  auto writer = request( token_instruction::transfer_from );
  write_account( writer, spender );
  write_account( writer, owner );
  write_account( writer, to ).write( value );
  return writer.release();
}

std::vector< std::byte > send( const protocol::account& from,
                               const protocol::account& to,
                               std::uint64_t value,
                               std::span< const std::byte > payload )
{
  auto writer = request( token_instruction::send );
  write_account( writer, from );
  write_account( writer, to ).write( value ).write_sized( payload );
  return writer.release();
}

std::vector< std::byte > send_from( const protocol::account& spender,
                                    const protocol::account& owner,
                                    const protocol::account& to,
                                    std::uint64_t value,
                                    std::span< const std::byte > payload )
{
  auto writer = request( token_instruction::send_from );
  write_account( writer, spender );
  write_account( writer, owner );
  write_account( writer, to ).write( value ).write_sized( payload );
  return writer.release();
}

std::vector< std::byte > mint( const protocol::account& to, std::uint64_t value )
{
  auto writer = request( token_instruction::mint );
  write_account( writer, to ).write( value );
  return writer.release();
}

std::vector< std::byte > burn( const protocol::account& from, std::uint64_t value )
{
  auto writer = request( token_instruction::burn );
  write_account( writer, from ).write( value );
  return writer.release();
}

std::vector< std::byte > allowance( const protocol::account& owner, const protocol::account& spender )
{
  auto writer = request( token_instruction::allowance );
  write_account( writer, owner );
  write_account( writer, spender );
  return writer.release();
}

std::vector< std::byte > approve( const protocol::account& owner, const protocol::account& spender, std::uint64_t value )
{
  auto writer = request( token_instruction::approve );
  write_account( writer, owner );
  write_account( writer, spender ).write( value );
  return writer.release();
}

std::vector< std::byte >
decrease_allowance( const protocol::account& owner, const protocol::account& spender, std::uint64_t value )
{
  auto writer = request( token_instruction::decrease_allowance );
  write_account( writer, owner );
  write_account( writer, spender ).write( value );
  return writer.release();
}

std::vector< std::byte > exemption( const protocol::account& account )
{
  auto writer = request( token_instruction::exemption );
  write_account( writer, account );
  return writer.release();
}

std::vector< std::byte > set_exempt( const protocol::account& account, bool exempt )
{
  auto writer = request( token_instruction::set_exempt );
  write_account( writer, account ).write( exempt );
  return writer.release();
}

std::vector< std::byte > set_excluded( const protocol::account& account, bool excluded )
{
  auto writer = request( token_instruction::set_excluded );
  write_account( writer, account ).write( excluded );
  return writer.release();
}

std::vector< std::byte > tax_rates()
{
  return request( token_instruction::tax_rates ).release();
}

std::vector< std::byte > set_tax_rates( const ledger::tax_rates& rates )
{
  auto writer = request( token_instruction::set_tax_rates );
  writer.write( rates.burn ).write( rates.reflect ).write( rates.treasury );
  return writer.release();
}

std::vector< std::byte > anti_whale()
{
  return request( token_instruction::anti_whale ).release();
}

std::vector< std::byte > set_anti_whale( const ledger::anti_whale_config& limits )
{
  auto writer = request( token_instruction::set_anti_whale );
  writer.write( limits.max_transaction.numerator ).write( limits.max_transaction.denominator );
  writer.write( limits.max_wallet.numerator ).write( limits.max_wallet.denominator );
  return writer.release();
}

std::vector< std::byte > set_treasury( const protocol::account& treasury )
{
  auto writer = request( token_instruction::set_treasury );
  write_account( writer, treasury );
  return writer.release();
}

std::vector< std::byte > quote_tax( std::uint64_t value )
{
  auto writer = request( token_instruction::quote_tax );
  writer.write( value );
  return writer.release();
}

std::vector< std::byte > reflection_state()
{
  return request( token_instruction::reflection_state ).release();
}

std::vector< std::byte > initialize( std::string_view name,
                                     std::string_view symbol,
                                     std::uint8_t decimals,
                                     const protocol::account& admin,
                                     const protocol::account& treasury,
                                     const ledger::tax_rates& rates,
                                     const ledger::anti_whale_config& limits,
                                     std::uint64_t mint_cap )
{
  auto writer = request( token_instruction::initialize );
  writer.write_sized( name ).write_sized( symbol ).write( decimals );
  write_account( writer, admin );
  write_account( writer, treasury );
  writer.write( rates.burn ).write( rates.reflect ).write( rates.treasury );
  writer.write( limits.max_transaction.numerator ).write( limits.max_transaction.denominator );
  writer.write( limits.max_wallet.numerator ).write( limits.max_wallet.denominator );
  writer.write( mint_cap );
  return writer.release();
}

} // namespace token

namespace treasury {

std::vector< std::byte > initialize( const protocol::account& token, const protocol::account& admin )
{
  auto writer = request( treasury_instruction::initialize );
  write_account( writer, token );
  write_account( writer, admin );
  return writer.release();
}

std::vector< std::byte > deposited()
{
  return request( treasury_instruction::deposited ).release();
}

std::vector< std::byte > balance()
{
  return request( treasury_instruction::balance ).release();
}

std::vector< std::byte > withdraw( const protocol::account& to, std::uint64_t value )
{
  auto writer = request( treasury_instruction::withdraw );
  write_account( writer, to ).write( value );
  return writer.release();
}

std::vector< std::byte > airdrop( std::span< const protocol::account > recipients, std::uint64_t amount_each )
{
  auto writer = request( treasury_instruction::airdrop );
  writer.write( static_cast< std::uint32_t >( recipients.size() ) );
  for( const auto& recipient: recipients )
    write_account( writer, recipient );

  writer.write( amount_each );
  return writer.release();
}

std::vector< std::byte > token()
{
  return request( treasury_instruction::token ).release();
}

std::vector< std::byte > admin()
{
  return request( treasury_instruction::admin ).release();
}

} // namespace treasury

} // namespace reflecta::program::calls

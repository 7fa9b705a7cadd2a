#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include <reflecta/ledger/types.hpp>
#include <reflecta/protocol/account.hpp>

/**
 * Builders for the stdin of token and treasury calls.
 */
namespace reflecta::program::calls {

namespace token {

std::vector< std::byte > name();
std::vector< std::byte > symbol();
std::vector< std::byte > decimals();
std::vector< std::byte > total_supply();
std::vector< std::byte > balance_of( const protocol::account& account );

std::vector< std::byte > transfer( const protocol::account& from, const protocol::account& to, std::uint64_t value );
std::vector< std::byte > transfer_from( const protocol::account& spender,
                                        const protocol::account& owner,
                                        const protocol::account& to,
                                        std::uint64_t value );
std::vector< std::byte > send( const protocol::account& from,
                               const protocol::account& to,
                               std::uint64_t value,
                               std::span< const std::byte > payload = {} );
std::vector< std::byte > send_from( const protocol::account& spender,
                                    const protocol::account& owner,
                                    const protocol::account& to,
                                    std::uint64_t value,
                                    std::span< const std::byte > payload = {} );

std::vector< std::byte > mint( const protocol::account& to, std::uint64_t value );
std::vector< std::byte > burn( const protocol::account& from, std::uint64_t value );

std::vector< std::byte > allowance( const protocol::account& owner, const protocol::account& spender );
std::vector< std::byte >
approve( const protocol::account& owner, const protocol::account& spender, std::uint64_t value );
std::vector< std::byte >
decrease_allowance( const protocol::account& owner, const protocol::account& spender, std::uint64_t value );

std::vector< std::byte > exemption( const protocol::account& account );
std::vector< std::byte > set_exempt( const protocol::account& account, bool exempt );
std::vector< std::byte > set_excluded( const protocol::account& account, bool excluded );

std::vector< std::byte > tax_rates();
std::vector< std::byte > set_tax_rates( const ledger::tax_rates& rates );
std::vector< std::byte > anti_whale();
std::vector< std::byte > set_anti_whale( const ledger::anti_whale_config& limits );
std::vector< std::byte > set_treasury( const protocol::account& treasury );
std::vector< std::byte > quote_tax( std::uint64_t value );
std::vector< std::byte > reflection_state();

std::vector< std::byte > initialize( std::string_view name,
                                     std::string_view symbol,
                                     std::uint8_t decimals,
                                     const protocol::account& admin,
                                     const protocol::account& treasury,
                                     const ledger::tax_rates& rates,
                                     const ledger::anti_whale_config& limits,
                                     std::uint64_t mint_cap = 0 );

} // namespace token

namespace treasury {

std::vector< std::byte > initialize( const protocol::account& token, const protocol::account& admin );
std::vector< std::byte > deposited();
std::vector< std::byte > balance();
std::vector< std::byte > withdraw( const protocol::account& to, std::uint64_t value );
std::vector< std::byte > airdrop( std::span< const protocol::account > recipients, std::uint64_t amount_each );
std::vector< std::byte > token();
std::vector< std::byte > admin();

} // namespace treasury

} // namespace reflecta::program::calls

#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include <boost/serialization/array.hpp>

namespace reflecta::protocol {

enum class account_type : std::uint8_t
{
  invalid        = 0,
  user           = 1,
  program        = 2,
  native_program = 3
};

constexpr std::size_t account_name_length = 32;
constexpr std::size_t account_length      = account_name_length + 1;

using account_bytes = std::array< std::byte, account_length >;

/**
 * An account is a type prefix byte followed by a 32 byte name.
 */
struct account: account_bytes
{
  bool user() const noexcept;
  bool program() const noexcept;
  account_type type() const noexcept;

  bool operator==( const account& ) const  = default;
  auto operator<=>( const account& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar& static_cast< account_bytes& >( *this );
  }
};

struct account_view: std::span< const std::byte, account_length >
{
  account_view( const account& ) noexcept;
  account_view( const std::byte*, std::size_t ) noexcept;

  bool user() const noexcept;
  bool program() const noexcept;
  account_type type() const noexcept;
};

account user_account( std::string_view name ) noexcept;
account system_program( std::string_view name ) noexcept;

/**
 * Copies a dynamically sized byte span into an account. Spans of the
 * wrong length yield an invalid account.
 */
account make_account( std::span< const std::byte > bytes ) noexcept;

} // namespace reflecta::protocol

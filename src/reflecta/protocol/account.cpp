#include <reflecta/protocol/account.hpp>

#include <algorithm>
#include <utility>

namespace reflecta::protocol {

constexpr auto user_account_prefix           = std::byte{ std::to_underlying( account_type::user ) };
constexpr auto program_account_prefix        = std::byte{ std::to_underlying( account_type::program ) };
constexpr auto native_program_account_prefix = std::byte{ std::to_underlying( account_type::native_program ) };

static account_type account_prefix_to_type( std::byte prefix ) noexcept
{
  switch( std::to_integer< std::uint8_t >( prefix ) )
  {
    case std::to_underlying( account_type::user ):
      return account_type::user;
    case std::to_underlying( account_type::program ):
      return account_type::program;
    case std::to_underlying( account_type::native_program ):
      return account_type::native_program;
    default:
      return account_type::invalid;
  }
  std::unreachable();
}

static bool is_program_prefix( std::byte prefix ) noexcept
{
  return prefix == program_account_prefix || prefix == native_program_account_prefix;
}

static account make_named_account( std::byte prefix, std::string_view name ) noexcept
{
  account a{};
  a.at( 0 ) = prefix;

  std::size_t length = std::min( name.length(), a.size() - 1 );
  for( std::size_t i = 0; i < length; ++i )
    a.at( i + 1 ) = static_cast< std::byte >( name[ i ] );

  return a;
}

bool account::user() const noexcept
{
  return front() == user_account_prefix;
}

bool account::program() const noexcept
{
  return is_program_prefix( front() );
}

account_type account::type() const noexcept
{
  return account_prefix_to_type( front() );
}

account_view::account_view( const account& acc ) noexcept:
    std::span< const std::byte, account_length >( acc )
{}

account_view::account_view( const std::byte* ptr, std::size_t length ) noexcept:
    std::span< const std::byte, account_length >( ptr, length )
{}

bool account_view::user() const noexcept
{
  return front() == user_account_prefix;
}

bool account_view::program() const noexcept
{
  return is_program_prefix( front() );
}

account_type account_view::type() const noexcept
{
  return account_prefix_to_type( front() );
}

account user_account( std::string_view name ) noexcept
{
  return make_named_account( user_account_prefix, name );
}

account system_program( std::string_view name ) noexcept
{
  return make_named_account( native_program_account_prefix, name );
}

account make_account( std::span< const std::byte > bytes ) noexcept
{
  account a{};
  if( bytes.size() == a.size() )
    std::ranges::copy( bytes, a.begin() );

  return a;
}

} // namespace reflecta::protocol

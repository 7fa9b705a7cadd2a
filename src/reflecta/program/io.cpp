#include <reflecta/program/io.hpp>

#include <algorithm>

namespace reflecta::program {

constexpr std::uint32_t max_sized_field = 64 * 1'024;

input::input( system_interface* system ) noexcept:
    _system( system )
{}

result< bool > input::read_bool()
{
  auto value = read< std::uint8_t >();
  if( !value )
    return std::unexpected( value.error() );

  if( *value > 1 )
    return std::unexpected( program_errc::invalid_argument );

  return *value == 1;
}

result< protocol::account > input::read_account()
{
  protocol::account account{};
  if( auto error = _system->read( file_descriptor::stdin, memory::as_writable_bytes( account ) ); error )
    return std::unexpected( program_errc::invalid_argument );

  if( account.type() == protocol::account_type::invalid )
    return std::unexpected( program_errc::invalid_argument );

  return account;
}

result< std::vector< std::byte > > input::read_sized()
{
  auto length = read< std::uint32_t >();
  if( !length )
    return std::unexpected( length.error() );

  if( *length > max_sized_field )
    return std::unexpected( program_errc::invalid_argument );

  std::vector< std::byte > bytes( *length );
  if( auto error = _system->read( file_descriptor::stdin, bytes ); error )
    return std::unexpected( program_errc::invalid_argument );

  return bytes;
}

result< std::string > input::read_string()
{
  auto bytes = read_sized();
  if( !bytes )
    return std::unexpected( bytes.error() );

  return std::string( memory::as_string_view( *bytes ) );
}

std::error_code write_output( system_interface* system, const encode::byte_writer& writer )
{
  return system->write( file_descriptor::stdout, writer.data() );
}

result< bool > authorized( system_interface* system, protocol::account_view account )
{
  if( std::ranges::equal( account, system->get_caller() ) )
    return true;

  return system->check_authority( account );
}

} // namespace reflecta::program

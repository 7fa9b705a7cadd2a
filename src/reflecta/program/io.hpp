#pragma once

#include <string>
#include <vector>

#include <boost/endian.hpp>

#include <reflecta/encode/binary.hpp>
#include <reflecta/memory.hpp>
#include <reflecta/program/system_interface.hpp>

namespace reflecta::program {

/**
 * Reads little-endian instruction fields from stdin. Malformed or
 * truncated input is reported as program_errc::invalid_argument.
 */
class input final
{
public:
  explicit input( system_interface* system ) noexcept;

  template< encode::fixed_integer T >
  result< T > read()
  {
    T t{};
    if( auto error = _system->read( file_descriptor::stdin, memory::as_writable_bytes( t ) ); error )
      return std::unexpected( program_errc::invalid_argument );

    boost::endian::little_to_native_inplace( t );
    return t;
  }

  result< bool > read_bool();
  result< protocol::account > read_account();
  result< std::vector< std::byte > > read_sized();
  result< std::string > read_string();

private:
  system_interface* _system;
};

std::error_code write_output( system_interface* system, const encode::byte_writer& writer );

/**
 * A program may act for an account when it is that account's caller, or
 * when the account's authority has been granted to the transaction.
 */
result< bool > authorized( system_interface* system, protocol::account_view account );

} // namespace reflecta::program

#pragma once

#include <algorithm>
#include <array>
#include <concepts>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <boost/endian.hpp>

#include <reflecta/encode/error.hpp>
#include <reflecta/memory.hpp>

namespace reflecta::encode {

template< typename T >
concept fixed_integer = std::integral< T > && !std::same_as< T, bool >;

/**
 * Appends little-endian fixed width fields to a growing byte buffer.
 */
class byte_writer final
{
public:
  template< fixed_integer T >
  byte_writer& write( T t )
  {
    boost::endian::native_to_little_inplace( t );
    return write( memory::as_bytes( t ) );
  }

  byte_writer& write( bool b );
  byte_writer& write( std::span< const std::byte > bytes );

  /**
   * Writes a 32 bit length prefix followed by the bytes.
   */
  byte_writer& write_sized( std::span< const std::byte > bytes );
  byte_writer& write_sized( std::string_view str );

  const std::vector< std::byte >& data() const noexcept;
  std::vector< std::byte > release() noexcept;

private:
  std::vector< std::byte > _buffer;
};

/**
 * Consumes fields written by byte_writer. Every read fails with
 * encode_errc::unexpected_end rather than reading past the input.
 */
class byte_reader final
{
public:
  explicit byte_reader( std::span< const std::byte > bytes ) noexcept;

  template< fixed_integer T >
  result< T > read() noexcept
  {
    auto bytes = read( sizeof( T ) );
    if( !bytes )
      return std::unexpected( bytes.error() );

    auto t = memory::bit_cast< T >( *bytes );
    boost::endian::little_to_native_inplace( t );
    return t;
  }

  result< bool > read_bool() noexcept;
  result< std::span< const std::byte > > read( std::size_t length ) noexcept;
  result< std::vector< std::byte > > read_sized() noexcept;
  result< std::string > read_string() noexcept;

  template< std::size_t N >
  result< std::array< std::byte, N > > read_array() noexcept
  {
    auto bytes = read( N );
    if( !bytes )
      return std::unexpected( bytes.error() );

    std::array< std::byte, N > a{};
    std::ranges::copy( *bytes, a.begin() );
    return a;
  }

  std::size_t remaining() const noexcept;
  bool empty() const noexcept;

private:
  std::span< const std::byte > _bytes;
  std::size_t _offset = 0;
};

} // namespace reflecta::encode

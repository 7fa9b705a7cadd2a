#pragma once

#include <algorithm>
#include <array>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <reflecta/encode/error.hpp>

namespace reflecta::encode {

/**
 * Hex strings are lowercase with a leading "0x" when written. Reading
 * accepts either case and an optional "0x" prefix.
 */
std::string to_hex( std::span< const std::byte > s ) noexcept;
result< std::vector< std::byte > > from_hex( std::string_view sv ) noexcept;

template< std::size_t N >
result< std::array< std::byte, N > > from_hex( std::string_view sv ) noexcept
{
  auto bytes = from_hex( sv );
  if( !bytes )
    return std::unexpected( bytes.error() );

  if( bytes->size() != N )
    return std::unexpected( encode_errc::invalid_length );

  std::array< std::byte, N > a{};
  std::ranges::copy( *bytes, a.begin() );
  return a;
}

} // namespace reflecta::encode

#include <reflecta/encode/binary.hpp>

#include <limits>

namespace reflecta::encode {

byte_writer& byte_writer::write( bool b )
{
  return write( static_cast< std::uint8_t >( b ? 1 : 0 ) );
}

byte_writer& byte_writer::write( std::span< const std::byte > bytes )
{
  _buffer.insert( _buffer.end(), bytes.begin(), bytes.end() );
  return *this;
}

byte_writer& byte_writer::write_sized( std::span< const std::byte > bytes )
{
  if( bytes.size() > std::numeric_limits< std::uint32_t >::max() )
    throw std::length_error( "sized field exceeds 32 bit length prefix" );

  write( static_cast< std::uint32_t >( bytes.size() ) );
  return write( bytes );
}

byte_writer& byte_writer::write_sized( std::string_view str )
{
  return write_sized( memory::as_bytes( str ) );
}

const std::vector< std::byte >& byte_writer::data() const noexcept
{
  return _buffer;
}

std::vector< std::byte > byte_writer::release() noexcept
{
  return std::move( _buffer );
}

byte_reader::byte_reader( std::span< const std::byte > bytes ) noexcept:
    _bytes( bytes )
{}

result< bool > byte_reader::read_bool() noexcept
{
  auto value = read< std::uint8_t >();
  if( !value )
    return std::unexpected( value.error() );

  if( *value > 1 )
    return std::unexpected( encode_errc::invalid_boolean );

  return *value == 1;
}

result< std::span< const std::byte > > byte_reader::read( std::size_t length ) noexcept
{
  if( remaining() < length )
    return std::unexpected( encode_errc::unexpected_end );

  auto bytes  = _bytes.subspan( _offset, length );
  _offset    += length;
  return bytes;
}

result< std::vector< std::byte > > byte_reader::read_sized() noexcept
{
  return read< std::uint32_t >()
    .and_then(
      [ this ]( std::uint32_t length )
      {
        return read( length );
      } )
    .transform(
      []( std::span< const std::byte > bytes )
      {
        return std::vector< std::byte >( bytes.begin(), bytes.end() );
      } );
}

result< std::string > byte_reader::read_string() noexcept
{
  return read_sized().transform(
    []( const std::vector< std::byte >& bytes )
    {
      return std::string( memory::as_string_view( bytes ) );
    } );
}

std::size_t byte_reader::remaining() const noexcept
{
  return _bytes.size() - _offset;
}

bool byte_reader::empty() const noexcept
{
  return remaining() == 0;
}

} // namespace reflecta::encode

#pragma once

#include <span>
#include <stdexcept>
#include <type_traits>

#include <quill/BinaryDataDeferredFormatCodec.h>
#include <quill/DeferredFormatCodec.h>

#include <reflecta/encode/hex.hpp>
#include <reflecta/memory.hpp>

namespace reflecta::log {

struct hex_tag
{};

using hex = quill::BinaryData< hex_tag >;

/**
 * Renders an account as its type prefix followed by the printable
 * portion of its name, falling back to hex for opaque bytes.
 */
struct account_tag
{};

using account = quill::BinaryData< account_tag >;

template< typename T1, typename T2 >
  requires std::is_integral_v< T1 > && std::is_integral_v< T2 >
struct percent
{
  T1 numerator;
  T2 denominator;
};

} // namespace reflecta::log

template<>
struct fmtquill::formatter< reflecta::log::hex >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const reflecta::log::hex& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                reflecta::encode::to_hex( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< reflecta::log::hex >: quill::BinaryDataDeferredFormatCodec< reflecta::log::hex >
{};

template<>
struct fmtquill::formatter< reflecta::log::account >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const reflecta::log::account& bin_data, format_context& ctx ) const
  {
    auto bytes = std::span( bin_data.data(), bin_data.size() );
    if( bytes.empty() )
      return fmtquill::format_to( ctx.out(), "<none>" );

    auto name = bytes.subspan( 1 );
    while( !name.empty() && name.back() == std::byte{ 0x00 } )
      name = name.first( name.size() - 1 );

    bool printable = !name.empty();
    for( auto b: name )
    {
      auto c = std::to_integer< unsigned char >( b );
      if( c < 0x20 || c > 0x7e )
      {
        printable = false;
        break;
      }
    }

    if( !printable )
      return fmtquill::format_to( ctx.out(), "{}", reflecta::encode::to_hex( bytes ) );

    return fmtquill::format_to( ctx.out(),
                                "{}:{}",
                                std::to_integer< unsigned int >( bytes.front() ),
                                reflecta::memory::as_string_view( name ) );
  }
};

template<>
struct quill::Codec< reflecta::log::account >: quill::BinaryDataDeferredFormatCodec< reflecta::log::account >
{};

template< typename T1, typename T2 >
struct fmtquill::formatter< reflecta::log::percent< T1, T2 > >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const reflecta::log::percent< T1, T2 >& p, format_context& ctx ) const
  {
    static constexpr auto one_hundred_percent = 100;

    if( !p.denominator )
      throw std::runtime_error( "percent formatter divide by zero" );

    auto percent = static_cast< double >( p.numerator ) / static_cast< double >( p.denominator ) * one_hundred_percent;
    return fmtquill::format_to( ctx.out(), "{}%", percent );
  }
};

template< typename T1, typename T2 >
struct quill::Codec< reflecta::log::percent< T1, T2 > >: quill::DeferredFormatCodec< reflecta::log::percent< T1, T2 > >
{};

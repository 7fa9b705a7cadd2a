#include <gtest/gtest.h>

#include <reflecta/encode/hex.hpp>
#include <reflecta/memory/memory.hpp>

using namespace std::string_view_literals;

constexpr std::array< std::uint8_t, 6 > data{ 4, 8, 15, 16, 23, 42 };
constexpr auto valid_hex_str = "0x04080f10172a"sv;

TEST( hex, encode )
{
  auto encoded_data = reflecta::encode::to_hex( reflecta::memory::as_bytes( data ) );

  EXPECT_EQ( encoded_data, valid_hex_str );
  EXPECT_EQ( reflecta::encode::to_hex( {} ), "0x" );
}

TEST( hex, decode )
{
  auto decoded_data = reflecta::encode::from_hex( valid_hex_str );

  ASSERT_TRUE( decoded_data );
  EXPECT_TRUE( std::ranges::equal( *decoded_data, reflecta::memory::as_bytes( data ) ) );

  decoded_data = reflecta::encode::from_hex( valid_hex_str.substr( 2 ) );
  ASSERT_TRUE( decoded_data );
  EXPECT_TRUE( std::ranges::equal( *decoded_data, reflecta::memory::as_bytes( data ) ) );

  decoded_data = reflecta::encode::from_hex( ""sv );
  ASSERT_TRUE( decoded_data );
  EXPECT_TRUE( decoded_data->empty() );

  decoded_data = reflecta::encode::from_hex( valid_hex_str.substr( 3 ) );
  if( decoded_data )
    ADD_FAILURE() << "hex decode erroneously succeeded";
  else
    EXPECT_EQ( decoded_data.error(), reflecta::encode::encode_errc::invalid_length );

  decoded_data = reflecta::encode::from_hex( "0x0g"sv );
  if( decoded_data )
    ADD_FAILURE() << "hex decode erroneously succeeded";
  else
  {
    EXPECT_EQ( decoded_data.error(), reflecta::encode::encode_errc::invalid_character );
    EXPECT_EQ( decoded_data.error().message(), "invalid character" );
  }
}

TEST( hex, decode_fixed )
{
  auto decoded_array = reflecta::encode::from_hex< data.size() >( valid_hex_str );
  ASSERT_TRUE( decoded_array );
  EXPECT_TRUE( std::ranges::equal( *decoded_array, reflecta::memory::as_bytes( data ) ) );

  auto short_array = reflecta::encode::from_hex< data.size() + 1 >( valid_hex_str );
  ASSERT_FALSE( short_array );
  EXPECT_EQ( short_array.error(), reflecta::encode::encode_errc::invalid_length );

  auto invalid_array = reflecta::encode::from_hex< 1 >( "0xzz"sv );
  ASSERT_FALSE( invalid_array );
  EXPECT_EQ( invalid_array.error(), reflecta::encode::encode_errc::invalid_character );
}

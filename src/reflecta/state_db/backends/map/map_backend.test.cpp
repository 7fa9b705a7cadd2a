// NOLINTBEGIN

#include <gtest/gtest.h>

#include <reflecta/state_db/backends/map/map_backend.hpp>

TEST( map_backend, crud )
{
  reflecta::state_db::backends::map::map_backend backend( 3 );
  EXPECT_EQ( backend.revision(), 3 );
  EXPECT_TRUE( backend.empty() );

  std::vector< std::byte > key{ std::byte{ 0x01 } }, value{ std::byte{ 0x10 }, std::byte{ 0x11 } };
  EXPECT_EQ( backend.put( std::vector< std::byte >( key ), std::vector< std::byte >( value ) ), 3 );
  EXPECT_EQ( backend.size(), 1 );

  auto stored = backend.get( key );
  ASSERT_TRUE( stored );
  EXPECT_TRUE( std::ranges::equal( *stored, value ) );

  EXPECT_EQ( backend.put( std::vector< std::byte >( key ), std::vector< std::byte >{ std::byte{ 0x12 } } ), -1 );
  EXPECT_EQ( backend.remove( key ), -2 );
  EXPECT_EQ( backend.remove( key ), 0 );
  EXPECT_FALSE( backend.get( key ) );
}

TEST( map_backend, drain_in_key_order )
{
  reflecta::state_db::backends::map::map_backend backend;

  backend.put( { std::byte{ 0x03 } }, { std::byte{ 0x30 } } );
  backend.put( { std::byte{ 0x01 } }, { std::byte{ 0x10 } } );
  backend.put( { std::byte{ 0x02 } }, { std::byte{ 0x20 } } );

  std::vector< std::byte > keys;
  backend.drain(
    [ & ]( std::vector< std::byte >&& key, std::vector< std::byte >&& value )
    {
      ASSERT_EQ( key.size(), 1 );
      keys.push_back( key.front() );
    } );

  EXPECT_EQ( keys, ( std::vector< std::byte >{ std::byte{ 0x01 }, std::byte{ 0x02 }, std::byte{ 0x03 } } ) );
  EXPECT_TRUE( backend.empty() );
}

// NOLINTEND

// NOLINTBEGIN

#include <gtest/gtest.h>

#include <reflecta/state_db/state_delta.hpp>

namespace {

std::vector< std::byte > bytes( std::initializer_list< std::uint8_t > values )
{
  std::vector< std::byte > v;
  for( auto value: values )
    v.push_back( std::byte{ value } );
  return v;
}

bool holds( const std::shared_ptr< reflecta::state_db::state_delta >& delta,
            const std::vector< std::byte >& key,
            const std::vector< std::byte >& expected )
{
  auto value = delta->get( key );
  return value && std::ranges::equal( *value, expected );
}

} // namespace

TEST( state_delta, crud )
{
  auto delta = std::make_shared< reflecta::state_db::state_delta >();
  EXPECT_TRUE( delta->root() );
  EXPECT_EQ( delta->revision(), 0 );

  auto key_1 = bytes( { 0x01 } ), value_1 = bytes( { 0x10 } );
  EXPECT_EQ( delta->put( std::vector< std::byte >( key_1 ), value_1 ), 2 );
  EXPECT_TRUE( holds( delta, key_1, value_1 ) );

  auto value_1a = bytes( { 0x10, 0x11, 0x12 } );
  EXPECT_EQ( delta->put( std::vector< std::byte >( key_1 ), value_1a ), 2 );
  EXPECT_TRUE( holds( delta, key_1, value_1a ) );

  EXPECT_EQ( delta->remove( std::vector< std::byte >( key_1 ) ), -4 );
  EXPECT_FALSE( delta->get( key_1 ) );
  EXPECT_EQ( delta->remove( std::vector< std::byte >( key_1 ) ), 0 );

  EXPECT_THROW( delta->squash(), std::runtime_error );
}

TEST( state_delta, child_shadows_parent )
{
  auto root = std::make_shared< reflecta::state_db::state_delta >();
  root->set_revision( 4 );

  auto key_1 = bytes( { 0x01 } ), key_2 = bytes( { 0x02 } );
  auto value_1 = bytes( { 0x10 } ), value_2 = bytes( { 0x20 } ), value_1a = bytes( { 0x11, 0x12 } );

  root->put( std::vector< std::byte >( key_1 ), value_1 );
  root->put( std::vector< std::byte >( key_2 ), value_2 );

  auto child = root->make_child();
  EXPECT_FALSE( child->root() );
  EXPECT_EQ( child->parent(), root );
  EXPECT_EQ( child->revision(), 4 );
  EXPECT_TRUE( holds( child, key_1, value_1 ) );

  EXPECT_EQ( child->put( std::vector< std::byte >( key_1 ), value_1a ), 1 );
  EXPECT_TRUE( holds( child, key_1, value_1a ) );
  EXPECT_TRUE( holds( root, key_1, value_1 ) );

  EXPECT_EQ( child->remove( std::vector< std::byte >( key_2 ) ), -2 );
  EXPECT_TRUE( child->removed( key_2 ) );
  EXPECT_FALSE( child->get( key_2 ) );
  EXPECT_TRUE( holds( root, key_2, value_2 ) );

  // Writing a removed key resurrects it
  EXPECT_EQ( child->put( std::vector< std::byte >( key_2 ), value_2 ), 2 );
  EXPECT_FALSE( child->removed( key_2 ) );
  EXPECT_TRUE( holds( child, key_2, value_2 ) );
}

TEST( state_delta, squash )
{
  auto root = std::make_shared< reflecta::state_db::state_delta >();

  auto key_1 = bytes( { 0x01 } ), key_2 = bytes( { 0x02 } ), key_3 = bytes( { 0x03 } );
  auto value_1 = bytes( { 0x10 } ), value_2 = bytes( { 0x20 } ), value_3 = bytes( { 0x30 } );

  root->put( std::vector< std::byte >( key_1 ), value_1 );
  root->put( std::vector< std::byte >( key_2 ), value_2 );

  auto child      = root->make_child();
  auto grandchild = child->make_child();

  grandchild->remove( std::vector< std::byte >( key_1 ) );
  grandchild->put( std::vector< std::byte >( key_3 ), value_3 );

  grandchild->squash();
  EXPECT_TRUE( grandchild->squashed() );
  EXPECT_THROW( grandchild->put( std::vector< std::byte >( key_1 ), value_1 ), std::runtime_error );

  EXPECT_FALSE( child->get( key_1 ) );
  EXPECT_TRUE( child->removed( key_1 ) );
  EXPECT_TRUE( holds( child, key_3, value_3 ) );
  EXPECT_TRUE( holds( root, key_1, value_1 ) );
  EXPECT_FALSE( root->get( key_3 ) );

  child->squash();
  EXPECT_FALSE( root->get( key_1 ) );
  EXPECT_TRUE( holds( root, key_2, value_2 ) );
  EXPECT_TRUE( holds( root, key_3, value_3 ) );
}

TEST( state_delta, discarded_child )
{
  auto root = std::make_shared< reflecta::state_db::state_delta >();
  auto key  = bytes( { 0x01 } );

  {
    auto child = root->make_child();
    child->put( std::vector< std::byte >( key ), bytes( { 0xff } ) );
  }

  EXPECT_FALSE( root->get( key ) );
}

// NOLINTEND

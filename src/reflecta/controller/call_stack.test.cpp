#include <gtest/gtest.h>

#include <stdexcept>

#include <reflecta/controller/call_stack.hpp>

using namespace reflecta;

TEST( call_stack, frames )
{
  controller::call_stack stack;
  EXPECT_EQ( stack.size(), 0 );
  EXPECT_THROW( stack.peek_frame(), std::runtime_error );
  EXPECT_THROW( stack.pop_frame(), std::runtime_error );
  EXPECT_EQ( stack.caller(), nullptr );

  ASSERT_FALSE( stack.push_frame( { .program_id = protocol::system_program( "token" ) } ) );
  ASSERT_FALSE( stack.push_frame( { .program_id = protocol::system_program( "treasury" ) } ) );
  EXPECT_EQ( stack.size(), 2 );

  EXPECT_EQ( stack.peek_frame().program_id, protocol::system_program( "treasury" ) );
  EXPECT_EQ( stack.peek_frame( 1 ).program_id, protocol::system_program( "token" ) );
  EXPECT_THROW( stack.peek_frame( 2 ), std::runtime_error );

  ASSERT_NE( stack.caller(), nullptr );
  EXPECT_EQ( *stack.caller(), protocol::system_program( "token" ) );

  stack.peek_frame().stdout.push_back( std::byte{ 0x2a } );

  auto frame = stack.pop_frame();
  EXPECT_EQ( frame.program_id, protocol::system_program( "treasury" ) );
  ASSERT_EQ( frame.stdout.size(), 1 );
  EXPECT_EQ( stack.size(), 1 );

  {
    ASSERT_FALSE( stack.push_frame( { .program_id = protocol::system_program( "vault" ) } ) );
    controller::frame_guard guard( stack );
    EXPECT_EQ( stack.size(), 2 );
  }

  EXPECT_EQ( stack.size(), 1 );
}

TEST( call_stack, overflow )
{
  controller::call_stack stack( 2 );

  ASSERT_FALSE( stack.push_frame( {} ) );
  ASSERT_FALSE( stack.push_frame( {} ) );

  auto error = stack.push_frame( {} );
  EXPECT_EQ( error, controller::reversion_errc::stack_overflow );
  EXPECT_EQ( error.message(), "stack overflow" );
  EXPECT_EQ( stack.size(), 2 );
}

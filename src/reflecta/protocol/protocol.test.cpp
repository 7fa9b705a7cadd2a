// NOLINTBEGIN

#include <sstream>

#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>
#include <gtest/gtest.h>

#include <reflecta/protocol.hpp>

TEST( protocol, accounts )
{
  auto alice = reflecta::protocol::user_account( "alice" );
  EXPECT_TRUE( alice.user() );
  EXPECT_FALSE( alice.program() );
  EXPECT_EQ( alice.type(), reflecta::protocol::account_type::user );
  EXPECT_EQ( alice.at( 1 ), std::byte{ 'a' } );
  EXPECT_EQ( alice.at( 6 ), std::byte{ 0x00 } );

  auto token = reflecta::protocol::system_program( "token" );
  EXPECT_TRUE( token.program() );
  EXPECT_EQ( token.type(), reflecta::protocol::account_type::native_program );

  reflecta::protocol::account_view view( token );
  EXPECT_TRUE( view.program() );
  EXPECT_EQ( view.type(), reflecta::protocol::account_type::native_program );

  EXPECT_NE( reflecta::protocol::user_account( "token" ), token );
  EXPECT_LT( reflecta::protocol::user_account( "a" ), reflecta::protocol::user_account( "b" ) );

  EXPECT_EQ( reflecta::protocol::make_account( view ), token );
  EXPECT_EQ( reflecta::protocol::make_account( std::span( token ).first( 4 ) ).type(),
             reflecta::protocol::account_type::invalid );
}

TEST( protocol, transaction_validation )
{
  reflecta::protocol::transaction trx;
  EXPECT_FALSE( trx.validate() );

  reflecta::protocol::call_program op;
  op.id = reflecta::protocol::system_program( "token" );
  trx.operations.push_back( op );
  trx.signers.push_back( reflecta::protocol::user_account( "alice" ) );
  EXPECT_TRUE( trx.validate() );

  trx.signers.push_back( reflecta::protocol::system_program( "treasury" ) );
  EXPECT_FALSE( trx.validate() );
  trx.signers.pop_back();

  op.id = reflecta::protocol::user_account( "bob" );
  trx.operations.push_back( op );
  EXPECT_FALSE( trx.validate() );
}

TEST( protocol, receipt_archive )
{
  reflecta::protocol::transaction_receipt receipt;
  receipt.revision = 7;
  receipt.logs.push_back( "hello" );

  reflecta::protocol::event event;
  event.sequence = 1;
  event.source   = reflecta::protocol::system_program( "token" );
  event.name     = "token.transfer";
  event.data     = { std::byte{ 0x01 }, std::byte{ 0x02 } };
  event.impacted.push_back( reflecta::protocol::user_account( "alice" ) );
  receipt.events.push_back( event );

  auto frame    = std::make_shared< reflecta::protocol::program_frame >();
  frame->id     = reflecta::protocol::system_program( "token" );
  frame->depth  = 1;
  frame->stdout = { std::byte{ 0x2a } };
  receipt.frames.push_back( frame );

  std::stringstream stream;
  {
    boost::archive::binary_oarchive oa( stream );
    oa << receipt;
  }

  reflecta::protocol::transaction_receipt restored;
  {
    boost::archive::binary_iarchive ia( stream );
    ia >> restored;
  }

  EXPECT_EQ( restored.revision, 7 );
  ASSERT_EQ( restored.logs.size(), 1 );
  EXPECT_EQ( restored.logs.front(), "hello" );
  ASSERT_EQ( restored.events.size(), 1 );
  EXPECT_EQ( restored.events.front().name, "token.transfer" );
  EXPECT_EQ( restored.events.front().source, event.source );
  EXPECT_EQ( restored.events.front().impacted, event.impacted );
  EXPECT_EQ( restored.events.front().data, event.data );
  ASSERT_EQ( restored.frames.size(), 1 );
  ASSERT_TRUE( restored.frames.front() );
  EXPECT_EQ( restored.frames.front()->id, frame->id );
  EXPECT_EQ( restored.frames.front()->depth, 1 );
  EXPECT_EQ( restored.frames.front()->stdout, frame->stdout );
}

// NOLINTEND

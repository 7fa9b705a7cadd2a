// NOLINTBEGIN

#include <gtest/gtest.h>

#include <limits>

#include <reflecta/ledger/journal.hpp>
#include <reflecta/ledger/memory_store.hpp>
#include <reflecta/ledger/reflection_ledger.hpp>

using reflecta::ledger::amount;
using reflecta::ledger::ledger_errc;
using reflecta::ledger::reflected_amount;
using reflecta::ledger::reflection_ledger;

class reflection_ledger_test: public ::testing::Test
{
protected:
  reflecta::ledger::memory_store store;
  reflecta::ledger::journal staged{ store };
  reflection_ledger ledger{ staged };

  const reflecta::ledger::address alice = reflecta::protocol::user_account( "alice" );
  const reflecta::ledger::address bob   = reflecta::protocol::user_account( "bob" );
  const reflecta::ledger::address carol = reflecta::protocol::user_account( "carol" );

  amount balance( const reflecta::ledger::address& account )
  {
    auto value = ledger.balance_of( account );
    EXPECT_TRUE( value ) << value.error().message();
    return value.value_or( 0 );
  }

  void seed()
  {
    ASSERT_FALSE( ledger.mint( alice, 600 ) );
    ASSERT_FALSE( ledger.mint( bob, 400 ) );
    ASSERT_FALSE( staged.commit() );
  }
};

TEST_F( reflection_ledger_test, mint )
{
  seed();

  EXPECT_EQ( balance( alice ), 600 );
  EXPECT_EQ( balance( bob ), 400 );
  EXPECT_EQ( balance( carol ), 0 );

  auto state = ledger.state();
  ASSERT_TRUE( state );
  EXPECT_EQ( state->total_supply, 1'000 );
  EXPECT_EQ( state->total_excluded, 0 );
  EXPECT_EQ( state->total_reflected, reflected_amount( 1'000 ) * reflection_ledger::initial_rate );

  EXPECT_EQ( ledger.mint( carol, std::numeric_limits< amount >::max() ), ledger_errc::arithmetic_error );
}

TEST_F( reflection_ledger_test, debit_and_credit )
{
  seed();

  ASSERT_FALSE( ledger.debit( alice, 300 ) );
  EXPECT_EQ( staged.in_flight(), 300 );

  // Tokens in flight cannot be committed
  EXPECT_EQ( staged.commit(), ledger_errc::arithmetic_error );

  ASSERT_FALSE( ledger.credit( carol, 300 ) );
  EXPECT_EQ( staged.in_flight(), 0 );
  ASSERT_FALSE( staged.commit() );

  EXPECT_EQ( balance( alice ), 300 );
  EXPECT_EQ( balance( bob ), 400 );
  EXPECT_EQ( balance( carol ), 300 );
}

TEST_F( reflection_ledger_test, insufficient_balance )
{
  seed();

  EXPECT_EQ( ledger.debit( alice, 601 ), ledger_errc::insufficient_balance );
  EXPECT_EQ( ledger.debit( carol, 1 ), ledger_errc::insufficient_balance );
  EXPECT_EQ( staged.in_flight(), 0 );

  // Credits and burns need tokens in flight
  EXPECT_EQ( ledger.credit( carol, 1 ), ledger_errc::arithmetic_error );
  EXPECT_EQ( ledger.burn( 1 ), ledger_errc::arithmetic_error );
  EXPECT_EQ( ledger.reflect( 1 ), ledger_errc::arithmetic_error );
}

TEST_F( reflection_ledger_test, burn )
{
  seed();

  ASSERT_FALSE( ledger.debit( alice, 100 ) );
  ASSERT_FALSE( ledger.burn( 100 ) );
  ASSERT_FALSE( staged.commit() );

  EXPECT_EQ( balance( alice ), 500 );
  EXPECT_EQ( balance( bob ), 400 );

  auto supply = ledger.total_supply();
  ASSERT_TRUE( supply );
  EXPECT_EQ( *supply, 900 );
}

TEST_F( reflection_ledger_test, reflect_raises_every_included_balance )
{
  seed();
  ASSERT_FALSE( ledger.mint( carol, 1 ) );
  ASSERT_FALSE( ledger.set_excluded( carol, true ) );
  ASSERT_FALSE( staged.commit() );

  auto reflected_before = ledger.state()->total_reflected;

  ASSERT_FALSE( ledger.debit( alice, 100 ) );
  ASSERT_FALSE( ledger.reflect( 100 ) );
  ASSERT_FALSE( staged.commit() );

  // 500 and 400 reflected shares over a circulating supply of 1000
  EXPECT_EQ( balance( alice ), 555 );
  EXPECT_EQ( balance( bob ), 444 );
  EXPECT_EQ( balance( carol ), 1 );

  // The sender's reflected units are gone, nobody received any
  EXPECT_EQ( ledger.state()->total_reflected,
             reflected_before - reflected_amount( 100 ) * reflection_ledger::initial_rate );
  EXPECT_EQ( ledger.state()->total_supply, 1'001 );
}

TEST_F( reflection_ledger_test, reflect_without_holders )
{
  ASSERT_FALSE( ledger.set_excluded( alice, true ) );
  ASSERT_FALSE( ledger.mint( alice, 100 ) );
  ASSERT_FALSE( ledger.debit( alice, 10 ) );

  EXPECT_EQ( ledger.reflect( 10 ), ledger_errc::arithmetic_error );
}

TEST_F( reflection_ledger_test, exclude_and_include )
{
  seed();

  ASSERT_FALSE( ledger.set_excluded( bob, true ) );
  ASSERT_FALSE( staged.commit() );

  auto excluded = ledger.is_excluded( bob );
  ASSERT_TRUE( excluded );
  EXPECT_TRUE( *excluded );
  EXPECT_EQ( balance( bob ), 400 );
  EXPECT_EQ( ledger.reflected_of( bob ).value(), 0 );
  EXPECT_EQ( ledger.state()->total_excluded, 400 );
  EXPECT_EQ( ledger.state()->total_reflected, reflected_amount( 600 ) * reflection_ledger::initial_rate );

  // Excluding twice changes nothing
  ASSERT_FALSE( ledger.set_excluded( bob, true ) );
  EXPECT_EQ( ledger.state()->total_excluded, 400 );

  // Reflections skip excluded holders
  ASSERT_FALSE( ledger.debit( alice, 100 ) );
  ASSERT_FALSE( ledger.reflect( 100 ) );
  ASSERT_FALSE( staged.commit() );

  EXPECT_EQ( balance( alice ), 600 );
  EXPECT_EQ( balance( bob ), 400 );

  ASSERT_FALSE( ledger.set_excluded( bob, false ) );
  ASSERT_FALSE( staged.commit() );

  // Including converts at the current rate, rounding down
  EXPECT_EQ( ledger.state()->total_excluded, 0 );
  EXPECT_EQ( balance( alice ), 600 );
  EXPECT_EQ( balance( bob ), 399 );
}

TEST_F( reflection_ledger_test, exclude_round_trip_after_reflection )
{
  seed();

  ASSERT_FALSE( ledger.debit( alice, 100 ) );
  ASSERT_FALSE( ledger.reflect( 100 ) );
  ASSERT_FALSE( staged.commit() );

  auto before = balance( bob );
  ASSERT_EQ( before, 444 );

  ASSERT_FALSE( ledger.set_excluded( bob, true ) );
  ASSERT_FALSE( ledger.set_excluded( bob, false ) );
  ASSERT_FALSE( staged.commit() );

  auto after = balance( bob );
  EXPECT_LE( after, before + 1 );
  EXPECT_GE( after + 1, before );

  auto state = ledger.state();
  ASSERT_TRUE( state );
  EXPECT_LE( balance( alice ) + after, state->total_supply );
}

TEST_F( reflection_ledger_test, discard )
{
  seed();

  ASSERT_FALSE( ledger.debit( alice, 100 ) );
  ASSERT_FALSE( ledger.credit( bob, 100 ) );
  EXPECT_TRUE( staged.dirty() );

  staged.discard();
  EXPECT_FALSE( staged.dirty() );

  EXPECT_EQ( balance( alice ), 600 );
  EXPECT_EQ( balance( bob ), 400 );
}

// NOLINTEND

#include <reflecta/ledger/reflection_ledger.hpp>

#include <limits>

namespace reflecta::ledger {

using wide_amount = boost::multiprecision::uint256_t;

const reflected_amount reflection_ledger::initial_rate = reflected_amount( 1 ) << 64;

reflection_ledger::reflection_ledger( journal& staged ) noexcept:
    _journal( staged )
{}

result< amount > reflection_ledger::circulating( const global_state& state ) const
{
  if( state.total_excluded > state.total_supply )
    return std::unexpected( ledger_errc::arithmetic_error );

  auto included_supply = state.total_supply - state.total_excluded;

  if( _journal.in_flight() > included_supply )
    return std::unexpected( ledger_errc::arithmetic_error );

  return included_supply - _journal.in_flight();
}

result< reflected_amount >
reflection_ledger::to_reflected( const global_state& state, amount value, bool round_up ) const
{
  if( !state.total_reflected )
    return reflected_amount( value ) * initial_rate;

  auto supply = circulating( state );
  if( !supply )
    return std::unexpected( supply.error() );

  if( !*supply )
    return std::unexpected( ledger_errc::arithmetic_error );

  wide_amount numerator = wide_amount( value ) * wide_amount( state.total_reflected );
  wide_amount quotient  = numerator / *supply;

  if( round_up && quotient * *supply != numerator )
    ++quotient;

  if( quotient > wide_amount( std::numeric_limits< reflected_amount >::max() ) )
    return std::unexpected( ledger_errc::arithmetic_error );

  return reflected_amount( quotient );
}

result< amount > reflection_ledger::to_true( const global_state& state, const reflected_amount& reflected ) const
{
  if( !reflected )
    return 0;

  if( !state.total_reflected )
    return std::unexpected( ledger_errc::arithmetic_error );

  auto supply = circulating( state );
  if( !supply )
    return std::unexpected( supply.error() );

  wide_amount quotient = wide_amount( reflected ) * *supply / wide_amount( state.total_reflected );

  if( quotient > std::numeric_limits< amount >::max() )
    return std::unexpected( ledger_errc::arithmetic_error );

  return static_cast< amount >( quotient );
}

result< global_state > reflection_ledger::state()
{
  return _journal.global();
}

result< amount > reflection_ledger::total_supply()
{
  auto state = _journal.global();
  if( !state )
    return std::unexpected( state.error() );

  return state->total_supply;
}

result< amount > reflection_ledger::balance_of( const address& account )
{
  auto state = _journal.global();
  if( !state )
    return std::unexpected( state.error() );

  auto record = _journal.account( account );
  if( !record )
    return std::unexpected( record.error() );

  if( const auto* holder = std::get_if< excluded >( &*record ) )
    return holder->balance;

  return to_true( *state, std::get< included >( *record ).reflected );
}

result< reflected_amount > reflection_ledger::reflected_of( const address& account )
{
  auto record = _journal.account( account );
  if( !record )
    return std::unexpected( record.error() );

  if( const auto* holder = std::get_if< included >( &*record ) )
    return holder->reflected;

  return reflected_amount( 0 );
}

result< bool > reflection_ledger::is_excluded( const address& account )
{
  auto record = _journal.account( account );
  if( !record )
    return std::unexpected( record.error() );

  return std::holds_alternative< excluded >( *record );
}

std::error_code reflection_ledger::debit( const address& account, amount value )
{
  if( !value )
    return ledger_errc::ok;

  auto state = _journal.global();
  if( !state )
    return state.error();

  auto record = _journal.account( account );
  if( !record )
    return record.error();

  if( std::numeric_limits< amount >::max() - _journal.in_flight() < value )
    return ledger_errc::arithmetic_error;

  if( auto* holder = std::get_if< excluded >( &*record ) )
  {
    if( holder->balance < value )
      return ledger_errc::insufficient_balance;

    holder->balance       -= value;
    state->total_excluded -= value;
  }
  else
  {
    auto& reflected = std::get< included >( *record ).reflected;

    if( !reflected )
      return ledger_errc::insufficient_balance;

    auto delta = to_reflected( *state, value, true );
    if( !delta )
      return delta.error();

    // Holding at least ceil(value * rate) reflected units is equivalent to
    // a derived balance of at least value.
    if( reflected < *delta )
      return ledger_errc::insufficient_balance;

    if( state->total_reflected < *delta )
      return ledger_errc::arithmetic_error;

    reflected              -= *delta;
    state->total_reflected -= *delta;
  }

  _journal.set_account( account, *record );
  _journal.set_global( *state );
  _journal.set_in_flight( _journal.in_flight() + value );

  return ledger_errc::ok;
}

std::error_code reflection_ledger::credit( const address& account, amount value )
{
  if( !value )
    return ledger_errc::ok;

  if( _journal.in_flight() < value )
    return ledger_errc::arithmetic_error;

  auto state = _journal.global();
  if( !state )
    return state.error();

  auto record = _journal.account( account );
  if( !record )
    return record.error();

  if( auto* holder = std::get_if< excluded >( &*record ) )
  {
    if( std::numeric_limits< amount >::max() - holder->balance < value )
      return ledger_errc::arithmetic_error;

    holder->balance       += value;
    state->total_excluded += value;
  }
  else
  {
    auto& reflected = std::get< included >( *record ).reflected;

    auto delta = to_reflected( *state, value, false );
    if( !delta )
      return delta.error();

    if( std::numeric_limits< reflected_amount >::max() - state->total_reflected < *delta )
      return ledger_errc::arithmetic_error;

    reflected              += *delta;
    state->total_reflected += *delta;
  }

  _journal.set_account( account, *record );
  _journal.set_global( *state );
  _journal.set_in_flight( _journal.in_flight() - value );

  return ledger_errc::ok;
}

std::error_code reflection_ledger::burn( amount value )
{
  if( !value )
    return ledger_errc::ok;

  if( _journal.in_flight() < value )
    return ledger_errc::arithmetic_error;

  auto state = _journal.global();
  if( !state )
    return state.error();

  if( state->total_supply < value )
    return ledger_errc::arithmetic_error;

  state->total_supply -= value;

  _journal.set_global( *state );
  _journal.set_in_flight( _journal.in_flight() - value );

  return ledger_errc::ok;
}

std::error_code reflection_ledger::reflect( amount value )
{
  if( !value )
    return ledger_errc::ok;

  if( _journal.in_flight() < value )
    return ledger_errc::arithmetic_error;

  auto state = _journal.global();
  if( !state )
    return state.error();

  // Nobody would receive the reflection
  if( !state->total_reflected )
    return ledger_errc::arithmetic_error;

  _journal.set_in_flight( _journal.in_flight() - value );

  return ledger_errc::ok;
}

std::error_code reflection_ledger::set_excluded( const address& account, bool exclude )
{
  auto state = _journal.global();
  if( !state )
    return state.error();

  auto record = _journal.account( account );
  if( !record )
    return record.error();

  if( std::holds_alternative< excluded >( *record ) == exclude )
    return ledger_errc::ok;

  if( exclude )
  {
    const auto& reflected = std::get< included >( *record ).reflected;

    auto balance = to_true( *state, reflected );
    if( !balance )
      return balance.error();

    if( std::numeric_limits< amount >::max() - state->total_excluded < *balance
        || state->total_reflected < reflected )
      return ledger_errc::arithmetic_error;

    state->total_reflected -= reflected;
    state->total_excluded  += *balance;

    _journal.set_account( account, excluded{ .balance = *balance } );
    _journal.set_global( *state );

    return ledger_errc::ok;
  }

  // Including is an untaxed move of the stored balance back into the
  // circulating supply at the current rate.
  auto balance = std::get< excluded >( *record ).balance;

  state->total_excluded -= balance;

  _journal.set_account( account, included{} );
  _journal.set_global( *state );
  _journal.set_in_flight( _journal.in_flight() + balance );

  return credit( account, balance );
}

std::error_code reflection_ledger::mint( const address& account, amount value )
{
  if( !value )
    return ledger_errc::ok;

  auto state = _journal.global();
  if( !state )
    return state.error();

  if( std::numeric_limits< amount >::max() - state->total_supply < value )
    return ledger_errc::arithmetic_error;

  state->total_supply += value;

  _journal.set_global( *state );
  _journal.set_in_flight( _journal.in_flight() + value );

  return credit( account, value );
}

} // namespace reflecta::ledger

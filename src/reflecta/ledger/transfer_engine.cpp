#include <reflecta/ledger/transfer_engine.hpp>

namespace reflecta::ledger {

transfer_engine::transfer_engine( journal& staged,
                                  const tax_rates& rates,
                                  const anti_whale_config& limits,
                                  treasury_account& treasury ) noexcept:
    _journal( staged ),
    _ledger( staged ),
    _exemptions( staged, _ledger ),
    _policy( rates ),
    _guard( limits ),
    _treasury( treasury )
{}

reflection_ledger& transfer_engine::ledger() noexcept
{
  return _ledger;
}

exemption_registry& transfer_engine::exemptions() noexcept
{
  return _exemptions;
}

result< transfer_receipt > transfer_engine::transfer( const address& from, const address& to, amount value )
{
  return execute( std::nullopt, from, to, value );
}

result< transfer_receipt >
transfer_engine::transfer_from( const address& spender, const address& owner, const address& to, amount value )
{
  return execute( spender, owner, to, value );
}

result< transfer_receipt > transfer_engine::send( const address& from,
                                                  const address& to,
                                                  amount value,
                                                  std::span< const std::byte > payload,
                                                  recipient_notifier& notifier )
{
  auto receipt = execute( std::nullopt, from, to, value );
  if( !receipt || !value )
    return receipt;

  if( auto error = notifier.notify( to, from, receipt->split.net, payload ); error )
    return std::unexpected( error );

  return receipt;
}

result< transfer_receipt > transfer_engine::send_from( const address& spender,
                                                       const address& owner,
                                                       const address& to,
                                                       amount value,
                                                       std::span< const std::byte > payload,
                                                       recipient_notifier& notifier )
{
  auto receipt = execute( spender, owner, to, value );
  if( !receipt || !value )
    return receipt;

  if( auto error = notifier.notify( to, spender, receipt->split.net, payload ); error )
    return std::unexpected( error );

  return receipt;
}

result< transfer_receipt > transfer_engine::execute( const std::optional< address >& spender,
                                                     const address& from,
                                                     const address& to,
                                                     amount value )
{
  if( !value )
    return transfer_receipt{ .from = from, .to = to };

  auto receipt = apply( spender, from, to, value );
  if( !receipt )
    _journal.discard();

  return receipt;
}

result< transfer_receipt > transfer_engine::apply( const std::optional< address >& spender,
                                                   const address& from,
                                                   const address& to,
                                                   amount value )
{
  if( spender )
  {
    auto allowance = _journal.allowance( from, *spender );
    if( !allowance )
      return std::unexpected( allowance.error() );

    if( *allowance < value )
      return std::unexpected( ledger_errc::insufficient_allowance );

    _journal.set_allowance( from, *spender, *allowance - value );
  }

  auto balance = _ledger.balance_of( from );
  if( !balance )
    return std::unexpected( balance.error() );

  if( *balance < value )
    return std::unexpected( ledger_errc::insufficient_balance );

  auto sender = _exemptions.get( from );
  if( !sender )
    return std::unexpected( sender.error() );

  auto recipient = _exemptions.get( to );
  if( !recipient )
    return std::unexpected( recipient.error() );

  auto split = _policy.compute_split( value, sender->tax_exempt, recipient->tax_exempt );
  if( !split )
    return std::unexpected( split.error() );

  auto supply = _ledger.total_supply();
  if( !supply )
    return std::unexpected( supply.error() );

  auto recipient_balance = _ledger.balance_of( to );
  if( !recipient_balance )
    return std::unexpected( recipient_balance.error() );

  if( auto error = _guard.check( { .gross             = value,
                                   .net               = split->net,
                                   .recipient_balance = *recipient_balance,
                                   .supply            = *supply,
                                   .exempt            = sender->tax_exempt || recipient->tax_exempt } );
      error )
    return std::unexpected( error );

  if( auto error = _ledger.debit( from, value ); error )
    return std::unexpected( error );

  if( auto error = _ledger.credit( to, split->net ); error )
    return std::unexpected( error );

  if( auto error = _ledger.burn( split->burn ); error )
    return std::unexpected( error );

  if( split->reflect )
  {
    auto state = _ledger.state();
    if( !state )
      return std::unexpected( state.error() );

    // With no included holder left to receive it the reflection goes to the treasury
    if( !state->total_reflected )
    {
      split->treasury += split->reflect;
      split->reflect   = 0;
    }
    else if( auto error = _ledger.reflect( split->reflect ); error )
      return std::unexpected( error );
  }

  if( auto error = _ledger.credit( _treasury.id(), split->treasury ); error )
    return std::unexpected( error );

  if( split->treasury )
    if( auto error = _treasury.deposit( split->treasury ); error )
      return std::unexpected( ledger_errc::treasury_forward_failed );

  if( auto error = _journal.commit(); error )
    return std::unexpected( error );

  return transfer_receipt{ .from = from, .to = to, .gross = value, .split = *split };
}

std::error_code transfer_engine::mint( const address& to, amount value )
{
  if( !value )
    return ledger_errc::ok;

  auto status = [ & ]() -> std::error_code
  {
    auto recipient = _exemptions.get( to );
    if( !recipient )
      return recipient.error();

    auto balance = _ledger.balance_of( to );
    if( !balance )
      return balance.error();

    auto supply = _ledger.total_supply();
    if( !supply )
      return supply.error();

    if( auto error = _guard.check_mint( value, *balance, *supply, recipient->tax_exempt ); error )
      return error;

    if( auto error = _ledger.mint( to, value ); error )
      return error;

    return _journal.commit();
  }();

  if( status )
    _journal.discard();

  return status;
}

std::error_code transfer_engine::burn( const address& from, amount value )
{
  if( !value )
    return ledger_errc::ok;

  auto status = [ & ]() -> std::error_code
  {
    if( auto error = _ledger.debit( from, value ); error )
      return error;

    if( auto error = _ledger.burn( value ); error )
      return error;

    return _journal.commit();
  }();

  if( status )
    _journal.discard();

  return status;
}

} // namespace reflecta::ledger

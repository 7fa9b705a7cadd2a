#include <reflecta/ledger/journal.hpp>

#include <algorithm>

namespace reflecta::ledger {

journal::journal( store& backing ) noexcept:
    _store( backing )
{}

result< global_state > journal::global()
{
  if( _global )
    return _global->value;

  auto state = _store.load_global();
  if( !state )
    return std::unexpected( state.error() );

  _global = staged< global_state >{ .value = *state };
  return *state;
}

void journal::set_global( const global_state& state )
{
  _global = staged< global_state >{ .value = state, .dirty = true };
}

result< account_record > journal::account( const address& account )
{
  if( auto itr = _accounts.find( account ); itr != _accounts.end() )
    return itr->second.value;

  auto record = _store.load_account( account );
  if( !record )
    return std::unexpected( record.error() );

  _accounts.emplace( account, staged< account_record >{ .value = *record } );
  return *record;
}

void journal::set_account( const address& account, const account_record& record )
{
  _accounts.insert_or_assign( account, staged< account_record >{ .value = record, .dirty = true } );
}

result< exemption > journal::exemption_of( const address& account )
{
  if( auto itr = _exemptions.find( account ); itr != _exemptions.end() )
    return itr->second.value;

  auto entry = _store.load_exemption( account );
  if( !entry )
    return std::unexpected( entry.error() );

  _exemptions.emplace( account, staged< exemption >{ .value = *entry } );
  return *entry;
}

void journal::set_exemption( const address& account, const exemption& entry )
{
  _exemptions.insert_or_assign( account, staged< exemption >{ .value = entry, .dirty = true } );
}

result< amount > journal::allowance( const address& owner, const address& spender )
{
  auto key = std::make_pair( owner, spender );
  if( auto itr = _allowances.find( key ); itr != _allowances.end() )
    return itr->second.value;

  auto value = _store.load_allowance( owner, spender );
  if( !value )
    return std::unexpected( value.error() );

  _allowances.emplace( key, staged< amount >{ .value = *value } );
  return *value;
}

void journal::set_allowance( const address& owner, const address& spender, amount allowance )
{
  _allowances.insert_or_assign( std::make_pair( owner, spender ),
                                staged< amount >{ .value = allowance, .dirty = true } );
}

amount journal::in_flight() const noexcept
{
  return _in_flight;
}

void journal::set_in_flight( amount value ) noexcept
{
  _in_flight = value;
}

bool journal::dirty() const noexcept
{
  if( _global && _global->dirty )
    return true;

  auto is_dirty = []( const auto& entry )
  {
    return entry.second.dirty;
  };

  return std::ranges::any_of( _accounts, is_dirty ) || std::ranges::any_of( _exemptions, is_dirty )
         || std::ranges::any_of( _allowances, is_dirty );
}

std::error_code journal::commit()
{
  if( _in_flight )
    return ledger_errc::arithmetic_error;

  if( _global && _global->dirty )
    if( auto error = _store.save_global( _global->value ); error )
      return error;

  for( const auto& [ account, entry ]: _accounts )
    if( entry.dirty )
      if( auto error = _store.save_account( account, entry.value ); error )
        return error;

  for( const auto& [ account, entry ]: _exemptions )
    if( entry.dirty )
      if( auto error = _store.save_exemption( account, entry.value ); error )
        return error;

  for( const auto& [ key, entry ]: _allowances )
    if( entry.dirty )
      if( auto error = _store.save_allowance( key.first, key.second, entry.value ); error )
        return error;

  discard();
  return ledger_errc::ok;
}

void journal::discard() noexcept
{
  _global.reset();
  _accounts.clear();
  _exemptions.clear();
  _allowances.clear();
  _in_flight = 0;
}

} // namespace reflecta::ledger

#include <reflecta/ledger/memory_store.hpp>

namespace reflecta::ledger {

result< global_state > memory_store::load_global()
{
  return _global;
}

std::error_code memory_store::save_global( const global_state& state )
{
  _global = state;
  return ledger_errc::ok;
}

result< account_record > memory_store::load_account( const address& account )
{
  if( auto itr = _accounts.find( account ); itr != _accounts.end() )
    return itr->second;

  return included{};
}

std::error_code memory_store::save_account( const address& account, const account_record& record )
{
  _accounts.insert_or_assign( account, record );
  return ledger_errc::ok;
}

result< exemption > memory_store::load_exemption( const address& account )
{
  if( auto itr = _exemptions.find( account ); itr != _exemptions.end() )
    return itr->second;

  return exemption{};
}

std::error_code memory_store::save_exemption( const address& account, const exemption& entry )
{
  _exemptions.insert_or_assign( account, entry );
  return ledger_errc::ok;
}

result< amount > memory_store::load_allowance( const address& owner, const address& spender )
{
  if( auto itr = _allowances.find( { owner, spender } ); itr != _allowances.end() )
    return itr->second;

  return 0;
}

std::error_code memory_store::save_allowance( const address& owner, const address& spender, amount allowance )
{
  _allowances.insert_or_assign( { owner, spender }, allowance );
  return ledger_errc::ok;
}

std::size_t memory_store::accounts() const noexcept
{
  return _accounts.size();
}

} // namespace reflecta::ledger

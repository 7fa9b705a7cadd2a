#pragma once

#include <span>
#include <system_error>

#include <reflecta/ledger/types.hpp>

namespace reflecta::ledger {

/**
 * The capability the transfer engine holds over the treasury. The treasury
 * share is credited to id() on the ledger and then announced through
 * deposit().
 */
struct treasury_account
{
  treasury_account()                          = default;
  treasury_account( const treasury_account& ) = delete;
  treasury_account( treasury_account&& )      = delete;
  virtual ~treasury_account()                 = default;

  treasury_account& operator=( const treasury_account& ) = delete;
  treasury_account& operator=( treasury_account&& )      = delete;

  virtual const address& id() const                = 0;
  virtual std::error_code deposit( amount value ) = 0;
};

/**
 * Delivers the post-tax amount of a send to the receiving program.
 */
struct recipient_notifier
{
  recipient_notifier()                            = default;
  recipient_notifier( const recipient_notifier& ) = delete;
  recipient_notifier( recipient_notifier&& )      = delete;
  virtual ~recipient_notifier()                   = default;

  recipient_notifier& operator=( const recipient_notifier& ) = delete;
  recipient_notifier& operator=( recipient_notifier&& )      = delete;

  virtual std::error_code
  notify( const address& recipient, const address& sender, amount net, std::span< const std::byte > payload ) = 0;
};

} // namespace reflecta::ledger
